// nneval/kernels/kernels.h
//
// Declares the kernel entry points of NNEval. Every entry point takes the
// stream first, validates its arguments on the host, derives the launch
// geometry from the problem size, enqueues the kernel and returns a `Status`.
// Launches are asynchronous: `Ok` means the work was enqueued.
//
// Shared contract:
//  - kernels only read inputs and write outputs within the declared extents;
//  - a zero-sized problem enqueues nothing and returns `Ok`, and its pointers
//    may be null;
//  - stride arrays are host memory and may be released as soon as the call
//    returns;
//  - faults inside a kernel (for example an out-of-range index) are reported
//    by a later status-checking call, such as the next launch or a stream
//    synchronization.
//
// Author: NNEval Team
// Date: 2026-03-05
// Copyright: (c) 2026 NNEval Project. All rights reserved.
// SPDX-License-Identifier: MIT

#pragma once

#include <cstdint>

#include <cuda_runtime_api.h>

#include "nneval/runtime/shape.h"
#include "nneval/runtime/status.h"

namespace nneval::kernels {

using runtime::Status;

//===----------------------------------------------------------------------===//
// Quantization Parameters
//===----------------------------------------------------------------------===//

/**
 * @brief Rounding rule applied when a scaled value is turned into a byte.
 */
enum class Rounding {
  kHalfAwayFromZero, ///< `roundf`: 0.5 rounds up to 1.
  kHalfToEven,       ///< `rintf`: 0.5 rounds to 0, 1.5 rounds to 2.
};

/**
 * @brief Canonical range and rounding rule of the 8-bit codec.
 *
 * `quantize` clamps each value to `[low, high]` and maps it linearly onto
 * `0..255`; `unquantize` maps a byte back onto the same range. NaN clamps to
 * `low`.
 */
struct QuantizeParams {
  float low = 0.0f;
  float high = 1.0f;
  Rounding rounding = Rounding::kHalfAwayFromZero;
};

/// The codec used unless the caller asks otherwise: `[0, 1]`, round half up.
constexpr QuantizeParams kDefaultQuantizeParams{};

//===----------------------------------------------------------------------===//
// Strided Copy
//===----------------------------------------------------------------------===//

/**
 * @brief Copies `size` elements between two arbitrary strided layouts.
 *
 * Linear index `k` is decoded into a coordinate by successive division by
 * `dense_strides`; the element at `sum(c[i] * input_strides[i])` is copied to
 * `sum(c[i] * output_strides[i])`. All strides are in elements. A zero input
 * stride broadcasts a read; a zero output stride makes several threads write
 * the same element, which leaves the result undefined.
 *
 * @param stream The stream to enqueue on.
 * @param rank Number of axes, `0 <= rank <= kMaxRank`. Rank 0 copies a single
 *             element and requires `size <= 1`.
 * @param size Number of elements to copy.
 * @param input_strides Host array of `rank` input strides.
 * @param output_strides Host array of `rank` output strides.
 * @param dense_strides Host array of `rank` positive row-major strides.
 * @param input Device pointer to the element at coordinate zero.
 * @param output Device pointer to the element at coordinate zero.
 */
Status strided_copy_float(cudaStream_t stream, int rank, int size,
                          const int *input_strides, const int *output_strides,
                          const int *dense_strides, const float *input,
                          float *output);

/// 32-bit integer variant of `strided_copy_float`.
Status strided_copy_int(cudaStream_t stream, int rank, int size,
                        const int *input_strides, const int *output_strides,
                        const int *dense_strides, const int32_t *input,
                        int32_t *output);

/// Byte variant of `strided_copy_float`, used for quantized data.
Status strided_copy_byte(cudaStream_t stream, int rank, int size,
                         const int *input_strides, const int *output_strides,
                         const int *dense_strides, const uint8_t *input,
                         uint8_t *output);

//===----------------------------------------------------------------------===//
// Gather
//===----------------------------------------------------------------------===//

/**
 * @brief Flat gather: `output[i] = input[indices[i]]` for `i < count`.
 *
 * Indices are not clamped; each must be a valid offset into `input`.
 */
Status gather_float(cudaStream_t stream, int count, const int *indices,
                    const float *input, float *output);

/**
 * @brief Gathers along axis 1 of a `(batch_size, input_size)` input.
 *
 * Produces a dense `(batch_size, index_count)` output with
 * `output[n * index_count + q] =
 *     input[n * input_batch_stride + indices[q] * input_elem_stride]`.
 * The same indices are used for every batch row. They are stored as floats
 * and must be exact integers in `[0, input_size)`.
 */
Status gather_2d_axis1_float_float(cudaStream_t stream, int batch_size,
                                   int input_size, int input_batch_stride,
                                   int input_elem_stride, int index_count,
                                   const float *input, const float *indices,
                                   float *output);

/// Integer-index variant of `gather_2d_axis1_float_float`.
Status gather_2d_axis1_float_int(cudaStream_t stream, int batch_size,
                                 int input_size, int input_batch_stride,
                                 int input_elem_stride, int index_count,
                                 const float *input, const int *indices,
                                 float *output);

//===----------------------------------------------------------------------===//
// Quantization
//===----------------------------------------------------------------------===//

/**
 * @brief Lossy float to byte codec, see `QuantizeParams`.
 */
Status quantize(cudaStream_t stream, int length, const float *input,
                uint8_t *output,
                const QuantizeParams &params = kDefaultQuantizeParams);

/**
 * @brief Inverse mapping of `quantize`: byte back to a float in the range.
 */
Status unquantize(cudaStream_t stream, int length, const uint8_t *input,
                  float *output,
                  const QuantizeParams &params = kDefaultQuantizeParams);

} // namespace nneval::kernels
