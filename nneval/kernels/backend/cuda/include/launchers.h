// nneval/kernels/backend/cuda/include/launchers.h
//
// Declares the raw CUDA kernel launchers. These functions only compute the
// launch geometry, enqueue the kernel and return the result of
// `cudaGetLastError`. Argument validation and status mapping happen in the
// public entry points (kernels.cc).
//
// Author: NNEval Team
// Date: 2026-03-05
// Copyright: (c) 2026 NNEval Project. All rights reserved.
// SPDX-License-Identifier: MIT

#pragma once

#include <cstddef>
#include <cstdint>

#include <cuda_runtime.h>

#include "nneval/runtime/shape.h"

namespace nneval::kernels::detail {

/**
 * @brief Stride descriptors of one strided copy, passed to the kernel by
 * value so that the caller's host arrays can be released immediately.
 */
struct StridedCopyArgs {
  int rank = 0;
  int size = 0;
  int input_strides[NNEVAL_MAX_RANK] = {0};
  int output_strides[NNEVAL_MAX_RANK] = {0};
  int dense_strides[NNEVAL_MAX_RANK] = {0};
};

/**
 * @brief Launches the generic strided copy kernel.
 * @tparam T Element type (float, int32_t or uint8_t).
 * @param stream The stream to enqueue on.
 * @param args Rank, element count and stride descriptors.
 * @param in Input pointer at coordinate zero.
 * @param out Output pointer at coordinate zero.
 */
template <typename T>
cudaError_t launch_strided_copy_kernel(cudaStream_t stream,
                                       const StridedCopyArgs &args,
                                       const T *in, T *out);

/**
 * @brief Launches the flat gather kernel (`out[i] = in[indices[i]]`).
 */
cudaError_t launch_gather_kernel(cudaStream_t stream, int count,
                                 const int *indices, const float *in,
                                 float *out);

/**
 * @brief Launches the tiled axis-1 gather kernel.
 * @tparam I Index element type (float or int).
 */
template <typename I>
cudaError_t launch_gather_2d_axis1_kernel(cudaStream_t stream, int batch_size,
                                          int batch_stride, int elem_stride,
                                          int index_count, const float *in,
                                          const I *indices, float *out);

/**
 * @brief Launches the float to byte quantization kernel.
 * @param scale `255 / (high - low)`, precomputed on the host.
 * @param half_to_even Selects `rintf` instead of `roundf`.
 */
cudaError_t launch_quantize_kernel(cudaStream_t stream, int length,
                                   const float *in, uint8_t *out, float low,
                                   float high, float scale, bool half_to_even);

/**
 * @brief Launches the byte to float dequantization kernel.
 * @param step `(high - low) / 255`, precomputed on the host.
 */
cudaError_t launch_unquantize_kernel(cudaStream_t stream, int length,
                                     const uint8_t *in, float *out, float low,
                                     float step);

/**
 * @brief Launches a kernel to scale and shift data in-place
 * (`data = data * scale + bias`).
 */
cudaError_t launch_scale_kernel(cudaStream_t stream, float *data, float scale,
                                float bias, size_t n);

} // namespace nneval::kernels::detail
