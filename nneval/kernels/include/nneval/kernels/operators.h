// nneval/kernels/operators.h
//
// Declares the typed, view-based API consumed by the graph execution layer.
// These functions check views against each other (dtype, shape, device,
// density), narrow the layouts into the kernel entry points' descriptors and
// throw `runtime::Error` on any failure.
//
// Author: NNEval Team
// Date: 2026-03-06
// Copyright: (c) 2026 NNEval Project. All rights reserved.
// SPDX-License-Identifier: MIT

#pragma once

#include <string>
#include <vector>

#include "nneval/kernels/kernels.h"
#include "nneval/runtime/device.h"
#include "nneval/runtime/handles.h"
#include "nneval/runtime/stream.h"
#include "nneval/runtime/view.h"

namespace nneval::kernels::ops {

using runtime::BlasHandle;
using runtime::Device;
using runtime::DeviceBuffer;
using runtime::RandomGenerator;
using runtime::Stream;
using runtime::View;

// -------- Host <-> Device Data Transfer --------

/**
 * @brief Allocates a buffer on `device` and fills it from host data.
 * @tparam T Element type. Instantiated for float, int32_t and uint8_t.
 */
template <typename T>
DeviceBuffer upload(const Device &device, const std::vector<T> &data);

/**
 * @brief Copies a whole buffer back into a host vector.
 * @throws Error (kSizeMismatch) if the byte size is not a multiple of
 *         `sizeof(T)`.
 */
template <typename T> std::vector<T> download(const DeviceBuffer &buffer);

// -------- Layout --------

/**
 * @brief Copies `input` into `output` element by element, following both
 *        views' strides.
 *
 * Both views must have the same shape, dtype and device. `input` may
 * broadcast (zero strides); `output` must not alias itself through a zero
 * stride, or the result is undefined.
 */
void copy(const Stream &stream, const View &input, const View &output);

// -------- Indexing --------

/**
 * @brief Flat gather: `output[i] = input[indices[i]]`.
 * @param indices Dense 1-D Int32 view.
 * @param input Dense 1-D Float32 view.
 * @param output Dense 1-D Float32 view with as many elements as `indices`.
 */
void gather(const Stream &stream, const View &indices, const View &input,
            const View &output);

/**
 * @brief Gathers columns of a 2-D input: `output[n, q] = input[n, indices[q]]`.
 * @param input 2-D Float32 view with arbitrary strides.
 * @param indices Dense 1-D Float32 or Int32 view of exact integer indices.
 * @param output Dense Float32 view of shape `(input.dim(0), indices.numel())`.
 */
void gather_axis1(const Stream &stream, const View &input, const View &indices,
                  const View &output);

// -------- Quantization --------

/**
 * @brief Quantizes a dense Float32 view into a dense UInt8 view.
 */
void quantize(const Stream &stream, const View &input, const View &output,
              const QuantizeParams &params = kDefaultQuantizeParams);

/**
 * @brief Dequantizes a dense UInt8 view into a dense Float32 view.
 */
void unquantize(const Stream &stream, const View &input, const View &output,
                const QuantizeParams &params = kDefaultQuantizeParams);

// -------- External Libraries --------

/**
 * @brief Row-major matrix product `c = a @ b` through cuBLAS.
 *
 * All three views must be dense 2-D Float32 views on the handle's device.
 * The work is issued on the stream the handle is bound to.
 */
void matmul(const BlasHandle &blas, const View &a, const View &b,
            const View &c);

/**
 * @brief Fills a dense Float32 view with uniform values in `(from, to]`.
 *
 * Intended for building test inputs; the work is issued on the generator's
 * stream.
 */
void fill_uniform(const RandomGenerator &rng, const View &view, float from,
                  float to);

// -------- Debugging --------

/**
 * @brief Synchronizes `stream`, copies the view to the host and prints it.
 */
void print_view(const Stream &stream, const View &view,
                const std::string &name = "");

} // namespace nneval::kernels::ops
