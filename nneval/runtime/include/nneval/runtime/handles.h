// nneval/runtime/handles.h
//
// RAII wrappers for the external cuBLAS and cuRAND library handles. Each
// handle is bound to one stream so that library calls are ordered with the
// NNEval kernels issued on the same stream.
//
// Author: NNEval Team
// Date: 2026-03-09
// Copyright: (c) 2026 NNEval Project. All rights reserved.
// SPDX-License-Identifier: MIT

#pragma once

#include <cstdint>

#include <cublas_v2.h>
#include <curand.h>

#include "nneval/runtime/stream.h"

namespace nneval::runtime {

/// Seed used by `RandomGenerator` unless another one is given.
constexpr uint64_t kDefaultRandomSeed = 1234ULL;

/**
 * @brief Owns a cuBLAS handle whose work is issued on a fixed stream.
 *
 * The handle is not thread-safe. Use one handle per stream. It keeps the
 * native stream, so moving the `Stream` object is fine, but the stream must
 * not be destroyed while the handle is alive.
 */
class BlasHandle {
public:
  explicit BlasHandle(const Stream &stream);
  ~BlasHandle();

  BlasHandle(const BlasHandle &) = delete;
  BlasHandle &operator=(const BlasHandle &) = delete;

  cublasHandle_t inner() const { return handle_; }
  const Device &device() const { return device_; }
  cudaStream_t stream() const { return stream_; }

private:
  cublasHandle_t handle_ = nullptr;
  Device device_;
  cudaStream_t stream_ = nullptr;
};

/**
 * @brief Owns a pseudo-random cuRAND generator bound to a fixed stream.
 *
 * A fixed seed makes generated test inputs reproducible. As with
 * `BlasHandle`, the stream must outlive the generator.
 */
class RandomGenerator {
public:
  explicit RandomGenerator(const Stream &stream,
                           uint64_t seed = kDefaultRandomSeed);
  ~RandomGenerator();

  RandomGenerator(const RandomGenerator &) = delete;
  RandomGenerator &operator=(const RandomGenerator &) = delete;

  curandGenerator_t inner() const { return generator_; }
  const Device &device() const { return device_; }
  cudaStream_t stream() const { return stream_; }

private:
  curandGenerator_t generator_ = nullptr;
  Device device_;
  cudaStream_t stream_ = nullptr;
};

} // namespace nneval::runtime
