// nneval/runtime/backend/cuda/src/handles.cc
//
// Creation and destruction of the stream-bound cuBLAS and cuRAND handles.
//
// Author: NNEval Team
// Date: 2026-03-09
// Copyright: (c) 2026 NNEval Project. All rights reserved.
// SPDX-License-Identifier: MIT

#include "nneval/runtime/handles.h"

#include "macros.h"

namespace nneval::runtime {

BlasHandle::BlasHandle(const Stream &stream)
    : device_(stream.device()), stream_(stream.inner()) {
  stream.device().make_current();
  NNEVAL_CUBLAS_CHECK(cublasCreate(&handle_));
  cublasStatus_t status = cublasSetStream(handle_, stream.inner());
  if (status != CUBLAS_STATUS_SUCCESS) {
    cublasDestroy(handle_);
    NNEVAL_CUBLAS_CHECK(status);
  }
}

BlasHandle::~BlasHandle() {
  if (handle_) {
    cublasStatus_t status = cublasDestroy(handle_);
    if (status != CUBLAS_STATUS_SUCCESS) {
      fprintf(stderr, "cuBLAS Warning: cublasDestroy returned status %d\n",
              status);
    }
  }
}

RandomGenerator::RandomGenerator(const Stream &stream, uint64_t seed)
    : device_(stream.device()), stream_(stream.inner()) {
  stream.device().make_current();
  NNEVAL_CURAND_CHECK(
      curandCreateGenerator(&generator_, CURAND_RNG_PSEUDO_DEFAULT));
  curandStatus_t status =
      curandSetPseudoRandomGeneratorSeed(generator_, seed);
  if (status == CURAND_STATUS_SUCCESS) {
    status = curandSetStream(generator_, stream.inner());
  }
  if (status != CURAND_STATUS_SUCCESS) {
    curandDestroyGenerator(generator_);
    NNEVAL_CURAND_CHECK(status);
  }
}

RandomGenerator::~RandomGenerator() {
  if (generator_) {
    curandStatus_t status = curandDestroyGenerator(generator_);
    if (status != CURAND_STATUS_SUCCESS) {
      fprintf(stderr,
              "cuRAND Warning: curandDestroyGenerator returned status %d\n",
              status);
    }
  }
}

} // namespace nneval::runtime
