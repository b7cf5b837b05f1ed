#pragma once

// Not part of the public headers. Included by the CUDA backend sources of the
// runtime and kernel libraries only.

#include <cstdio>
#include <cstdlib>
#include <cublas_v2.h>
#include <cuda_runtime.h>
#include <curand.h>

#include "nneval/runtime/status.h"

namespace nneval::runtime::detail {

/**
 * @brief Maps a `cudaError_t` onto the closed status type.
 *
 * Allocation failures become `kOutOfMemory`. Missing, invalid or unusable
 * devices and drivers (including the stub driver library) become
 * `kDeviceError`. Every other failure becomes `kLaunchError`. The native code
 * is preserved in all cases.
 */
Status status_from_cuda(cudaError_t err, const char *context);

/**
 * @brief Maps a cuBLAS status onto `kLaunchError` with the native code kept.
 */
Status status_from_cublas(cublasStatus_t status, const char *context);

/**
 * @brief Maps a cuRAND status onto `kLaunchError` with the native code kept.
 */
Status status_from_curand(curandStatus_t status, const char *context);

} // namespace nneval::runtime::detail

#define NNEVAL_CUDA_CHECK(call)                                                \
  do {                                                                         \
    cudaError_t err = call;                                                    \
    if (err != cudaSuccess) {                                                  \
      fprintf(stderr, "\nCUDA Error at %s:%d\n", __FILE__, __LINE__);          \
      fprintf(stderr, "Code: %d, Name: %s, Description: %s\n", err,            \
              cudaGetErrorName(err), cudaGetErrorString(err));                 \
      throw ::nneval::runtime::Error(                                          \
          ::nneval::runtime::detail::status_from_cuda(err, #call));            \
    }                                                                          \
  } while (0)

#define NNEVAL_CUBLAS_CHECK(call)                                              \
  do {                                                                         \
    cublasStatus_t status = call;                                              \
    if (status != CUBLAS_STATUS_SUCCESS) {                                     \
      fprintf(stderr, "\ncuBLAS Error at %s:%d - Status %d\n", __FILE__,       \
              __LINE__, status);                                               \
      throw ::nneval::runtime::Error(                                          \
          ::nneval::runtime::detail::status_from_cublas(status, #call));       \
    }                                                                          \
  } while (0)

#define NNEVAL_CURAND_CHECK(call)                                              \
  do {                                                                         \
    curandStatus_t status = call;                                              \
    if (status != CURAND_STATUS_SUCCESS) {                                     \
      fprintf(stderr, "cuRAND Error at %s:%d - Status %d\n", __FILE__,         \
              __LINE__, status);                                               \
      throw ::nneval::runtime::Error(                                          \
          ::nneval::runtime::detail::status_from_curand(status, #call));       \
    }                                                                          \
  } while (0)

// Used in destructors, which must not throw. Reports and carries on.
#define NNEVAL_CUDA_WARN(call)                                                 \
  do {                                                                         \
    cudaError_t err = call;                                                    \
    if (err != cudaSuccess) {                                                  \
      fprintf(stderr, "CUDA Warning at %s:%d - %s: %s\n", __FILE__, __LINE__,  \
              cudaGetErrorName(err), cudaGetErrorString(err));                 \
    }                                                                          \
  } while (0)
