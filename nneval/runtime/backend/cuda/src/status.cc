// nneval/runtime/backend/cuda/src/status.cc
//
// Implements `Status`, `Error` and the translation of CUDA, cuBLAS and cuRAND
// return codes into the closed NNEval error taxonomy.
//
// Author: NNEval Team
// Date: 2026-03-02
// Copyright: (c) 2026 NNEval Project. All rights reserved.
// SPDX-License-Identifier: MIT

#include "nneval/runtime/status.h"

#include <string>
#include <utility>

#include "macros.h"

namespace nneval::runtime {

const char *error_code_name(ErrorCode code) {
  switch (code) {
  case ErrorCode::kOk:
    return "Ok";
  case ErrorCode::kDeviceError:
    return "DeviceError";
  case ErrorCode::kOutOfMemory:
    return "OutOfMemory";
  case ErrorCode::kSizeMismatch:
    return "SizeMismatch";
  case ErrorCode::kInvalidArgument:
    return "InvalidArgument";
  case ErrorCode::kInvalidEventOrder:
    return "InvalidEventOrder";
  case ErrorCode::kLaunchError:
    return "LaunchError";
  }
  return "Unknown";
}

//===----------------------------------------------------------------------===//
// Status
//===----------------------------------------------------------------------===//

Status::Status(ErrorCode code, std::string message, int native_code)
    : code_(code), native_code_(native_code), message_(std::move(message)) {}

std::string Status::to_string() const {
  if (ok()) {
    return "Ok";
  }
  std::string s = error_code_name(code_);
  if (!message_.empty()) {
    s += ": " + message_;
  }
  if (native_code_ != 0) {
    s += " (native code " + std::to_string(native_code_) + ")";
  }
  return s;
}

void Status::throw_if_error() const {
  if (!ok()) {
    throw Error(*this);
  }
}

//===----------------------------------------------------------------------===//
// Error
//===----------------------------------------------------------------------===//

Error::Error(const Status &status)
    : std::runtime_error(status.to_string()), status_(status) {}

Error::Error(ErrorCode code, const std::string &message, int native_code)
    : Error(Status(code, message, native_code)) {}

//===----------------------------------------------------------------------===//
// Native code translation
//===----------------------------------------------------------------------===//

namespace detail {

Status status_from_cuda(cudaError_t err, const char *context) {
  if (err == cudaSuccess) {
    return Status::Ok();
  }

  ErrorCode code = ErrorCode::kLaunchError;
  switch (err) {
  case cudaErrorMemoryAllocation:
    code = ErrorCode::kOutOfMemory;
    break;
  case cudaErrorInvalidDevice:
  case cudaErrorNoDevice:
  case cudaErrorInsufficientDriver:
  case cudaErrorDevicesUnavailable:
  case cudaErrorInitializationError:
  case cudaErrorSystemDriverMismatch:
  case cudaErrorCompatNotSupportedOnDevice:
  case cudaErrorStubLibrary:
    code = ErrorCode::kDeviceError;
    break;
  default:
    break;
  }

  std::string message = std::string(context) + " failed with " +
                        cudaGetErrorName(err) + " (" +
                        cudaGetErrorString(err) + ")";
  return Status(code, std::move(message), static_cast<int>(err));
}

Status status_from_cublas(cublasStatus_t status, const char *context) {
  if (status == CUBLAS_STATUS_SUCCESS) {
    return Status::Ok();
  }
  return Status(ErrorCode::kLaunchError,
                std::string(context) + " failed with cuBLAS status " +
                    std::to_string(static_cast<int>(status)),
                static_cast<int>(status));
}

Status status_from_curand(curandStatus_t status, const char *context) {
  if (status == CURAND_STATUS_SUCCESS) {
    return Status::Ok();
  }
  return Status(ErrorCode::kLaunchError,
                std::string(context) + " failed with cuRAND status " +
                    std::to_string(static_cast<int>(status)),
                static_cast<int>(status));
}

} // namespace detail
} // namespace nneval::runtime
