// nneval/runtime/status.h
//
// Defines the closed result type shared by every layer of NNEval. Kernel
// entry points return a `Status` by value; the host-side runtime and the view
// operators throw an `Error` that carries the same information.
//
// Author: NNEval Team
// Date: 2026-03-02
// Copyright: (c) 2026 NNEval Project. All rights reserved.
// SPDX-License-Identifier: MIT

#pragma once

#include <stdexcept>
#include <string>

namespace nneval {

/**
 * @brief Device runtime: devices, buffers, streams, events and views.
 */
namespace runtime {

/**
 * @brief Enumerates every failure kind NNEval can report.
 */
enum class ErrorCode {
  kOk = 0,           ///< No error.
  kDeviceError,      ///< Bad device index or device unavailable.
  kOutOfMemory,      ///< The device could not satisfy an allocation.
  kSizeMismatch,     ///< Host and device byte lengths differ on a transfer.
  kInvalidArgument,  ///< Rank too large, negative size, malformed descriptor.
  kInvalidEventOrder,///< Elapsed-time query on events out of stream order.
  kLaunchError,      ///< Failure reported by the compute API, code preserved.
};

/**
 * @brief Returns a stable, human-readable name for an `ErrorCode`.
 */
const char *error_code_name(ErrorCode code);

/**
 * @brief Result of an operation: success or a specific failure kind.
 *
 * A failing status keeps the native code of the underlying API (a
 * `cudaError_t`, `cublasStatus_t` or `curandStatus_t`) as diagnostic payload.
 * A default-constructed status is `Ok`.
 */
class Status {
public:
  Status() = default;
  Status(ErrorCode code, std::string message, int native_code = 0);

  static Status Ok() { return Status(); }

  bool ok() const { return code_ == ErrorCode::kOk; }
  ErrorCode code() const { return code_; }
  int native_code() const { return native_code_; }
  const std::string &message() const { return message_; }

  /**
   * @brief Formats the status as `Name: message (native code N)`.
   */
  std::string to_string() const;

  /**
   * @brief Throws an `Error` carrying this status unless it is `Ok`.
   */
  void throw_if_error() const;

private:
  ErrorCode code_ = ErrorCode::kOk;
  int native_code_ = 0;
  std::string message_;
};

/**
 * @brief Exception thrown by the runtime and the view operators.
 */
class Error : public std::runtime_error {
public:
  explicit Error(const Status &status);
  Error(ErrorCode code, const std::string &message, int native_code = 0);

  ErrorCode code() const { return status_.code(); }
  int native_code() const { return status_.native_code(); }
  const Status &status() const { return status_; }

private:
  Status status_;
};

} // namespace runtime
} // namespace nneval
