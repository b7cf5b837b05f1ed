// nneval/runtime/backend/cuda/src/device.cc
//
// Implements device discovery, device memory allocation and the host/device
// transfer functions of `DeviceBuffer`. This file owns the lifecycle of every
// device allocation made through NNEval.
//
// Author: NNEval Team
// Date: 2026-03-02
// Copyright: (c) 2026 NNEval Project. All rights reserved.
// SPDX-License-Identifier: MIT

#include "nneval/runtime/device.h"

#include <string>
#include <utility>

#include <cuda_runtime.h>

#include "macros.h"
#include "nneval/runtime/status.h"
#include "nneval/runtime/stream.h"

namespace nneval::runtime {

//===----------------------------------------------------------------------===//
// Device
//===----------------------------------------------------------------------===//

int Device::count() {
  int n = 0;
  cudaError_t err = cudaGetDeviceCount(&n);
  if (err != cudaSuccess) {
    // No device, no driver, or only the stub driver library. Clear the error
    // so it does not leak into later status checks.
    cudaGetLastError();
    return 0;
  }
  return n;
}

Device Device::open(int index) {
  int available = count();
  if (index < 0 || index >= available) {
    throw Error(ErrorCode::kDeviceError,
                "device index " + std::to_string(index) +
                    " is not available (" + std::to_string(available) +
                    " device(s) visible)");
  }
  Device device(index);
  device.make_current();
  return device;
}

std::string Device::name() const {
  cudaDeviceProp props;
  NNEVAL_CUDA_CHECK(cudaGetDeviceProperties(&props, index_));
  return props.name;
}

void Device::make_current() const { NNEVAL_CUDA_CHECK(cudaSetDevice(index_)); }

void Device::synchronize() const {
  make_current();
  NNEVAL_CUDA_CHECK(cudaDeviceSynchronize());
}

DeviceBuffer Device::allocate(size_t byte_size) const {
  void *ptr = nullptr;
  if (byte_size > 0) {
    make_current();
    cudaError_t err = cudaMalloc(&ptr, byte_size);
    if (err != cudaSuccess) {
      // A failed cudaMalloc is not sticky, but clear it anyway so the next
      // launch does not report it.
      cudaGetLastError();
      Status status = detail::status_from_cuda(err, "cudaMalloc");
      throw Error(status.code(),
                  "allocation of " + std::to_string(byte_size) +
                      " bytes on device " + std::to_string(index_) +
                      " failed: " + status.message(),
                  status.native_code());
    }
  }
  return DeviceBuffer(*this, std::unique_ptr<void, CudaDeleter>(ptr),
                      byte_size);
}

//===----------------------------------------------------------------------===//
// CudaDeleter
//===----------------------------------------------------------------------===//

void CudaDeleter::operator()(void *ptr) const {
  if (ptr) {
    // This may run during shutdown after the context is gone, so report the
    // failure instead of throwing out of a destructor.
    NNEVAL_CUDA_WARN(cudaFree(ptr));
  }
}

//===----------------------------------------------------------------------===//
// DeviceBuffer Lifecycle
//===----------------------------------------------------------------------===//

DeviceBuffer::DeviceBuffer(Device device,
                           std::unique_ptr<void, CudaDeleter> data,
                           size_t byte_size)
    : device_(device), data_(std::move(data)), byte_size_(byte_size) {}

DeviceBuffer::DeviceBuffer(DeviceBuffer &&other) noexcept
    : device_(other.device_), data_(std::move(other.data_)),
      byte_size_(other.byte_size_) {
  other.byte_size_ = 0;
}

DeviceBuffer &DeviceBuffer::operator=(DeviceBuffer &&other) noexcept {
  if (this != &other) {
    device_ = other.device_;
    data_ = std::move(other.data_);
    byte_size_ = other.byte_size_;
    other.byte_size_ = 0;
  }
  return *this;
}

DeviceBuffer::~DeviceBuffer() = default;

//===----------------------------------------------------------------------===//
// Transfers
//===----------------------------------------------------------------------===//

void DeviceBuffer::check_size(size_t bytes, const char *op) const {
  if (bytes != byte_size_) {
    throw Error(ErrorCode::kSizeMismatch,
                std::string(op) + ": buffer holds " +
                    std::to_string(byte_size_) + " bytes but " +
                    std::to_string(bytes) + " bytes were given");
  }
}

void DeviceBuffer::check_stream(const Stream &stream, const char *op) const {
  if (stream.device() != device_) {
    throw Error(ErrorCode::kInvalidArgument,
                std::string(op) + ": stream is on device " +
                    std::to_string(stream.device().index()) +
                    " but buffer is on device " +
                    std::to_string(device_.index()));
  }
}

void DeviceBuffer::copy_from_host(const void *host, size_t bytes) {
  check_size(bytes, "copy_from_host");
  if (bytes == 0)
    return;
  device_.make_current();
  NNEVAL_CUDA_CHECK(
      cudaMemcpy(data_.get(), host, bytes, cudaMemcpyHostToDevice));
}

void DeviceBuffer::copy_to_host(void *host, size_t bytes) const {
  check_size(bytes, "copy_to_host");
  if (bytes == 0)
    return;
  device_.make_current();
  NNEVAL_CUDA_CHECK(
      cudaMemcpy(host, data_.get(), bytes, cudaMemcpyDeviceToHost));
}

void DeviceBuffer::copy_from_host_async(const Stream &stream, const void *host,
                                        size_t bytes) {
  check_size(bytes, "copy_from_host_async");
  check_stream(stream, "copy_from_host_async");
  if (bytes == 0)
    return;
  NNEVAL_CUDA_CHECK(cudaMemcpyAsync(data_.get(), host, bytes,
                                    cudaMemcpyHostToDevice, stream.inner()));
}

void DeviceBuffer::copy_to_host_async(const Stream &stream, void *host,
                                      size_t bytes) const {
  check_size(bytes, "copy_to_host_async");
  check_stream(stream, "copy_to_host_async");
  if (bytes == 0)
    return;
  NNEVAL_CUDA_CHECK(cudaMemcpyAsync(host, data_.get(), bytes,
                                    cudaMemcpyDeviceToHost, stream.inner()));
}

void DeviceBuffer::copy_from_device(const Stream &stream,
                                    const DeviceBuffer &other) {
  check_size(other.byte_size(), "copy_from_device");
  check_stream(stream, "copy_from_device");
  other.check_stream(stream, "copy_from_device");
  if (byte_size_ == 0)
    return;
  NNEVAL_CUDA_CHECK(cudaMemcpyAsync(data_.get(), other.data(), byte_size_,
                                    cudaMemcpyDeviceToDevice, stream.inner()));
}

} // namespace nneval::runtime
