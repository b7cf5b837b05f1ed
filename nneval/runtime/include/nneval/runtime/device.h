// nneval/runtime/device.h
//
// Defines the device handle and the owning device memory buffer. Buffers are
// plain byte ranges: element type, shape and strides are supplied per
// operation, usually through a `View`.
//
// Author: NNEval Team
// Date: 2026-03-02
// Copyright: (c) 2026 NNEval Project. All rights reserved.
// SPDX-License-Identifier: MIT

#pragma once

#include <cstddef>
#include <memory>
#include <string>
#include <vector>

namespace nneval::runtime {

class DeviceBuffer;
class Stream;

/**
 * @brief Identifies one GPU by its ordinal.
 *
 * A `Device` is a small copyable value. It must outlive every buffer, stream,
 * event and library handle created from it; since it owns nothing, this only
 * means the physical device must stay available.
 */
class Device {
public:
  /**
   * @brief Returns the number of visible CUDA devices.
   *
   * Returns 0 when no device or no usable driver is present instead of
   * throwing, so callers can check for GPU support.
   */
  static int count();

  /**
   * @brief Opens the device with the given ordinal.
   * @throws Error (kDeviceError) if `index` is not an available GPU.
   */
  static Device open(int index);

  int index() const { return index_; }

  /**
   * @brief Returns the marketing name reported by the driver.
   */
  std::string name() const;

  /**
   * @brief Makes this device current for the calling thread.
   */
  void make_current() const;

  /**
   * @brief Blocks until all work on every stream of this device has finished.
   */
  void synchronize() const;

  /**
   * @brief Allocates `byte_size` bytes of linear device memory.
   *
   * A zero-byte request is legal and returns an empty buffer holding a null
   * pointer; the driver is not called in that case.
   *
   * @throws Error (kOutOfMemory) if the device cannot satisfy the request.
   */
  DeviceBuffer allocate(size_t byte_size) const;

  bool operator==(const Device &other) const { return index_ == other.index_; }
  bool operator!=(const Device &other) const { return index_ != other.index_; }

private:
  explicit Device(int index) : index_(index) {}

  int index_ = 0;
};

/**
 * @brief Custom deleter that releases device memory with `cudaFree`.
 *
 * Failures are reported on stderr; a deleter must not throw.
 */
struct CudaDeleter {
  void operator()(void *ptr) const;
};

/**
 * @brief An exclusively owned region of device memory with a fixed byte size.
 *
 * The buffer is move-only. Its memory is released when the owner is dropped.
 * Kernel arguments borrow the raw pointer through `data()`; the buffer must
 * stay alive until every stream using it has been synchronized.
 */
class DeviceBuffer {
public:
  DeviceBuffer(DeviceBuffer &&other) noexcept;
  DeviceBuffer &operator=(DeviceBuffer &&other) noexcept;

  DeviceBuffer(const DeviceBuffer &) = delete;
  DeviceBuffer &operator=(const DeviceBuffer &) = delete;

  ~DeviceBuffer();

  const Device &device() const { return device_; }
  size_t byte_size() const { return byte_size_; }
  bool empty() const { return byte_size_ == 0; }

  template <typename T = void> const T *data() const {
    return static_cast<const T *>(data_.get());
  }
  template <typename T = void> T *mutable_data() {
    return static_cast<T *>(data_.get());
  }

  /**
   * @brief Blocking host-to-device copy of exactly `byte_size()` bytes.
   * @throws Error (kSizeMismatch) if `bytes != byte_size()`.
   */
  void copy_from_host(const void *host, size_t bytes);

  /**
   * @brief Blocking device-to-host copy of exactly `byte_size()` bytes.
   * @throws Error (kSizeMismatch) if `bytes != byte_size()`.
   */
  void copy_to_host(void *host, size_t bytes) const;

  /**
   * @brief Stream-ordered host-to-device copy.
   *
   * `host` must stay valid until `stream` has passed this point.
   */
  void copy_from_host_async(const Stream &stream, const void *host,
                            size_t bytes);

  /**
   * @brief Stream-ordered device-to-host copy.
   *
   * The contents of `host` are undefined until `stream` is synchronized.
   */
  void copy_to_host_async(const Stream &stream, void *host,
                          size_t bytes) const;

  /**
   * @brief Stream-ordered device-to-device copy from a buffer of equal size.
   */
  void copy_from_device(const Stream &stream, const DeviceBuffer &other);

private:
  friend class Device;

  DeviceBuffer(Device device, std::unique_ptr<void, CudaDeleter> data,
               size_t byte_size);

  void check_size(size_t bytes, const char *op) const;
  void check_stream(const Stream &stream, const char *op) const;

  Device device_;
  std::unique_ptr<void, CudaDeleter> data_;
  size_t byte_size_ = 0;
};

} // namespace nneval::runtime
