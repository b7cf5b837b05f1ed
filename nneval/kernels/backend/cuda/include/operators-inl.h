#pragma once

// Not included by public headers. Only operators.cc includes this file and
// instantiates the templates for the supported element types.

#include <string>
#include <vector>

#include "nneval/kernels/operators.h"
#include "nneval/runtime/status.h"

namespace nneval::kernels::ops {

template <typename T>
DeviceBuffer upload(const Device &device, const std::vector<T> &data) {
  DeviceBuffer buffer = device.allocate(data.size() * sizeof(T));
  buffer.copy_from_host(data.data(), data.size() * sizeof(T));
  return buffer;
}

template <typename T> std::vector<T> download(const DeviceBuffer &buffer) {
  if (buffer.byte_size() % sizeof(T) != 0) {
    throw runtime::Error(runtime::ErrorCode::kSizeMismatch,
                         "download: buffer of " +
                             std::to_string(buffer.byte_size()) +
                             " bytes does not hold a whole number of " +
                             std::to_string(sizeof(T)) + "-byte elements");
  }
  std::vector<T> host(buffer.byte_size() / sizeof(T));
  buffer.copy_to_host(host.data(), buffer.byte_size());
  return host;
}

} // namespace nneval::kernels::ops
