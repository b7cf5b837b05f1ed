#pragma once

#include "gtest/gtest.h"
#include "nneval/runtime/device.h"
#include "nneval/runtime/stream.h"

#include <cmath>
#include <memory>
#include <vector>

namespace nneval::testing {

// Fixture for tests that need a GPU. Skips when no CUDA device is visible so
// the argument-validation tests still run on machines without one.
class DeviceTest : public ::testing::Test {
protected:
  void SetUp() override {
    if (runtime::Device::count() == 0) {
      GTEST_SKIP() << "no CUDA device available";
    }
    device_ = std::make_unique<runtime::Device>(runtime::Device::open(0));
    stream_ = std::make_unique<runtime::Stream>(*device_);
  }

  const runtime::Device &device() const { return *device_; }
  runtime::Stream &stream() { return *stream_; }

  std::unique_ptr<runtime::Device> device_;
  std::unique_ptr<runtime::Stream> stream_;
};

inline std::vector<float> iota_floats(size_t n, float start = 0.0f) {
  std::vector<float> v(n);
  for (size_t i = 0; i < n; ++i) {
    v[i] = start + static_cast<float>(i);
  }
  return v;
}

inline std::vector<float> linspace(float from, float to, size_t n) {
  std::vector<float> v(n);
  for (size_t i = 0; i < n; ++i) {
    v[i] = n == 1 ? from
                  : from + (to - from) * static_cast<float>(i) /
                               static_cast<float>(n - 1);
  }
  return v;
}

} // namespace nneval::testing
