#include "gtest/gtest.h"
#include "nneval/kernels/kernels.h"
#include "nneval/kernels/operators.h"
#include "test_utils.h"

#include <algorithm>
#include <climits>
#include <cmath>
#include <limits>
#include <vector>

#include <cuda_runtime.h>

namespace nneval::kernels {

using nneval::testing::DeviceTest;
using runtime::DeviceBuffer;
using runtime::ErrorCode;

namespace {

uint8_t reference_quantize(float x, const QuantizeParams &params) {
  const float scale = 255.0f / (params.high - params.low);
  const float clamped = std::fmin(std::fmax(x, params.low), params.high);
  const float scaled = (clamped - params.low) * scale;
  const float rounded = params.rounding == Rounding::kHalfToEven
                            ? std::nearbyint(scaled)
                            : std::round(scaled);
  return static_cast<uint8_t>(rounded);
}

} // namespace

// -------- Argument validation (no device required) --------

TEST(QuantizeValidationTest, ZeroLengthIsOkWithNullPointers) {
  EXPECT_TRUE(quantize(nullptr, 0, nullptr, nullptr).ok());
  EXPECT_TRUE(unquantize(nullptr, 0, nullptr, nullptr).ok());
}

TEST(QuantizeValidationTest, NegativeLengthRejected) {
  EXPECT_EQ(quantize(nullptr, -1, nullptr, nullptr).code(),
            ErrorCode::kInvalidArgument);
  EXPECT_EQ(unquantize(nullptr, -1, nullptr, nullptr).code(),
            ErrorCode::kInvalidArgument);
}

TEST(QuantizeValidationTest, RangeMustBeFiniteAndNonEmpty) {
  float in = 0.0f;
  uint8_t out = 0;
  QuantizeParams reversed{1.0f, 0.0f};
  QuantizeParams degenerate{0.5f, 0.5f};
  QuantizeParams infinite{0.0f, std::numeric_limits<float>::infinity()};
  QuantizeParams nan{std::numeric_limits<float>::quiet_NaN(), 1.0f};
  for (const QuantizeParams &params : {reversed, degenerate, infinite, nan}) {
    EXPECT_EQ(quantize(nullptr, 1, &in, &out, params).code(),
              ErrorCode::kInvalidArgument);
    EXPECT_EQ(unquantize(nullptr, 1, &out, &in, params).code(),
              ErrorCode::kInvalidArgument);
  }
}

TEST(QuantizeValidationTest, DefaultRangeIsUnitInterval) {
  EXPECT_EQ(kDefaultQuantizeParams.low, 0.0f);
  EXPECT_EQ(kDefaultQuantizeParams.high, 1.0f);
  EXPECT_EQ(kDefaultQuantizeParams.rounding, Rounding::kHalfAwayFromZero);
}

// -------- Device tests --------

TEST_F(DeviceTest, QuantizeRoundTripWithinOneStep) {
  const int length = 20;
  std::vector<float> input = nneval::testing::linspace(-0.2f, 1.2f, length);
  DeviceBuffer in = ops::upload(device(), input);
  DeviceBuffer middle = device().allocate(length);
  DeviceBuffer out = device().allocate(length * sizeof(float));

  ASSERT_TRUE(quantize(stream().inner(), length, in.data<float>(),
                       middle.mutable_data<uint8_t>())
                  .ok());
  ASSERT_TRUE(unquantize(stream().inner(), length, middle.data<uint8_t>(),
                         out.mutable_data<float>())
                  .ok());
  stream().synchronize();

  std::vector<uint8_t> bytes = ops::download<uint8_t>(middle);
  std::vector<float> result = ops::download<float>(out);
  for (int i = 0; i < length; ++i) {
    EXPECT_EQ(bytes[i], reference_quantize(input[i], kDefaultQuantizeParams))
        << "at " << input[i];
    const float clamped = std::min(std::max(input[i], 0.0f), 1.0f);
    EXPECT_LE(std::fabs(result[i] - clamped), 0.5f / 255.0f + 1e-6f)
        << "at " << input[i];
  }
  EXPECT_EQ(bytes.front(), 0);
  EXPECT_EQ(bytes.back(), 255);
}

TEST_F(DeviceTest, QuantizeClampsOutOfRangeValues) {
  std::vector<float> input = {-0.2f, 0.0f, 1.2f, 1.0f};
  DeviceBuffer in = ops::upload(device(), input);
  DeviceBuffer out = device().allocate(input.size());
  ASSERT_TRUE(quantize(stream().inner(), static_cast<int>(input.size()),
                       in.data<float>(), out.mutable_data<uint8_t>())
                  .ok());
  stream().synchronize();
  std::vector<uint8_t> bytes = ops::download<uint8_t>(out);
  EXPECT_EQ(bytes[0], bytes[1]);
  EXPECT_EQ(bytes[2], bytes[3]);
}

TEST_F(DeviceTest, QuantizeIsIdempotentAfterFirstPass) {
  std::vector<float> input = nneval::testing::linspace(-0.5f, 1.5f, 1001);
  const int length = static_cast<int>(input.size());
  DeviceBuffer in = ops::upload(device(), input);
  DeviceBuffer q1 = device().allocate(length);
  DeviceBuffer mid = device().allocate(length * sizeof(float));
  DeviceBuffer q2 = device().allocate(length);

  ASSERT_TRUE(quantize(stream().inner(), length, in.data<float>(),
                       q1.mutable_data<uint8_t>())
                  .ok());
  ASSERT_TRUE(unquantize(stream().inner(), length, q1.data<uint8_t>(),
                         mid.mutable_data<float>())
                  .ok());
  ASSERT_TRUE(quantize(stream().inner(), length, mid.data<float>(),
                       q2.mutable_data<uint8_t>())
                  .ok());
  stream().synchronize();

  EXPECT_EQ(ops::download<uint8_t>(q1), ops::download<uint8_t>(q2));
}

TEST_F(DeviceTest, QuantizeLengthBeyondOneGridPass) {
  const int length = 65535 * 256 * 2 + 77;
  DeviceBuffer in = device().allocate(static_cast<size_t>(length) * sizeof(float));
  DeviceBuffer out = device().allocate(length);
  ASSERT_EQ(cudaMemsetAsync(in.mutable_data(), 0,
                            static_cast<size_t>(length) * sizeof(float),
                            stream().inner()),
            cudaSuccess);
  ASSERT_EQ(cudaMemsetAsync(out.mutable_data(), 0xAB, length, stream().inner()),
            cudaSuccess);
  ASSERT_TRUE(quantize(stream().inner(), length, in.data<float>(),
                       out.mutable_data<uint8_t>())
                  .ok());
  stream().synchronize();

  std::vector<uint8_t> bytes = ops::download<uint8_t>(out);
  EXPECT_EQ(std::count(bytes.begin(), bytes.end(), uint8_t(0)), length);
}

TEST_F(DeviceTest, QuantizeNearIntMaxStaysInBounds) {
  // The grid-stride index must not wrap when the last grid pass ends past
  // INT_MAX. Needs roughly 11 GB of device memory.
  const int length = INT_MAX - 100;
  const size_t guard = 256;
  size_t free_bytes = 0;
  size_t total_bytes = 0;
  ASSERT_EQ(cudaMemGetInfo(&free_bytes, &total_bytes), cudaSuccess);
  const size_t needed = static_cast<size_t>(length) * (sizeof(float) + 1) +
                        2 * guard + (size_t(256) << 20);
  if (free_bytes < needed) {
    GTEST_SKIP() << "needs " << needed << " bytes of free device memory";
  }

  DeviceBuffer in = device().allocate(static_cast<size_t>(length) * sizeof(float));
  DeviceBuffer out = device().allocate(static_cast<size_t>(length) + 2 * guard);
  ASSERT_EQ(cudaMemsetAsync(in.mutable_data(), 0,
                            static_cast<size_t>(length) * sizeof(float),
                            stream().inner()),
            cudaSuccess);
  ASSERT_EQ(cudaMemsetAsync(out.mutable_data(), 0xAB, out.byte_size(),
                            stream().inner()),
            cudaSuccess);
  uint8_t *body = out.mutable_data<uint8_t>() + guard;
  ASSERT_TRUE(
      quantize(stream().inner(), length, in.data<float>(), body).ok());
  stream().synchronize();

  std::vector<uint8_t> head(guard + 4);
  std::vector<uint8_t> tail(guard + 4);
  ASSERT_EQ(cudaMemcpy(head.data(), out.data(), head.size(),
                       cudaMemcpyDeviceToHost),
            cudaSuccess);
  ASSERT_EQ(cudaMemcpy(tail.data(), body + length - 4, tail.size(),
                       cudaMemcpyDeviceToHost),
            cudaSuccess);
  for (size_t i = 0; i < guard; ++i) {
    ASSERT_EQ(head[i], 0xAB) << "guard byte " << i << " before the output";
    ASSERT_EQ(tail[4 + i], 0xAB) << "guard byte " << i << " after the output";
  }
  for (size_t i = 0; i < 4; ++i) {
    EXPECT_EQ(head[guard + i], 0);
    EXPECT_EQ(tail[i], 0);
  }
}

TEST_F(DeviceTest, QuantizeNaNClampsToLow) {
  std::vector<float> input = {std::numeric_limits<float>::quiet_NaN(),
                              -std::numeric_limits<float>::infinity(),
                              std::numeric_limits<float>::infinity()};
  DeviceBuffer in = ops::upload(device(), input);
  DeviceBuffer out = device().allocate(input.size());
  ASSERT_TRUE(quantize(stream().inner(), static_cast<int>(input.size()),
                       in.data<float>(), out.mutable_data<uint8_t>())
                  .ok());
  stream().synchronize();
  EXPECT_EQ(ops::download<uint8_t>(out), (std::vector<uint8_t>{0, 0, 255}));
}

TEST_F(DeviceTest, QuantizeRoundingModes) {
  std::vector<float> input = {0.5f, 1.5f, 2.5f, 254.5f, 100.49f};
  DeviceBuffer in = ops::upload(device(), input);
  DeviceBuffer away = device().allocate(input.size());
  DeviceBuffer even = device().allocate(input.size());
  const int length = static_cast<int>(input.size());

  QuantizeParams away_params{0.0f, 255.0f, Rounding::kHalfAwayFromZero};
  QuantizeParams even_params{0.0f, 255.0f, Rounding::kHalfToEven};
  ASSERT_TRUE(quantize(stream().inner(), length, in.data<float>(),
                       away.mutable_data<uint8_t>(), away_params)
                  .ok());
  ASSERT_TRUE(quantize(stream().inner(), length, in.data<float>(),
                       even.mutable_data<uint8_t>(), even_params)
                  .ok());
  stream().synchronize();

  EXPECT_EQ(ops::download<uint8_t>(away),
            (std::vector<uint8_t>{1, 2, 3, 255, 100}));
  EXPECT_EQ(ops::download<uint8_t>(even),
            (std::vector<uint8_t>{0, 2, 2, 254, 100}));
}

TEST_F(DeviceTest, UnquantizeCustomRange) {
  QuantizeParams params{-1.0f, 1.0f};
  std::vector<uint8_t> input = {0, 51, 128, 255};
  DeviceBuffer in = ops::upload(device(), input);
  DeviceBuffer out = device().allocate(input.size() * sizeof(float));
  ASSERT_TRUE(unquantize(stream().inner(), static_cast<int>(input.size()),
                         in.data<uint8_t>(), out.mutable_data<float>(), params)
                  .ok());
  stream().synchronize();

  std::vector<float> result = ops::download<float>(out);
  const float step = 2.0f / 255.0f;
  for (size_t i = 0; i < input.size(); ++i) {
    EXPECT_NEAR(result[i], -1.0f + input[i] * step, 1e-6f);
  }
  EXPECT_NEAR(result.back(), 1.0f, 1e-6f);
}

} // namespace nneval::kernels
