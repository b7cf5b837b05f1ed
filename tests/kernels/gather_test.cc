#include "gtest/gtest.h"
#include "nneval/kernels/kernels.h"
#include "nneval/kernels/operators.h"
#include "test_utils.h"

#include <random>
#include <vector>

namespace nneval::kernels {

using nneval::testing::DeviceTest;
using runtime::Device;
using runtime::DeviceBuffer;
using runtime::ErrorCode;
using runtime::Stream;

namespace {

// Runs the axis-1 gather on a dense (batch_size, input_size) input holding
// -0, -1, -2, ... with random indices, and compares against a host gather.
void check_gather_axis1(const Device &device, Stream &stream, int batch_size,
                        int input_size, int index_count) {
  SCOPED_TRACE(::testing::Message()
               << "input " << batch_size << "x" << input_size << ", "
               << index_count << " indices");

  std::vector<float> input(static_cast<size_t>(batch_size) * input_size);
  for (size_t i = 0; i < input.size(); ++i) {
    input[i] = -static_cast<float>(i);
  }
  std::mt19937 rng(1);
  std::uniform_int_distribution<int> dist(0, input_size - 1);
  std::vector<float> indices(index_count);
  for (float &index : indices) {
    index = static_cast<float>(dist(rng));
  }

  DeviceBuffer in = ops::upload(device, input);
  DeviceBuffer idx = ops::upload(device, indices);
  DeviceBuffer out = device.allocate(static_cast<size_t>(batch_size) *
                                     index_count * sizeof(float));

  Status status = gather_2d_axis1_float_float(
      stream.inner(), batch_size, input_size, input_size, 1, index_count,
      in.data<float>(), idx.data<float>(), out.mutable_data<float>());
  ASSERT_TRUE(status.ok()) << status.to_string();
  stream.synchronize();

  std::vector<float> expected;
  expected.reserve(static_cast<size_t>(batch_size) * index_count);
  for (int n = 0; n < batch_size; ++n) {
    for (int q = 0; q < index_count; ++q) {
      expected.push_back(
          input[static_cast<size_t>(n) * input_size +
                static_cast<size_t>(indices[q])]);
    }
  }
  EXPECT_EQ(ops::download<float>(out), expected);
}

} // namespace

// -------- Argument validation (no device required) --------

TEST(GatherValidationTest, EmptyWorkIsOkWithNullPointers) {
  EXPECT_TRUE(gather_float(nullptr, 0, nullptr, nullptr, nullptr).ok());
  EXPECT_TRUE(gather_2d_axis1_float_float(nullptr, 0, 10, 10, 1, 5, nullptr,
                                          nullptr, nullptr)
                  .ok());
  EXPECT_TRUE(gather_2d_axis1_float_int(nullptr, 4, 10, 10, 1, 0, nullptr,
                                        nullptr, nullptr)
                  .ok());
}

TEST(GatherValidationTest, NegativeSizesRejected) {
  EXPECT_EQ(gather_float(nullptr, -1, nullptr, nullptr, nullptr).code(),
            ErrorCode::kInvalidArgument);
  EXPECT_EQ(gather_2d_axis1_float_float(nullptr, -1, 10, 10, 1, 5, nullptr,
                                        nullptr, nullptr)
                .code(),
            ErrorCode::kInvalidArgument);
  EXPECT_EQ(gather_2d_axis1_float_int(nullptr, 2, 10, 10, 1, -3, nullptr,
                                      nullptr, nullptr)
                .code(),
            ErrorCode::kInvalidArgument);
}

TEST(GatherValidationTest, EmptyAxisWithIndicesRejected) {
  float dummy = 0.0f;
  EXPECT_EQ(gather_2d_axis1_float_float(nullptr, 2, 0, 0, 1, 3, &dummy, &dummy,
                                        &dummy)
                .code(),
            ErrorCode::kInvalidArgument);
}

TEST(GatherValidationTest, NullPointersRejected) {
  float dummy = 0.0f;
  EXPECT_EQ(gather_float(nullptr, 3, nullptr, &dummy, &dummy).code(),
            ErrorCode::kInvalidArgument);
}

// -------- Device tests --------

TEST_F(DeviceTest, FlatGather) {
  std::vector<float> input = nneval::testing::iota_floats(128);
  std::vector<int32_t> indices = {16, 3, 8, 2, 4, 9};
  DeviceBuffer in = ops::upload(device(), input);
  DeviceBuffer idx = ops::upload(device(), indices);
  DeviceBuffer out = device().allocate(indices.size() * sizeof(float));

  Status status = gather_float(stream().inner(),
                               static_cast<int>(indices.size()),
                               idx.data<int>(), in.data<float>(),
                               out.mutable_data<float>());
  ASSERT_TRUE(status.ok()) << status.to_string();
  stream().synchronize();

  EXPECT_EQ(ops::download<float>(out),
            (std::vector<float>{16, 3, 8, 2, 4, 9}));
}

// The illegal access leaves the CUDA context unusable for the rest of the
// process. ctest runs every discovered test in its own process, so later tests
// start with a fresh context.
TEST_F(DeviceTest, OutOfRangeIndexSurfacesOnSynchronize) {
  DeviceBuffer in = ops::upload(device(), nneval::testing::iota_floats(16));
  DeviceBuffer idx = ops::upload(device(), std::vector<int32_t>{1 << 30});
  DeviceBuffer out = device().allocate(sizeof(float));

  Status status = gather_float(stream().inner(), 1, idx.data<int>(),
                               in.data<float>(), out.mutable_data<float>());
  ASSERT_TRUE(status.ok()) << status.to_string();

  try {
    stream().synchronize();
    FAIL() << "expected an Error";
  } catch (const runtime::Error &e) {
    EXPECT_EQ(e.code(), ErrorCode::kLaunchError);
    EXPECT_EQ(e.native_code(), static_cast<int>(cudaErrorIllegalAddress));
  }
}

TEST_F(DeviceTest, GatherAxis1SmallBatch) {
  std::vector<float> input = {0, -1, -2, -3, -4, -5, -6, -7};
  DeviceBuffer in = ops::upload(device(), input);
  DeviceBuffer idx = ops::upload(device(), std::vector<float>{0.0f, 2.0f});
  DeviceBuffer out = device().allocate(4 * sizeof(float));
  ASSERT_TRUE(gather_2d_axis1_float_float(stream().inner(), 2, 4, 4, 1, 2,
                                          in.data<float>(), idx.data<float>(),
                                          out.mutable_data<float>())
                  .ok());
  stream().synchronize();
  EXPECT_EQ(ops::download<float>(out), (std::vector<float>{0, -2, -4, -6}));
}

TEST_F(DeviceTest, GatherAxis1TileBoundaries) {
  for (int batch_size : {0, 1, 2, 3, 4, 8, 13}) {
    for (int input_size : {1, 2, 3, 4, 128, 129, 1000}) {
      for (int index_count : {0, 1, 2, 3, 63, 64, 65, 127, 128, 129, 1000}) {
        check_gather_axis1(device(), stream(), batch_size, input_size,
                           index_count);
      }
    }
  }
}

TEST_F(DeviceTest, GatherAxis1ChessShape) {
  check_gather_axis1(device(), stream(), 128, 4608, 1880);
}

TEST_F(DeviceTest, GatherAxis1IntIndicesStridedInput) {
  // Input stored transposed: logical (batch=3, size=5), element stride 3.
  const int batch_size = 3;
  const int input_size = 5;
  std::vector<float> storage(15);
  for (int n = 0; n < batch_size; ++n) {
    for (int i = 0; i < input_size; ++i) {
      storage[i * batch_size + n] = static_cast<float>(10 * n + i);
    }
  }
  std::vector<int32_t> indices = {4, 0, 0, 2};
  DeviceBuffer in = ops::upload(device(), storage);
  DeviceBuffer idx = ops::upload(device(), indices);
  DeviceBuffer out = device().allocate(batch_size * indices.size() * sizeof(float));

  Status status = gather_2d_axis1_float_int(
      stream().inner(), batch_size, input_size, 1, batch_size,
      static_cast<int>(indices.size()), in.data<float>(), idx.data<int>(),
      out.mutable_data<float>());
  ASSERT_TRUE(status.ok()) << status.to_string();
  stream().synchronize();

  EXPECT_EQ(ops::download<float>(out),
            (std::vector<float>{4, 0, 0, 2, 14, 10, 10, 12, 24, 20, 20, 22}));
}

TEST_F(DeviceTest, GatherAxis1LargeBatchUsesGridStride) {
  // More batch rows than grid.y can cover in one pass.
  const int batch_size = 65535 * 4 + 17;
  const int input_size = 2;
  std::vector<float> input(static_cast<size_t>(batch_size) * input_size);
  for (size_t i = 0; i < input.size(); ++i) {
    input[i] = static_cast<float>(i % 1000);
  }
  std::vector<int32_t> indices = {1};
  DeviceBuffer in = ops::upload(device(), input);
  DeviceBuffer idx = ops::upload(device(), indices);
  DeviceBuffer out = device().allocate(batch_size * sizeof(float));

  ASSERT_TRUE(gather_2d_axis1_float_int(stream().inner(), batch_size,
                                        input_size, input_size, 1, 1,
                                        in.data<float>(), idx.data<int>(),
                                        out.mutable_data<float>())
                  .ok());
  stream().synchronize();

  std::vector<float> result = ops::download<float>(out);
  for (int n = 0; n < batch_size; ++n) {
    ASSERT_EQ(result[n], input[static_cast<size_t>(n) * 2 + 1]) << "row " << n;
  }
}

} // namespace nneval::kernels
