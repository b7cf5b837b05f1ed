#include "gtest/gtest.h"
#include "nneval/runtime/device.h"
#include "nneval/runtime/status.h"
#include "nneval/runtime/stream.h"
#include "test_utils.h"

#include <cstdint>
#include <utility>
#include <vector>

namespace nneval::runtime {

using nneval::testing::DeviceTest;

TEST(DeviceOpenTest, RejectsUnavailableIndex) {
  try {
    Device::open(-1);
    FAIL() << "expected an Error";
  } catch (const Error &e) {
    EXPECT_EQ(e.code(), ErrorCode::kDeviceError);
  }
  try {
    Device::open(Device::count());
    FAIL() << "expected an Error";
  } catch (const Error &e) {
    EXPECT_EQ(e.code(), ErrorCode::kDeviceError);
  }
}

TEST_F(DeviceTest, OpenAndQuery) {
  EXPECT_EQ(device().index(), 0);
  EXPECT_FALSE(device().name().empty());
  EXPECT_NO_THROW(device().make_current());
  EXPECT_NO_THROW(device().synchronize());
  EXPECT_EQ(Device::open(0), device());
}

TEST_F(DeviceTest, ZeroByteAllocationIsEmpty) {
  DeviceBuffer buffer = device().allocate(0);
  EXPECT_TRUE(buffer.empty());
  EXPECT_EQ(buffer.byte_size(), 0u);
  EXPECT_EQ(buffer.data(), nullptr);
  EXPECT_NO_THROW(buffer.copy_from_host(nullptr, 0));
  EXPECT_NO_THROW(buffer.copy_to_host(nullptr, 0));
}

TEST_F(DeviceTest, HostRoundTrip) {
  std::vector<float> host = nneval::testing::iota_floats(1000, -3.0f);
  DeviceBuffer buffer = device().allocate(host.size() * sizeof(float));
  EXPECT_EQ(buffer.device(), device());
  buffer.copy_from_host(host.data(), host.size() * sizeof(float));

  std::vector<float> back(host.size());
  buffer.copy_to_host(back.data(), back.size() * sizeof(float));
  EXPECT_EQ(back, host);
}

TEST_F(DeviceTest, TransferSizeMismatch) {
  DeviceBuffer buffer = device().allocate(16);
  std::vector<uint8_t> host(12);
  try {
    buffer.copy_from_host(host.data(), host.size());
    FAIL() << "expected an Error";
  } catch (const Error &e) {
    EXPECT_EQ(e.code(), ErrorCode::kSizeMismatch);
  }
  EXPECT_THROW(buffer.copy_to_host(host.data(), host.size()), Error);

  DeviceBuffer other = device().allocate(8);
  try {
    buffer.copy_from_device(stream(), other);
    FAIL() << "expected an Error";
  } catch (const Error &e) {
    EXPECT_EQ(e.code(), ErrorCode::kSizeMismatch);
  }
}

TEST_F(DeviceTest, AsyncTransfersAndDeviceCopy) {
  std::vector<int32_t> host = {1, -2, 3, -4, 5, -6, 7, -8};
  const size_t bytes = host.size() * sizeof(int32_t);
  DeviceBuffer a = device().allocate(bytes);
  DeviceBuffer b = device().allocate(bytes);

  a.copy_from_host_async(stream(), host.data(), bytes);
  b.copy_from_device(stream(), a);
  std::vector<int32_t> back(host.size(), 0);
  b.copy_to_host_async(stream(), back.data(), bytes);
  stream().synchronize();

  EXPECT_EQ(back, host);
}

TEST_F(DeviceTest, HugeAllocationReportsOutOfMemory) {
  try {
    DeviceBuffer buffer = device().allocate(size_t(1) << 50);
    FAIL() << "expected an Error";
  } catch (const Error &e) {
    EXPECT_EQ(e.code(), ErrorCode::kOutOfMemory);
    EXPECT_NE(e.native_code(), 0);
  }
  // The failed allocation must not poison later work.
  DeviceBuffer small = device().allocate(4);
  EXPECT_NO_THROW(stream().synchronize());
}

TEST_F(DeviceTest, BufferMoveTransfersOwnership) {
  DeviceBuffer a = device().allocate(64);
  const void *ptr = a.data();
  DeviceBuffer b = std::move(a);
  EXPECT_EQ(b.data(), ptr);
  EXPECT_EQ(b.byte_size(), 64u);
  EXPECT_EQ(a.byte_size(), 0u);
}

} // namespace nneval::runtime
