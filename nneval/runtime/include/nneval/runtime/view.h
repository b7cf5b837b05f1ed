// nneval/runtime/view.h
//
// Defines `View`, a typed, non-owning window onto a `DeviceBuffer`. A view
// binds a buffer to a dtype, shape, element strides and element offset, and is
// validated at construction so that every element it can reach lies inside
// the allocation.
//
// Author: NNEval Team
// Date: 2026-03-04
// Copyright: (c) 2026 NNEval Project. All rights reserved.
// SPDX-License-Identifier: MIT

#pragma once

#include <cstdint>
#include <string>
#include <vector>

#include "nneval/runtime/device.h"
#include "nneval/runtime/shape.h"

namespace nneval::runtime {

/**
 * @brief A typed layout over borrowed device memory.
 *
 * Views never own memory: the underlying `DeviceBuffer` must outlive every
 * view of it and every stream operation that uses one. Layout transforms
 * (`permute`, `slice`, `broadcast_to`, `flip`, `reshape`) return new views of
 * the same memory and never launch work.
 *
 * A view created from a `const DeviceBuffer&` is read-only; asking it for
 * `mutable_data` throws.
 */
class View {
public:
  /**
   * @brief Creates a row-major view covering `numel(shape)` elements.
   * @throws Error (kInvalidArgument) if the elements do not fit the buffer or
   *         the rank exceeds `kMaxRank`.
   */
  static View dense(DeviceBuffer &buffer, DType dtype, const Shape &shape);
  static View dense(const DeviceBuffer &buffer, DType dtype,
                    const Shape &shape);

  /**
   * @brief Creates a view with explicit element strides and offset.
   *
   * Strides may be zero (broadcast) or negative (reversed axis). The offset
   * is in elements from the start of the buffer.
   *
   * @throws Error (kInvalidArgument) if any reachable element falls outside
   *         the buffer, the ranks differ, or the rank exceeds `kMaxRank`.
   */
  static View strided(DeviceBuffer &buffer, DType dtype, const Shape &shape,
                      const Strides &strides, int64_t offset = 0);
  static View strided(const DeviceBuffer &buffer, DType dtype,
                      const Shape &shape, const Strides &strides,
                      int64_t offset = 0);

  const Device &device() const { return device_; }
  DType dtype() const { return dtype_; }
  const Shape &shape() const { return shape_; }
  const Strides &strides() const { return strides_; }
  int64_t offset() const { return offset_; }
  size_t ndim() const { return shape_.size(); }
  int64_t dim(size_t i) const { return shape_.at(i); }
  int64_t numel() const { return runtime::numel(shape_); }
  bool read_only() const { return read_only_; }

  /**
   * @brief True if the strides are the row-major strides of the shape.
   *
   * Axes of extent one are ignored since their stride is never used.
   */
  bool is_dense() const;

  /**
   * @brief Pointer to the element at coordinate zero (offset applied).
   */
  template <typename T = void> const T *data() const {
    return static_cast<const T *>(element_pointer());
  }

  /**
   * @brief Mutable pointer to the element at coordinate zero.
   * @throws Error (kInvalidArgument) if the view is read-only.
   */
  template <typename T = void> T *mutable_data() const {
    check_writable();
    return static_cast<T *>(element_pointer());
  }

  /**
   * @brief Reorders the axes: axis `i` of the result is axis `perm[i]` here.
   */
  View permute(const std::vector<int> &perm) const;

  /**
   * @brief Restricts `axis` to the half-open range `[start, end)`.
   */
  View slice(int axis, int64_t start, int64_t end) const;

  /**
   * @brief Broadcasts to `shape` following NumPy rules (right-aligned, extents
   *        of one stretch with stride zero).
   */
  View broadcast_to(const Shape &shape) const;

  /**
   * @brief Reverses `axis` by negating its stride.
   */
  View flip(int axis) const;

  /**
   * @brief Reinterprets a dense view with another shape of equal size.
   */
  View reshape(const Shape &shape) const;

  std::string to_string() const;

private:
  View(const Device &device, char *base, size_t buffer_bytes, DType dtype,
       Shape shape, Strides strides, int64_t offset, bool read_only);

  void *element_pointer() const;
  void check_writable() const;
  int normalize_axis(int axis, const char *op) const;

  Device device_;
  char *base_ = nullptr;
  size_t buffer_bytes_ = 0;
  DType dtype_;
  Shape shape_;
  Strides strides_;
  int64_t offset_ = 0;
  bool read_only_ = false;
};

} // namespace nneval::runtime
