// nneval/runtime/backend/cuda/src/view.cc
//
// Implements view construction, bounds validation and the zero-copy layout
// transforms.
//
// Author: NNEval Team
// Date: 2026-03-04
// Copyright: (c) 2026 NNEval Project. All rights reserved.
// SPDX-License-Identifier: MIT

#include "nneval/runtime/view.h"

#include <string>
#include <utility>

#include "nneval/runtime/status.h"

namespace nneval::runtime {

//===----------------------------------------------------------------------===//
// Construction & Validation
//===----------------------------------------------------------------------===//

View::View(const Device &device, char *base, size_t buffer_bytes, DType dtype,
           Shape shape, Strides strides, int64_t offset, bool read_only)
    : device_(device), base_(base), buffer_bytes_(buffer_bytes),
      dtype_(dtype), shape_(std::move(shape)), strides_(std::move(strides)),
      offset_(offset), read_only_(read_only) {
  if (shape_.size() > static_cast<size_t>(kMaxRank)) {
    throw Error(ErrorCode::kInvalidArgument,
                "view rank " + std::to_string(shape_.size()) +
                    " exceeds the maximum rank " + std::to_string(kMaxRank));
  }

  // -------- Every reachable element must lie inside the allocation --------
  Extent extent = reachable_extent(shape_, strides_, offset_);
  if (extent.empty) {
    return;
  }
  const int64_t capacity =
      static_cast<int64_t>(buffer_bytes_ / dtype_size(dtype_));
  if (extent.lowest < 0 || extent.highest >= capacity) {
    throw Error(ErrorCode::kInvalidArgument,
                "view " + to_string() + " reaches elements [" +
                    std::to_string(extent.lowest) + ", " +
                    std::to_string(extent.highest) + "] but the buffer holds " +
                    std::to_string(capacity) + " " + dtype_name(dtype_) +
                    " elements");
  }
}

View View::dense(DeviceBuffer &buffer, DType dtype, const Shape &shape) {
  return View(buffer.device(), buffer.mutable_data<char>(), buffer.byte_size(),
              dtype, shape, dense_strides(shape), 0, false);
}

View View::dense(const DeviceBuffer &buffer, DType dtype, const Shape &shape) {
  return View(buffer.device(), const_cast<char *>(buffer.data<char>()),
              buffer.byte_size(), dtype, shape, dense_strides(shape), 0, true);
}

View View::strided(DeviceBuffer &buffer, DType dtype, const Shape &shape,
                   const Strides &strides, int64_t offset) {
  return View(buffer.device(), buffer.mutable_data<char>(), buffer.byte_size(),
              dtype, shape, strides, offset, false);
}

View View::strided(const DeviceBuffer &buffer, DType dtype, const Shape &shape,
                   const Strides &strides, int64_t offset) {
  return View(buffer.device(), const_cast<char *>(buffer.data<char>()),
              buffer.byte_size(), dtype, shape, strides, offset, true);
}

//===----------------------------------------------------------------------===//
// Accessors
//===----------------------------------------------------------------------===//

bool View::is_dense() const {
  Strides expected = dense_strides(shape_);
  for (size_t i = 0; i < shape_.size(); ++i) {
    if (shape_[i] != 1 && strides_[i] != expected[i]) {
      return false;
    }
  }
  return true;
}

void *View::element_pointer() const {
  if (base_ == nullptr) {
    return nullptr;
  }
  return base_ + offset_ * static_cast<int64_t>(dtype_size(dtype_));
}

void View::check_writable() const {
  if (read_only_) {
    throw Error(ErrorCode::kInvalidArgument,
                "view " + to_string() + " is read-only");
  }
}

int View::normalize_axis(int axis, const char *op) const {
  int ndim = static_cast<int>(shape_.size());
  int pos_axis = axis < 0 ? axis + ndim : axis;
  if (pos_axis < 0 || pos_axis >= ndim) {
    throw Error(ErrorCode::kInvalidArgument,
                std::string(op) + ": axis " + std::to_string(axis) +
                    " is out of range for rank " + std::to_string(ndim));
  }
  return pos_axis;
}

//===----------------------------------------------------------------------===//
// Layout Transforms
//===----------------------------------------------------------------------===//

View View::permute(const std::vector<int> &perm) const {
  const int ndim = static_cast<int>(shape_.size());
  if (static_cast<int>(perm.size()) != ndim) {
    throw Error(ErrorCode::kInvalidArgument,
                "permute: permutation has " + std::to_string(perm.size()) +
                    " axes but the view has rank " + std::to_string(ndim));
  }

  std::vector<bool> seen(ndim, false);
  Shape new_shape(ndim);
  Strides new_strides(ndim);
  for (int i = 0; i < ndim; ++i) {
    int axis = perm[i];
    if (axis < 0 || axis >= ndim || seen[axis]) {
      throw Error(ErrorCode::kInvalidArgument,
                  "permute: not a valid permutation of the view's axes");
    }
    seen[axis] = true;
    new_shape[i] = shape_[axis];
    new_strides[i] = strides_[axis];
  }
  return View(device_, base_, buffer_bytes_, dtype_, std::move(new_shape),
              std::move(new_strides), offset_, read_only_);
}

View View::slice(int axis, int64_t start, int64_t end) const {
  int a = normalize_axis(axis, "slice");
  if (start < 0 || start > end || end > shape_[a]) {
    throw Error(ErrorCode::kInvalidArgument,
                "slice: range [" + std::to_string(start) + ", " +
                    std::to_string(end) + ") is invalid for axis of extent " +
                    std::to_string(shape_[a]));
  }
  Shape new_shape = shape_;
  new_shape[a] = end - start;
  int64_t new_offset = offset_ + start * strides_[a];
  return View(device_, base_, buffer_bytes_, dtype_, std::move(new_shape),
              strides_, new_offset, read_only_);
}

View View::broadcast_to(const Shape &shape) const {
  if (shape.size() < shape_.size()) {
    throw Error(ErrorCode::kInvalidArgument,
                "broadcast_to: cannot broadcast " + runtime::to_string(shape_) +
                    " to lower rank shape " + runtime::to_string(shape));
  }

  const size_t lead = shape.size() - shape_.size();
  Strides new_strides(shape.size(), 0);
  for (size_t i = 0; i < shape_.size(); ++i) {
    int64_t from = shape_[i];
    int64_t to = shape[lead + i];
    if (from == to) {
      new_strides[lead + i] = strides_[i];
    } else if (from != 1) {
      throw Error(ErrorCode::kInvalidArgument,
                  "broadcast_to: " + runtime::to_string(shape_) +
                      " is not broadcast-compatible with " +
                      runtime::to_string(shape));
    }
  }
  return View(device_, base_, buffer_bytes_, dtype_, shape,
              std::move(new_strides), offset_, read_only_);
}

View View::flip(int axis) const {
  int a = normalize_axis(axis, "flip");
  Strides new_strides = strides_;
  int64_t new_offset = offset_;
  if (shape_[a] > 0) {
    new_offset += (shape_[a] - 1) * strides_[a];
    new_strides[a] = -strides_[a];
  }
  return View(device_, base_, buffer_bytes_, dtype_, shape_,
              std::move(new_strides), new_offset, read_only_);
}

View View::reshape(const Shape &shape) const {
  if (!is_dense()) {
    throw Error(ErrorCode::kInvalidArgument,
                "reshape: view " + to_string() +
                    " is not dense; copy it into a dense buffer first");
  }
  if (runtime::numel(shape) != numel()) {
    throw Error(ErrorCode::kInvalidArgument,
                "reshape: cannot reshape " + runtime::to_string(shape_) +
                    " into " + runtime::to_string(shape) +
                    ", number of elements must be preserved");
  }
  return View(device_, base_, buffer_bytes_, dtype_, shape,
              dense_strides(shape), offset_, read_only_);
}

std::string View::to_string() const {
  return std::string("View(") + dtype_name(dtype_) +
         ", shape=" + runtime::to_string(shape_) +
         ", strides=" + runtime::to_string(strides_) +
         ", offset=" + std::to_string(offset_) + ")";
}

} // namespace nneval::runtime
