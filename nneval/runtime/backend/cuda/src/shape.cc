// nneval/runtime/backend/cuda/src/shape.cc
//
// Host-side shape arithmetic: element counts, dense strides and the reachable
// element range used to validate views against their allocation.
//
// Author: NNEval Team
// Date: 2026-03-02
// Copyright: (c) 2026 NNEval Project. All rights reserved.
// SPDX-License-Identifier: MIT

#include "nneval/runtime/shape.h"

#include "nneval/runtime/status.h"

namespace nneval::runtime {

size_t dtype_size(DType dtype) {
  switch (dtype) {
  case DType::Float32:
    return sizeof(float);
  case DType::Int32:
    return sizeof(int32_t);
  case DType::UInt8:
    return sizeof(uint8_t);
  }
  throw Error(ErrorCode::kInvalidArgument, "Unsupported DType");
}

const char *dtype_name(DType dtype) {
  switch (dtype) {
  case DType::Float32:
    return "Float32";
  case DType::Int32:
    return "Int32";
  case DType::UInt8:
    return "UInt8";
  }
  return "Unknown DType";
}

int64_t numel(const Shape &shape) {
  int64_t n = 1;
  for (int64_t dim : shape) {
    n *= dim;
  }
  return n;
}

Strides dense_strides(const Shape &shape) {
  Strides strides(shape.size());
  if (shape.empty()) {
    return strides;
  }

  // A zero extent would make every earlier stride zero, which breaks the
  // division used to decode linear indices. Treat it as one for this purpose.
  strides.back() = 1;
  for (int i = static_cast<int>(shape.size()) - 2; i >= 0; --i) {
    int64_t next = shape[i + 1] > 0 ? shape[i + 1] : 1;
    strides[i] = strides[i + 1] * next;
  }
  return strides;
}

Extent reachable_extent(const Shape &shape, const Strides &strides,
                        int64_t offset) {
  if (shape.size() != strides.size()) {
    throw Error(ErrorCode::kInvalidArgument,
                "shape " + to_string(shape) + " and strides " +
                    to_string(strides) + " have different ranks");
  }

  Extent extent;
  extent.lowest = offset;
  extent.highest = offset;
  extent.empty = false;
  for (size_t i = 0; i < shape.size(); ++i) {
    if (shape[i] < 0) {
      throw Error(ErrorCode::kInvalidArgument,
                  "negative extent in shape " + to_string(shape));
    }
    if (shape[i] == 0) {
      extent.empty = true;
      continue;
    }
    int64_t span = (shape[i] - 1) * strides[i];
    if (span > 0) {
      extent.highest += span;
    } else {
      extent.lowest += span;
    }
  }
  return extent;
}

std::string to_string(const std::vector<int64_t> &dims) {
  std::string s = "[";
  for (size_t i = 0; i < dims.size(); ++i) {
    s += std::to_string(dims[i]);
    if (i < dims.size() - 1) {
      s += ", ";
    }
  }
  s += "]";
  return s;
}

} // namespace nneval::runtime
