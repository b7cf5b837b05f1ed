// nneval/runtime/shape.h
//
// Shape and stride helpers shared by the views, the kernel launch layer and
// the tests. Everything here is plain host code.
//
// Author: NNEval Team
// Date: 2026-03-02
// Copyright: (c) 2026 NNEval Project. All rights reserved.
// SPDX-License-Identifier: MIT

#pragma once

#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

#define NNEVAL_MAX_RANK 8

namespace nneval::runtime {

/// Maximum tensor rank accepted by views and the strided-copy kernel.
constexpr int kMaxRank = NNEVAL_MAX_RANK;

/**
 * @brief Type alias for tensor shapes, one extent per axis.
 */
using Shape = std::vector<int64_t>;

/**
 * @brief Type alias for element strides, one signed stride per axis.
 */
using Strides = std::vector<int64_t>;

/**
 * @brief Enumerates the element types a view can carry.
 */
enum class DType {
  Float32, ///< 32-bit floating-point number.
  Int32,   ///< 32-bit signed integer.
  UInt8,   ///< 8-bit unsigned integer, used for quantized data.
};

/**
 * @brief Returns the size in bytes of a single element of `dtype`.
 */
size_t dtype_size(DType dtype);

/**
 * @brief Returns the name of `dtype` ("Float32", "Int32", "UInt8").
 */
const char *dtype_name(DType dtype);

/**
 * @brief Total number of elements described by `shape`.
 *
 * The empty shape describes a scalar and has one element.
 */
int64_t numel(const Shape &shape);

/**
 * @brief Row-major strides implied by `shape` alone.
 *
 * Axes after a zero-sized axis still get the product of the following
 * extents, so a linear index can always be decoded when `numel > 0`.
 */
Strides dense_strides(const Shape &shape);

/**
 * @brief Smallest and largest element offsets reachable through a layout.
 *
 * `lowest` and `highest` are relative to the view's base pointer and include
 * `offset`. When any extent is zero nothing is reachable and `empty` is set.
 */
struct Extent {
  int64_t lowest = 0;
  int64_t highest = 0;
  bool empty = true;
};

/**
 * @brief Computes the reachable element range of a shape/strides/offset triple.
 * @throws Error (kInvalidArgument) if the ranks differ or an extent is negative.
 */
Extent reachable_extent(const Shape &shape, const Strides &strides,
                        int64_t offset);

/**
 * @brief Converts a shape or stride vector to a string such as "[2, 3]".
 */
std::string to_string(const std::vector<int64_t> &dims);

} // namespace nneval::runtime
