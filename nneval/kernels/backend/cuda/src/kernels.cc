// nneval/kernels/backend/cuda/src/kernels.cc
//
// Implements the public kernel entry points declared in kernels.h. Each entry
// point validates its arguments, hands the problem to the matching launcher in
// kernels.cu.cc and turns the CUDA return code into a `Status`.
//
// Author: NNEval Team
// Date: 2026-03-05
// Copyright: (c) 2026 NNEval Project. All rights reserved.
// SPDX-License-Identifier: MIT

#include "nneval/kernels/kernels.h"

#include <cmath>
#include <string>

#include "launchers.h"
#include "macros.h"

namespace nneval::kernels {

using runtime::ErrorCode;

namespace {

Status invalid(const char *op, const std::string &what) {
  return Status(ErrorCode::kInvalidArgument, std::string(op) + ": " + what);
}

Status from_launch(cudaError_t err, const char *op) {
  return runtime::detail::status_from_cuda(err, op);
}

/**
 * @brief Shared validation and argument packing for the strided copies.
 */
template <typename T>
Status strided_copy(const char *op, cudaStream_t stream, int rank, int size,
                    const int *input_strides, const int *output_strides,
                    const int *dense_strides, const T *input, T *output) {
  if (rank < 0 || rank > runtime::kMaxRank) {
    return invalid(op, "rank " + std::to_string(rank) +
                           " is outside [0, " +
                           std::to_string(runtime::kMaxRank) + "]");
  }
  if (size < 0) {
    return invalid(op, "negative size " + std::to_string(size));
  }
  if (size == 0) {
    return Status::Ok();
  }
  if (rank == 0 && size > 1) {
    return invalid(op, "a rank 0 copy moves a single element, got size " +
                           std::to_string(size));
  }
  if (rank > 0 && (!input_strides || !output_strides || !dense_strides)) {
    return invalid(op, "stride descriptors must not be null");
  }
  if (!input || !output) {
    return invalid(op, "data pointers must not be null");
  }

  detail::StridedCopyArgs args;
  args.rank = rank;
  args.size = size;
  for (int i = 0; i < rank; ++i) {
    if (dense_strides[i] <= 0) {
      return invalid(op, "dense stride " + std::to_string(i) + " is " +
                             std::to_string(dense_strides[i]) +
                             ", dense strides must be positive");
    }
    args.input_strides[i] = input_strides[i];
    args.output_strides[i] = output_strides[i];
    args.dense_strides[i] = dense_strides[i];
  }

  return from_launch(
      detail::launch_strided_copy_kernel<T>(stream, args, input, output), op);
}

template <typename I>
Status gather_2d_axis1(const char *op, cudaStream_t stream, int batch_size,
                       int input_size, int input_batch_stride,
                       int input_elem_stride, int index_count,
                       const float *input, const I *indices, float *output) {
  if (batch_size < 0 || input_size < 0 || index_count < 0) {
    return invalid(op, "sizes must be non-negative, got batch_size=" +
                           std::to_string(batch_size) +
                           ", input_size=" + std::to_string(input_size) +
                           ", index_count=" + std::to_string(index_count));
  }
  if (batch_size == 0 || index_count == 0) {
    return Status::Ok();
  }
  if (input_size == 0) {
    return invalid(op, "cannot gather " + std::to_string(index_count) +
                           " indices from an empty axis");
  }
  if (!input || !indices || !output) {
    return invalid(op, "data pointers must not be null");
  }

  return from_launch(detail::launch_gather_2d_axis1_kernel<I>(
                         stream, batch_size, input_batch_stride,
                         input_elem_stride, index_count, input, indices,
                         output),
                     op);
}

Status check_quantize_params(const char *op, const QuantizeParams &params) {
  if (!std::isfinite(params.low) || !std::isfinite(params.high) ||
      !(params.high > params.low)) {
    return invalid(op, "quantization range [" + std::to_string(params.low) +
                           ", " + std::to_string(params.high) +
                           "] must be finite and non-empty");
  }
  return Status::Ok();
}

} // namespace

//===----------------------------------------------------------------------===//
// Strided Copy
//===----------------------------------------------------------------------===//

Status strided_copy_float(cudaStream_t stream, int rank, int size,
                          const int *input_strides, const int *output_strides,
                          const int *dense_strides, const float *input,
                          float *output) {
  return strided_copy<float>("strided_copy_float", stream, rank, size,
                             input_strides, output_strides, dense_strides,
                             input, output);
}

Status strided_copy_int(cudaStream_t stream, int rank, int size,
                        const int *input_strides, const int *output_strides,
                        const int *dense_strides, const int32_t *input,
                        int32_t *output) {
  return strided_copy<int32_t>("strided_copy_int", stream, rank, size,
                               input_strides, output_strides, dense_strides,
                               input, output);
}

Status strided_copy_byte(cudaStream_t stream, int rank, int size,
                         const int *input_strides, const int *output_strides,
                         const int *dense_strides, const uint8_t *input,
                         uint8_t *output) {
  return strided_copy<uint8_t>("strided_copy_byte", stream, rank, size,
                               input_strides, output_strides, dense_strides,
                               input, output);
}

//===----------------------------------------------------------------------===//
// Gather
//===----------------------------------------------------------------------===//

Status gather_float(cudaStream_t stream, int count, const int *indices,
                    const float *input, float *output) {
  const char *op = "gather_float";
  if (count < 0) {
    return invalid(op, "negative count " + std::to_string(count));
  }
  if (count == 0) {
    return Status::Ok();
  }
  if (!indices || !input || !output) {
    return invalid(op, "data pointers must not be null");
  }
  return from_launch(
      detail::launch_gather_kernel(stream, count, indices, input, output), op);
}

Status gather_2d_axis1_float_float(cudaStream_t stream, int batch_size,
                                   int input_size, int input_batch_stride,
                                   int input_elem_stride, int index_count,
                                   const float *input, const float *indices,
                                   float *output) {
  return gather_2d_axis1<float>("gather_2d_axis1_float_float", stream,
                                batch_size, input_size, input_batch_stride,
                                input_elem_stride, index_count, input, indices,
                                output);
}

Status gather_2d_axis1_float_int(cudaStream_t stream, int batch_size,
                                 int input_size, int input_batch_stride,
                                 int input_elem_stride, int index_count,
                                 const float *input, const int *indices,
                                 float *output) {
  return gather_2d_axis1<int>("gather_2d_axis1_float_int", stream, batch_size,
                              input_size, input_batch_stride,
                              input_elem_stride, index_count, input, indices,
                              output);
}

//===----------------------------------------------------------------------===//
// Quantization
//===----------------------------------------------------------------------===//

Status quantize(cudaStream_t stream, int length, const float *input,
                uint8_t *output, const QuantizeParams &params) {
  const char *op = "quantize";
  Status status = check_quantize_params(op, params);
  if (!status.ok()) {
    return status;
  }
  if (length < 0) {
    return invalid(op, "negative length " + std::to_string(length));
  }
  if (length == 0) {
    return Status::Ok();
  }
  if (!input || !output) {
    return invalid(op, "data pointers must not be null");
  }

  const float scale = 255.0f / (params.high - params.low);
  const bool half_to_even = params.rounding == Rounding::kHalfToEven;
  return from_launch(detail::launch_quantize_kernel(stream, length, input,
                                                    output, params.low,
                                                    params.high, scale,
                                                    half_to_even),
                     op);
}

Status unquantize(cudaStream_t stream, int length, const uint8_t *input,
                  float *output, const QuantizeParams &params) {
  const char *op = "unquantize";
  Status status = check_quantize_params(op, params);
  if (!status.ok()) {
    return status;
  }
  if (length < 0) {
    return invalid(op, "negative length " + std::to_string(length));
  }
  if (length == 0) {
    return Status::Ok();
  }
  if (!input || !output) {
    return invalid(op, "data pointers must not be null");
  }

  const float step = (params.high - params.low) / 255.0f;
  return from_launch(detail::launch_unquantize_kernel(stream, length, input,
                                                      output, params.low, step),
                     op);
}

} // namespace nneval::kernels
