// nneval/kernels/backend/cuda/src/operators.cc
//
// Implements the view-based API declared in operators.h. This file checks
// views against each other, narrows their 64-bit layouts into the 32-bit
// descriptors of the kernel entry points and calls into cuBLAS and cuRAND for
// the operations those libraries provide.
//
// Author: NNEval Team
// Date: 2026-03-06
// Copyright: (c) 2026 NNEval Project. All rights reserved.
// SPDX-License-Identifier: MIT

#include "nneval/kernels/operators.h"

#include <algorithm>
#include <climits>
#include <iostream>

#include <cublas_v2.h>
#include <curand.h>

#include "launchers.h"
#include "macros.h"
#include "operators-inl.h"

namespace nneval::kernels::ops {

using runtime::DType;
using runtime::Error;
using runtime::ErrorCode;
using runtime::Shape;

namespace {
// Anonymous namespace for file-internal helper functions.

[[noreturn]] void fail(const char *op, const std::string &what) {
  throw Error(ErrorCode::kInvalidArgument, std::string(op) + ": " + what);
}

void check_device(const char *op, const Device &device, const View &view) {
  if (view.device() != device) {
    fail(op, "view " + view.to_string() + " lives on device " +
                 std::to_string(view.device().index()) +
                 " but the stream is on device " +
                 std::to_string(device.index()));
  }
}

void check_device(const char *op, const Stream &stream, const View &view) {
  check_device(op, stream.device(), view);
}

void check_dtype(const char *op, const View &view, DType expected,
                 const char *role) {
  if (view.dtype() != expected) {
    fail(op, std::string(role) + " must be " + runtime::dtype_name(expected) +
                 ", got " + runtime::dtype_name(view.dtype()));
  }
}

void check_dense(const char *op, const View &view, const char *role) {
  if (!view.is_dense()) {
    fail(op, std::string(role) + " " + view.to_string() + " must be dense");
  }
}

/**
 * @brief Narrows a 64-bit size or stride to the `int` the kernels take.
 */
int narrow(const char *op, int64_t value, const char *what) {
  if (value > INT_MAX || value < INT_MIN) {
    fail(op, std::string(what) + " " + std::to_string(value) +
                 " does not fit the 32-bit kernel descriptors");
  }
  return static_cast<int>(value);
}

std::vector<int> narrow_all(const char *op, const std::vector<int64_t> &values,
                            const char *what) {
  std::vector<int> out(values.size());
  for (size_t i = 0; i < values.size(); ++i) {
    out[i] = narrow(op, values[i], what);
  }
  return out;
}

} // namespace

//===----------------------------------------------------------------------===//
// Host <-> Device Data Transfer
//===----------------------------------------------------------------------===//

template DeviceBuffer upload<float>(const Device &, const std::vector<float> &);
template DeviceBuffer upload<int32_t>(const Device &,
                                      const std::vector<int32_t> &);
template DeviceBuffer upload<uint8_t>(const Device &,
                                      const std::vector<uint8_t> &);

template std::vector<float> download<float>(const DeviceBuffer &);
template std::vector<int32_t> download<int32_t>(const DeviceBuffer &);
template std::vector<uint8_t> download<uint8_t>(const DeviceBuffer &);

//===----------------------------------------------------------------------===//
// Layout
//===----------------------------------------------------------------------===//

void copy(const Stream &stream, const View &input, const View &output) {
  const char *op = "copy";
  check_device(op, stream, input);
  check_device(op, stream, output);
  if (input.dtype() != output.dtype()) {
    fail(op, std::string("dtype mismatch: ") +
                 runtime::dtype_name(input.dtype()) + " vs " +
                 runtime::dtype_name(output.dtype()));
  }
  if (input.shape() != output.shape()) {
    fail(op, "shape mismatch: " + runtime::to_string(input.shape()) + " vs " +
                 runtime::to_string(output.shape()));
  }
  if (output.numel() == 0)
    return;

  void *out_ptr = output.mutable_data();

  // -------- Fast path for two dense layouts --------
  if (input.is_dense() && output.is_dense()) {
    size_t bytes = output.numel() * runtime::dtype_size(output.dtype());
    NNEVAL_CUDA_CHECK(cudaMemcpyAsync(out_ptr, input.data(), bytes,
                                      cudaMemcpyDeviceToDevice,
                                      stream.inner()));
    return;
  }

  // -------- Generic strided path --------
  const int rank = static_cast<int>(input.ndim());
  const int size = narrow(op, input.numel(), "element count");
  std::vector<int> in_strides = narrow_all(op, input.strides(), "input stride");
  std::vector<int> out_strides =
      narrow_all(op, output.strides(), "output stride");
  std::vector<int> dense =
      narrow_all(op, runtime::dense_strides(input.shape()), "dense stride");

  Status status;
  switch (input.dtype()) {
  case DType::Float32:
    status = strided_copy_float(stream.inner(), rank, size, in_strides.data(),
                                out_strides.data(), dense.data(),
                                input.data<float>(),
                                static_cast<float *>(out_ptr));
    break;
  case DType::Int32:
    status = strided_copy_int(stream.inner(), rank, size, in_strides.data(),
                              out_strides.data(), dense.data(),
                              input.data<int32_t>(),
                              static_cast<int32_t *>(out_ptr));
    break;
  case DType::UInt8:
    status = strided_copy_byte(stream.inner(), rank, size, in_strides.data(),
                               out_strides.data(), dense.data(),
                               input.data<uint8_t>(),
                               static_cast<uint8_t *>(out_ptr));
    break;
  }
  status.throw_if_error();
}

//===----------------------------------------------------------------------===//
// Indexing
//===----------------------------------------------------------------------===//

void gather(const Stream &stream, const View &indices, const View &input,
            const View &output) {
  const char *op = "gather";
  check_device(op, stream, indices);
  check_device(op, stream, input);
  check_device(op, stream, output);
  check_dtype(op, indices, DType::Int32, "indices");
  check_dtype(op, input, DType::Float32, "input");
  check_dtype(op, output, DType::Float32, "output");
  if (indices.ndim() != 1) {
    fail(op, "indices must be 1-D, got " + indices.to_string());
  }
  check_dense(op, indices, "indices");
  check_dense(op, input, "input");
  check_dense(op, output, "output");
  if (output.numel() != indices.numel()) {
    fail(op, "output holds " + std::to_string(output.numel()) +
                 " elements but " + std::to_string(indices.numel()) +
                 " indices were given");
  }

  const int count = narrow(op, indices.numel(), "index count");
  gather_float(stream.inner(), count, indices.data<int>(), input.data<float>(),
               output.mutable_data<float>())
      .throw_if_error();
}

void gather_axis1(const Stream &stream, const View &input, const View &indices,
                  const View &output) {
  const char *op = "gather_axis1";
  check_device(op, stream, input);
  check_device(op, stream, indices);
  check_device(op, stream, output);
  check_dtype(op, input, DType::Float32, "input");
  check_dtype(op, output, DType::Float32, "output");
  if (input.ndim() != 2) {
    fail(op, "input must be 2-D, got " + input.to_string());
  }
  if (indices.ndim() != 1) {
    fail(op, "indices must be 1-D, got " + indices.to_string());
  }
  check_dense(op, indices, "indices");
  check_dense(op, output, "output");
  const Shape expected = {input.dim(0), indices.numel()};
  if (output.shape() != expected) {
    fail(op, "output shape " + runtime::to_string(output.shape()) +
                 " does not match expected " + runtime::to_string(expected));
  }

  const int batch_size = narrow(op, input.dim(0), "batch size");
  const int input_size = narrow(op, input.dim(1), "input size");
  const int batch_stride = narrow(op, input.strides()[0], "batch stride");
  const int elem_stride = narrow(op, input.strides()[1], "element stride");
  const int index_count = narrow(op, indices.numel(), "index count");

  Status status;
  switch (indices.dtype()) {
  case DType::Float32:
    status = gather_2d_axis1_float_float(
        stream.inner(), batch_size, input_size, batch_stride, elem_stride,
        index_count, input.data<float>(), indices.data<float>(),
        output.mutable_data<float>());
    break;
  case DType::Int32:
    status = gather_2d_axis1_float_int(
        stream.inner(), batch_size, input_size, batch_stride, elem_stride,
        index_count, input.data<float>(), indices.data<int>(),
        output.mutable_data<float>());
    break;
  default:
    fail(op, std::string("indices must be Float32 or Int32, got ") +
                 runtime::dtype_name(indices.dtype()));
  }
  status.throw_if_error();
}

//===----------------------------------------------------------------------===//
// Quantization
//===----------------------------------------------------------------------===//

void quantize(const Stream &stream, const View &input, const View &output,
              const QuantizeParams &params) {
  const char *op = "quantize";
  check_device(op, stream, input);
  check_device(op, stream, output);
  check_dtype(op, input, DType::Float32, "input");
  check_dtype(op, output, DType::UInt8, "output");
  check_dense(op, input, "input");
  check_dense(op, output, "output");
  if (input.numel() != output.numel()) {
    fail(op, "element count mismatch: " + std::to_string(input.numel()) +
                 " vs " + std::to_string(output.numel()));
  }

  const int length = narrow(op, input.numel(), "length");
  kernels::quantize(stream.inner(), length, input.data<float>(),
                    output.mutable_data<uint8_t>(), params)
      .throw_if_error();
}

void unquantize(const Stream &stream, const View &input, const View &output,
                const QuantizeParams &params) {
  const char *op = "unquantize";
  check_device(op, stream, input);
  check_device(op, stream, output);
  check_dtype(op, input, DType::UInt8, "input");
  check_dtype(op, output, DType::Float32, "output");
  check_dense(op, input, "input");
  check_dense(op, output, "output");
  if (input.numel() != output.numel()) {
    fail(op, "element count mismatch: " + std::to_string(input.numel()) +
                 " vs " + std::to_string(output.numel()));
  }

  const int length = narrow(op, input.numel(), "length");
  kernels::unquantize(stream.inner(), length, input.data<uint8_t>(),
                      output.mutable_data<float>(), params)
      .throw_if_error();
}

//===----------------------------------------------------------------------===//
// External Libraries
//===----------------------------------------------------------------------===//

void matmul(const BlasHandle &blas, const View &a, const View &b,
            const View &c) {
  const char *op = "matmul";
  for (const View *v : {&a, &b, &c}) {
    check_device(op, blas.device(), *v);
    check_dtype(op, *v, DType::Float32, "operand");
    check_dense(op, *v, "operand");
    if (v->ndim() != 2) {
      fail(op, "operands must be 2-D, got " + v->to_string());
    }
  }

  const int M = narrow(op, a.dim(0), "rows");
  const int K = narrow(op, a.dim(1), "inner dimension");
  const int N = narrow(op, b.dim(1), "columns");
  if (b.dim(0) != K) {
    fail(op, "inner dimensions must match for matrix multiplication. "
             "a.shape=" +
                 runtime::to_string(a.shape()) +
                 ", b.shape=" + runtime::to_string(b.shape()));
  }
  if (c.dim(0) != M || c.dim(1) != N) {
    fail(op, "output shape " + runtime::to_string(c.shape()) +
                 " does not match [" + std::to_string(M) + ", " +
                 std::to_string(N) + "]");
  }

  float *c_ptr = c.mutable_data<float>();
  if (M == 0 || N == 0)
    return;
  if (K == 0) {
    NNEVAL_CUDA_CHECK(cudaMemsetAsync(c_ptr, 0,
                                      static_cast<size_t>(M) * N * sizeof(float),
                                      blas.stream()));
    return;
  }

  // cuBLAS is column-major. A row-major matrix is its column-major transpose,
  // so computing C^T = B^T * A^T in column-major yields row-major C = A * B.
  const float alpha = 1.0f;
  const float beta = 0.0f;
  NNEVAL_CUBLAS_CHECK(cublasSgemm(blas.inner(), CUBLAS_OP_N, CUBLAS_OP_N, N, M,
                                  K, &alpha, b.data<float>(), N,
                                  a.data<float>(), K, &beta, c_ptr, N));
}

void fill_uniform(const RandomGenerator &rng, const View &view, float from,
                  float to) {
  const char *op = "fill_uniform";
  check_device(op, rng.device(), view);
  check_dtype(op, view, DType::Float32, "view");
  check_dense(op, view, "view");
  if (view.numel() == 0)
    return;

  float *data = view.mutable_data<float>();
  const size_t n = static_cast<size_t>(view.numel());

  // cuRAND yields values in (0, 1]; scale and shift them onto (from, to].
  NNEVAL_CURAND_CHECK(curandGenerateUniform(rng.inner(), data, n));
  NNEVAL_CUDA_CHECK(detail::launch_scale_kernel(rng.stream(), data,
                                                to - from, from, n));
}

//===----------------------------------------------------------------------===//
// Utility and Debugging Functions
//===----------------------------------------------------------------------===//

namespace {

/**
 * @brief Internal helper to print host data for a specific type.
 */
template <typename T>
void print_data(const std::vector<T> &host_data, const Shape &shape) {
  std::cout << "  Data:" << std::endl << "  ";

  // Limit the number of printed elements to avoid flooding the console.
  size_t print_limit = std::min((size_t)100, host_data.size());
  for (size_t i = 0; i < print_limit; ++i) {
    // Print bytes as numbers, not characters.
    std::cout << +host_data[i] << " ";
    if (shape.size() > 1 && (i + 1) % shape.back() == 0) {
      std::cout << std::endl << "  ";
    }
  }

  if (host_data.size() > print_limit) {
    std::cout << "... (" << host_data.size() - print_limit
              << " more elements)" << std::endl;
  }
  if (print_limit > 0) {
    std::cout << std::endl;
  }
}

} // namespace

void print_view(const Stream &stream, const View &view,
                const std::string &name) {
  if (!name.empty()) {
    std::cout << "View: " << name << std::endl;
  }
  std::cout << "  " << view.to_string() << ", Device: CUDA:"
            << view.device().index() << std::endl;

  // Gather the view into a dense staging buffer so strided layouts print in
  // logical order.
  const size_t bytes = view.numel() * runtime::dtype_size(view.dtype());
  DeviceBuffer staging = view.device().allocate(bytes);
  copy(stream, view, View::dense(staging, view.dtype(), view.shape()));
  stream.synchronize();

  switch (view.dtype()) {
  case DType::Float32:
    print_data(download<float>(staging), view.shape());
    break;
  case DType::Int32:
    print_data(download<int32_t>(staging), view.shape());
    break;
  case DType::UInt8:
    print_data(download<uint8_t>(staging), view.shape());
    break;
  }

  std::cout << "-----------------------------------" << std::endl;
}

} // namespace nneval::kernels::ops
