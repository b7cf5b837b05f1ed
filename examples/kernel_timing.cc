// examples/kernel_timing.cc
//
// Times the device kernels with stream events. It runs a broadcasting strided
// copy, an axis-1 gather on a policy-head sized problem and a quantize /
// unquantize round trip, then prints the per-launch time of each.
//
// Author: NNEval Team
// Date: 2026-03-09
// Copyright: (c) 2026 NNEval Project. All rights reserved.
// SPDX-License-Identifier: MIT

#include "nneval/kernels/kernels.h"
#include "nneval/kernels/operators.h"
#include "nneval/runtime/device.h"
#include "nneval/runtime/handles.h"
#include "nneval/runtime/status.h"
#include "nneval/runtime/stream.h"
#include "nneval/runtime/view.h"
#include <cstdlib>
#include <iostream>
#include <vector>

using namespace nneval;
using runtime::DType;
using runtime::View;

namespace {

constexpr int kIterations = 128;

/**
 * @brief Prints the mean time per launch between two events.
 */
void report(const char *name, const runtime::Event &start,
            const runtime::Event &end) {
  float ms = runtime::elapsed_ms(start, end);
  std::cout << "  " << name << ": " << ms / kIterations * 1000.0f
            << " us/launch" << std::endl;
}

} // namespace

int main(int argc, char **argv) {
  std::cout << "🚀 Starting NNEval kernel timing!" << std::endl;

  if (runtime::Device::count() == 0) {
    std::cerr << "No CUDA device available." << std::endl;
    return 1;
  }
  const int device_index = argc > 1 ? std::atoi(argv[1]) : 0;

  try {
    runtime::Device device = runtime::Device::open(device_index);
    runtime::Stream stream(device);
    std::cout << "Device " << device.index() << ": " << device.name()
              << std::endl;

    // -------- Strided copy with a broadcast axis --------
    const std::vector<int> in_strides = {64, 8, 0, 2};
    const std::vector<int> out_strides = {24, 8, 4, 1};
    const std::vector<int> dense_strides = {24, 8, 4, 1};
    const int copy_size = 48;
    std::vector<float> copy_input(128);
    for (size_t i = 0; i < copy_input.size(); ++i) {
      copy_input[i] = static_cast<float>(i);
    }
    runtime::DeviceBuffer copy_in = kernels::ops::upload(device, copy_input);
    runtime::DeviceBuffer copy_out =
        device.allocate(copy_size * sizeof(float));

    runtime::Event start = stream.record_new_event();
    for (int i = 0; i < kIterations; ++i) {
      kernels::strided_copy_float(stream.inner(), 4, copy_size,
                                  in_strides.data(), out_strides.data(),
                                  dense_strides.data(),
                                  copy_in.data<float>(),
                                  copy_out.mutable_data<float>())
          .throw_if_error();
    }
    runtime::Event end = stream.record_new_event();
    report("strided_copy_float", start, end);
    kernels::ops::print_view(
        stream, View::dense(copy_out, DType::Float32, {2, 3, 2, 4}),
        "strided copy output");

    // -------- Axis-1 gather on a chess policy shape --------
    const int batch_size = 128;
    const int input_size = 4608;
    const int index_count = 1880;
    runtime::DeviceBuffer gather_in =
        device.allocate(batch_size * input_size * sizeof(float));
    runtime::DeviceBuffer gather_out =
        device.allocate(batch_size * index_count * sizeof(float));
    std::vector<int32_t> indices(index_count);
    for (int q = 0; q < index_count; ++q) {
      indices[q] = (q * 7919) % input_size;
    }
    runtime::DeviceBuffer gather_idx = kernels::ops::upload(device, indices);

    {
      runtime::RandomGenerator rng(stream);
      kernels::ops::fill_uniform(
          rng, View::dense(gather_in, DType::Float32, {batch_size, input_size}),
          -1.0f, 1.0f);
    }

    stream.record(start);
    for (int i = 0; i < kIterations; ++i) {
      kernels::ops::gather_axis1(
          stream,
          View::dense(gather_in, DType::Float32, {batch_size, input_size}),
          View::dense(gather_idx, DType::Int32, {index_count}),
          View::dense(gather_out, DType::Float32, {batch_size, index_count}));
    }
    stream.record(end);
    report("gather_2d_axis1", start, end);

    // -------- Quantize round trip --------
    const int length = batch_size * index_count;
    runtime::DeviceBuffer bytes = device.allocate(length);
    stream.record(start);
    for (int i = 0; i < kIterations; ++i) {
      kernels::quantize(stream.inner(), length, gather_out.data<float>(),
                        bytes.mutable_data<uint8_t>())
          .throw_if_error();
      kernels::unquantize(stream.inner(), length, bytes.data<uint8_t>(),
                          gather_out.mutable_data<float>())
          .throw_if_error();
    }
    stream.record(end);
    report("quantize + unquantize", start, end);

    stream.synchronize();
  } catch (const runtime::Error &e) {
    std::cerr << "Error: " << e.what() << std::endl;
    return 1;
  }

  std::cout << "✅ Timing finished." << std::endl;
  return 0;
}
