// nneval/runtime/backend/cuda/src/stream.cc
//
// Implements the stream and event wrappers, including the bookkeeping that
// lets elapsed-time queries reject events recorded out of order.
//
// Author: NNEval Team
// Date: 2026-03-02
// Copyright: (c) 2026 NNEval Project. All rights reserved.
// SPDX-License-Identifier: MIT

#include "nneval/runtime/stream.h"

#include <atomic>
#include <string>

#include <cuda_runtime.h>

#include "macros.h"
#include "nneval/runtime/status.h"

namespace nneval::runtime {

namespace {

uint64_t next_stream_id() {
  static std::atomic<uint64_t> counter{0};
  return ++counter;
}

} // namespace

//===----------------------------------------------------------------------===//
// Stream
//===----------------------------------------------------------------------===//

Stream::Stream(const Device &device) : device_(device), id_(next_stream_id()) {
  device_.make_current();
  NNEVAL_CUDA_CHECK(cudaStreamCreate(&stream_));
}

Stream::~Stream() {
  if (stream_) {
    NNEVAL_CUDA_WARN(cudaStreamDestroy(stream_));
  }
}

Stream::Stream(Stream &&other) noexcept
    : device_(other.device_), stream_(other.stream_), id_(other.id_),
      next_sequence_(other.next_sequence_) {
  other.stream_ = nullptr;
  other.id_ = 0;
}

Stream &Stream::operator=(Stream &&other) noexcept {
  if (this != &other) {
    if (stream_) {
      NNEVAL_CUDA_WARN(cudaStreamDestroy(stream_));
    }
    device_ = other.device_;
    stream_ = other.stream_;
    id_ = other.id_;
    next_sequence_ = other.next_sequence_;
    other.stream_ = nullptr;
    other.id_ = 0;
  }
  return *this;
}

void Stream::synchronize() const {
  NNEVAL_CUDA_CHECK(cudaStreamSynchronize(stream_));
}

bool Stream::is_idle() const {
  cudaError_t err = cudaStreamQuery(stream_);
  if (err == cudaErrorNotReady) {
    return false;
  }
  NNEVAL_CUDA_CHECK(err);
  return true;
}

void Stream::record(Event &event) {
  if (event.device() != device_) {
    throw Error(ErrorCode::kInvalidArgument,
                "cannot record an event of device " +
                    std::to_string(event.device().index()) +
                    " on a stream of device " +
                    std::to_string(device_.index()));
  }
  NNEVAL_CUDA_CHECK(cudaEventRecord(event.event_, stream_));
  event.stream_id_ = id_;
  event.sequence_ = ++next_sequence_;
}

Event Stream::record_new_event() {
  Event event(device_);
  record(event);
  return event;
}

void Stream::wait(const Event &event) const {
  if (!event.is_recorded()) {
    throw Error(ErrorCode::kInvalidArgument,
                "cannot wait on an event that was never recorded");
  }
  NNEVAL_CUDA_CHECK(cudaStreamWaitEvent(stream_, event.inner(), 0));
}

//===----------------------------------------------------------------------===//
// Event
//===----------------------------------------------------------------------===//

Event::Event(const Device &device) : device_(device) {
  device_.make_current();
  NNEVAL_CUDA_CHECK(cudaEventCreateWithFlags(&event_, cudaEventDefault));
}

Event::~Event() {
  if (event_) {
    NNEVAL_CUDA_WARN(cudaEventDestroy(event_));
  }
}

Event::Event(Event &&other) noexcept
    : device_(other.device_), event_(other.event_),
      stream_id_(other.stream_id_), sequence_(other.sequence_) {
  other.event_ = nullptr;
  other.stream_id_ = 0;
  other.sequence_ = 0;
}

Event &Event::operator=(Event &&other) noexcept {
  if (this != &other) {
    if (event_) {
      NNEVAL_CUDA_WARN(cudaEventDestroy(event_));
    }
    device_ = other.device_;
    event_ = other.event_;
    stream_id_ = other.stream_id_;
    sequence_ = other.sequence_;
    other.event_ = nullptr;
    other.stream_id_ = 0;
    other.sequence_ = 0;
  }
  return *this;
}

bool Event::is_reached() const {
  if (!is_recorded()) {
    throw Error(ErrorCode::kInvalidArgument,
                "is_reached: event was never recorded");
  }
  cudaError_t err = cudaEventQuery(event_);
  if (err == cudaErrorNotReady) {
    return false;
  }
  NNEVAL_CUDA_CHECK(err);
  return true;
}

void Event::synchronize() const { NNEVAL_CUDA_CHECK(cudaEventSynchronize(event_)); }

float Event::elapsed_since(const Event &start) const {
  return elapsed_ms(start, *this);
}

float elapsed_ms(const Event &start, const Event &end) {
  if (!start.is_recorded() || !end.is_recorded()) {
    throw Error(ErrorCode::kInvalidArgument,
                "elapsed_ms: both events must be recorded");
  }
  if (start.stream_id_ != end.stream_id_) {
    throw Error(ErrorCode::kInvalidEventOrder,
                "elapsed_ms: events were recorded on different streams");
  }
  if (start.sequence_ > end.sequence_) {
    throw Error(ErrorCode::kInvalidEventOrder,
                "elapsed_ms: start event was recorded after end event");
  }

  // Blocks until `end` (and therefore `start`) has been reached.
  end.synchronize();

  float ms = 0.0f;
  NNEVAL_CUDA_CHECK(cudaEventElapsedTime(&ms, start.event_, end.event_));
  return ms;
}

} // namespace nneval::runtime
