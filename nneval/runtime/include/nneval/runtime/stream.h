// nneval/runtime/stream.h
//
// Defines RAII wrappers for CUDA streams and timing events. Work issued on one
// stream runs in issue order; events mark positions in that order and measure
// the time between them.
//
// Author: NNEval Team
// Date: 2026-03-02
// Copyright: (c) 2026 NNEval Project. All rights reserved.
// SPDX-License-Identifier: MIT

#pragma once

#include <cstdint>

#include <cuda_runtime_api.h>

#include "nneval/runtime/device.h"

namespace nneval::runtime {

class Event;

/**
 * @brief An ordered, asynchronous command queue bound to one device.
 *
 * Streams are move-only. Each stream has a process-unique id and counts the
 * events recorded on it, which lets `elapsed_ms` check that two events were
 * recorded in order on the same stream.
 */
class Stream {
public:
  explicit Stream(const Device &device);
  ~Stream();

  Stream(Stream &&other) noexcept;
  Stream &operator=(Stream &&other) noexcept;

  Stream(const Stream &) = delete;
  Stream &operator=(const Stream &) = delete;

  /// Native handle, passed as the first argument of every kernel entry point.
  cudaStream_t inner() const { return stream_; }
  const Device &device() const { return device_; }
  uint64_t id() const { return id_; }

  /**
   * @brief Blocks until all work issued on this stream so far has completed.
   *
   * Asynchronous faults of earlier launches (for example an illegal address
   * caused by an out-of-range gather index) surface here.
   *
   * @throws Error (kLaunchError) carrying the native CUDA error code.
   */
  void synchronize() const;

  /**
   * @brief Returns true if all work issued on this stream has completed.
   */
  bool is_idle() const;

  /**
   * @brief Records `event` at the current tail of this stream.
   *
   * Re-recording an event moves it to the new position.
   */
  void record(Event &event);

  /**
   * @brief Creates an event on this stream's device and records it.
   */
  Event record_new_event();

  /**
   * @brief Makes all future work on this stream wait for `event`.
   *
   * This is the only cross-stream ordering primitive.
   */
  void wait(const Event &event) const;

private:
  Device device_;
  cudaStream_t stream_ = nullptr;
  uint64_t id_ = 0;
  uint64_t next_sequence_ = 0;
};

/**
 * @brief A timing marker recordable on a stream.
 *
 * An event becomes reached once all work issued before it on its stream has
 * completed.
 */
class Event {
public:
  explicit Event(const Device &device);
  ~Event();

  Event(Event &&other) noexcept;
  Event &operator=(Event &&other) noexcept;

  Event(const Event &) = delete;
  Event &operator=(const Event &) = delete;

  cudaEvent_t inner() const { return event_; }
  const Device &device() const { return device_; }
  bool is_recorded() const { return stream_id_ != 0; }

  /**
   * @brief Returns true once all work preceding the record point completed.
   * @throws Error (kInvalidArgument) if the event was never recorded.
   */
  bool is_reached() const;

  /**
   * @brief Blocks until the event is reached.
   */
  void synchronize() const;

  /**
   * @brief Milliseconds elapsed between `start` and this event.
   *
   * Equivalent to `elapsed_ms(start, *this)`.
   */
  float elapsed_since(const Event &start) const;

private:
  friend class Stream;
  friend float elapsed_ms(const Event &start, const Event &end);

  Device device_;
  cudaEvent_t event_ = nullptr;
  uint64_t stream_id_ = 0; ///< 0 while unrecorded; stream ids start at 1.
  uint64_t sequence_ = 0;
};

/**
 * @brief Returns the time in milliseconds between two recorded events.
 *
 * Both events must have been recorded on the same stream, `start` no later
 * than `end`. If `end` has not been reached yet, the call blocks on it before
 * measuring.
 *
 * @throws Error (kInvalidArgument) if either event was never recorded.
 * @throws Error (kInvalidEventOrder) if the events are on different streams or
 *         `start` was recorded after `end`.
 */
float elapsed_ms(const Event &start, const Event &end);

} // namespace nneval::runtime
