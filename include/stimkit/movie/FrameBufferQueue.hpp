// Repository: stimkit
// Component: FrameBufferQueue
// Purpose: Bounded, never-blocking hand-off of decoded frames from the
//          stream reader thread to the experiment thread.
// Copyright (c) 2025 stimkit contributors

#ifndef STIMKIT_MOVIE_FRAME_BUFFER_QUEUE_HPP_
#define STIMKIT_MOVIE_FRAME_BUFFER_QUEUE_HPP_

#include <cstddef>
#include <cstdint>
#include <deque>
#include <mutex>
#include <optional>

#include "stimkit/movie/StreamData.hpp"

namespace stimkit::movie {

// FrameBufferQueue holds at most Capacity() entries in FIFO order.
//
// Producer (stream reader): TryPut() never blocks. When the queue is full the
// entry is discarded (not retained anywhere) and DropsTotal() is bumped;
// queued entries are never overwritten. At most `capacity` frames of
// staleness are tolerated in exchange for an unthrottled decoder.
//
// Consumer (player): TryGet() never blocks; callers that need to wait poll
// it with a short sleep.
//
// Thread safety: all public methods are safe to call from any thread.
class FrameBufferQueue {
 public:
  explicit FrameBufferQueue(std::size_t capacity = 1);

  FrameBufferQueue(const FrameBufferQueue&) = delete;
  FrameBufferQueue& operator=(const FrameBufferQueue&) = delete;

  // Returns false (and drops `entry`) if the queue is full.
  bool TryPut(StreamData entry);

  // Pops the oldest entry, or nullopt when empty.
  std::optional<StreamData> TryGet();

  // Discards every queued entry. Returns the number discarded.
  std::size_t Clear();

  bool IsEmpty() const;
  bool IsFull() const;
  std::size_t Depth() const;
  std::size_t Capacity() const { return capacity_; }

  int64_t TotalPushed() const;
  int64_t TotalPopped() const;
  int64_t DropsTotal() const;

 private:
  const std::size_t capacity_;

  mutable std::mutex mutex_;
  std::deque<StreamData> entries_;

  // Metrics (under mutex_).
  int64_t total_pushed_ = 0;
  int64_t total_popped_ = 0;
  int64_t drops_total_ = 0;
};

}  // namespace stimkit::movie

#endif  // STIMKIT_MOVIE_FRAME_BUFFER_QUEUE_HPP_
