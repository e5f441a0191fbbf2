// Repository: stimkit
// Component: FrameBufferQueue
// Purpose: Bounded, never-blocking hand-off of decoded frames.
// Copyright (c) 2025 stimkit contributors

#include "stimkit/movie/FrameBufferQueue.hpp"

#include <algorithm>
#include <utility>

namespace stimkit::movie {

FrameBufferQueue::FrameBufferQueue(std::size_t capacity)
    : capacity_(std::max<std::size_t>(capacity, 1)) {}

bool FrameBufferQueue::TryPut(StreamData entry) {
  std::lock_guard<std::mutex> lock(mutex_);
  if (entries_.size() >= capacity_) {
    drops_total_++;
    return false;
  }
  entries_.push_back(std::move(entry));
  total_pushed_++;
  return true;
}

std::optional<StreamData> FrameBufferQueue::TryGet() {
  std::lock_guard<std::mutex> lock(mutex_);
  if (entries_.empty()) {
    return std::nullopt;
  }
  StreamData out = std::move(entries_.front());
  entries_.pop_front();
  total_popped_++;
  return out;
}

std::size_t FrameBufferQueue::Clear() {
  std::lock_guard<std::mutex> lock(mutex_);
  const std::size_t discarded = entries_.size();
  entries_.clear();
  return discarded;
}

bool FrameBufferQueue::IsEmpty() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return entries_.empty();
}

bool FrameBufferQueue::IsFull() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return entries_.size() >= capacity_;
}

std::size_t FrameBufferQueue::Depth() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return entries_.size();
}

int64_t FrameBufferQueue::TotalPushed() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return total_pushed_;
}

int64_t FrameBufferQueue::TotalPopped() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return total_popped_;
}

int64_t FrameBufferQueue::DropsTotal() const {
  std::lock_guard<std::mutex> lock(mutex_);
  return drops_total_;
}

}  // namespace stimkit::movie
