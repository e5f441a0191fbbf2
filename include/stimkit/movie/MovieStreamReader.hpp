// Repository: stimkit
// Component: MovieStreamReader
// Purpose: Background worker that pulls frames from a decoder handle at the
//          stream's own frame cadence and publishes them into a bounded
//          FrameBufferQueue for the experiment thread.
// Copyright (c) 2025 stimkit contributors

#ifndef STIMKIT_MOVIE_MOVIE_STREAM_READER_HPP_
#define STIMKIT_MOVIE_MOVIE_STREAM_READER_HPP_

#include <atomic>
#include <chrono>
#include <condition_variable>
#include <cstdint>
#include <deque>
#include <exception>
#include <functional>
#include <memory>
#include <mutex>
#include <optional>
#include <thread>

#include "stimkit/movie/FrameBufferQueue.hpp"
#include "stimkit/movie/IDecoderHandle.hpp"
#include "stimkit/movie/PlaybackStatus.hpp"
#include "stimkit/movie/PlayerConfig.hpp"
#include "stimkit/movie/RationalFps.hpp"
#include "stimkit/movie/StreamData.hpp"

namespace stimkit::movie {

// MovieStreamReader drives one decoder handle on its own thread.
//
// State machine (state()):
//   kNotStarted → kPlaying ⇄ kPaused
//   kPlaying → kStopping → kStopped (terminal)
//
// The first loop iteration unpauses the decoder and enters kPlaying once
// (warm start). After that the state follows the transport request slot:
// Play() and Pause() overwrite a single atomic request, so the most recent
// call wins; nothing is queued. Shutdown() is sticky.
//
// Playing: pull a frame. kNotReady → sleep the poll interval and retry.
// On a frame, the poll interval becomes den/num of the metadata frame rate;
// while the rate is still unknown nothing is published and the reader keeps
// the 1 ms warm-up cadence. The frame is stamped (index, metadata) and
// offered to the queue with TryPut and dropped if the queue is full.
// kEndOfStream → kStopping → kStopped.
//
// Paused: keep the decoder paused and sleep; no pulls.
//
// Ownership: the decoder handle is owned by the caller and must outlive the
// reader. Between Start() and the loop exit only the reader thread touches
// it; other threads go through RunOnDecoder().
class MovieStreamReader {
 public:
  enum class TransportRequest { kPause, kPlay };

  MovieStreamReader(IDecoderHandle* decoder, const PlayerConfig& config);
  ~MovieStreamReader();

  MovieStreamReader(const MovieStreamReader&) = delete;
  MovieStreamReader& operator=(const MovieStreamReader&) = delete;

  // Spawns the reader thread. Returns false if it was already started.
  bool Start();

  // --- Transport requests (level-triggered, latest wins) ---
  void Play();
  void Pause();
  void Shutdown();

  // Blocks until the reader thread has exited. No timeout: a decoder stuck
  // inside a blocking call holds the caller here.
  void Join();

  // Executes `op` against the decoder handle on the reader thread, between
  // loop iterations, and blocks until it has run. When the loop is not
  // running (not started, or already exited) `op` runs inline on the caller.
  // Exceptions thrown by `op` propagate to the caller.
  void RunOnDecoder(const std::function<void(IDecoderHandle&)>& op);

  // Pops the oldest published entry, if any (never blocks).
  std::optional<StreamData> GetRecentFrame();

  // Discards queued entries. Used to invalidate frames across a seek.
  std::size_t DiscardQueuedFrames();

  // --- Observability ---

  PlaybackStatus state() const { return state_.load(std::memory_order_acquire); }
  TransportRequest RequestedTransport() const {
    return request_.load(std::memory_order_acquire);
  }
  bool IsShutdownRequested() const {
    return shutdown_.load(std::memory_order_acquire);
  }

  // True after the first successful frame pull, until the loop exits.
  bool IsReady() const { return ready_.load(std::memory_order_acquire); }

  // True between Start() and loop exit.
  bool IsRunning() const;

  // True if the loop ended because the decoder reported end of stream
  // (as opposed to Shutdown()).
  bool ReachedEndOfStream() const {
    return end_of_stream_.load(std::memory_order_acquire);
  }

  // Current poll cadence in seconds.
  double CurrentPollIntervalSec() const {
    return poll_interval_sec_.load(std::memory_order_acquire);
  }

  int64_t FramesPublished() const { return frames_published_.load(std::memory_order_relaxed); }
  int64_t FramesDropped() const { return frames_dropped_.load(std::memory_order_relaxed); }
  int64_t NotReadyRetries() const { return not_ready_retries_.load(std::memory_order_relaxed); }

  const FrameBufferQueue& Queue() const { return queue_; }

  // Poll cadence for a frame rate: exactly den/num seconds for a valid rate,
  // `fallback_sec` while the rate is unknown.
  static double PollIntervalFor(const RationalFps& rate, double fallback_sec);

 private:
  struct PendingCommand {
    const std::function<void(IDecoderHandle&)>* op = nullptr;
    bool done = false;
    std::exception_ptr error;
  };

  void Run();
  // Executes queued RunOnDecoder() operations. Called on the reader thread.
  void DrainCommands();
  // Sleeps up to `seconds`, waking early on any request or queued command.
  void WaitFor(double seconds);
  void Wake();
  // Stamps and publishes one decoded frame. False if the rate is unknown.
  bool Publish(MovieFrame frame, const StreamMetadata& metadata);

  IDecoderHandle* decoder_;
  PlayerConfig config_;
  FrameBufferQueue queue_;

  std::atomic<PlaybackStatus> state_{PlaybackStatus::kNotStarted};
  std::atomic<TransportRequest> request_{TransportRequest::kPause};
  std::atomic<bool> shutdown_{false};
  std::atomic<bool> ready_{false};
  std::atomic<bool> end_of_stream_{false};
  std::atomic<double> poll_interval_sec_;

  std::atomic<int64_t> frames_published_{0};
  std::atomic<int64_t> frames_dropped_{0};
  std::atomic<int64_t> not_ready_retries_{0};

  // Command channel and wake-ups (under command_mutex_).
  mutable std::mutex command_mutex_;
  std::condition_variable wake_cv_;   // reader sleeps here between pulls
  std::condition_variable done_cv_;   // RunOnDecoder callers wait here
  std::deque<std::shared_ptr<PendingCommand>> commands_;
  uint64_t wake_generation_ = 0;
  bool loop_active_ = false;
  bool started_ = false;

  std::thread thread_;
};

}  // namespace stimkit::movie

#endif  // STIMKIT_MOVIE_MOVIE_STREAM_READER_HPP_
