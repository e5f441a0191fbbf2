// Repository: stimkit
// Component: MovieStreamReader
// Purpose: Asynchronous movie frame reader with frame-rate driven polling.
// Copyright (c) 2025 stimkit contributors

#include "stimkit/movie/MovieStreamReader.hpp"

#include <sstream>
#include <utility>

#include "stimkit/movie/MovieTiming.hpp"
#include "stimkit/util/Logger.hpp"

namespace stimkit::movie {

using stimkit::util::Logger;

namespace {

double ToSeconds(std::chrono::microseconds us) {
  return std::chrono::duration<double>(us).count();
}

}  // namespace

MovieStreamReader::MovieStreamReader(IDecoderHandle* decoder,
                                     const PlayerConfig& config)
    : decoder_(decoder),
      config_(config),
      queue_(config.frame_queue_capacity),
      poll_interval_sec_(ToSeconds(config.warmup_poll_interval)) {}

MovieStreamReader::~MovieStreamReader() {
  Shutdown();
  Join();
}

double MovieStreamReader::PollIntervalFor(const RationalFps& rate,
                                          double fallback_sec) {
  return rate.IsValid() ? rate.FrameDurationSec() : fallback_sec;
}

bool MovieStreamReader::Start() {
  std::lock_guard<std::mutex> lock(command_mutex_);
  if (started_ || decoder_ == nullptr) {
    return false;
  }
  started_ = true;
  loop_active_ = true;
  thread_ = std::thread(&MovieStreamReader::Run, this);
  return true;
}

void MovieStreamReader::Play() {
  request_.store(TransportRequest::kPlay, std::memory_order_release);
  Wake();
}

void MovieStreamReader::Pause() {
  request_.store(TransportRequest::kPause, std::memory_order_release);
  Wake();
}

void MovieStreamReader::Shutdown() {
  shutdown_.store(true, std::memory_order_release);
  Wake();
}

void MovieStreamReader::Join() {
  if (thread_.joinable()) {
    thread_.join();
  }
}

bool MovieStreamReader::IsRunning() const {
  std::lock_guard<std::mutex> lock(command_mutex_);
  return loop_active_;
}

void MovieStreamReader::Wake() {
  {
    std::lock_guard<std::mutex> lock(command_mutex_);
    wake_generation_++;
  }
  wake_cv_.notify_all();
}

std::optional<StreamData> MovieStreamReader::GetRecentFrame() {
  return queue_.TryGet();
}

std::size_t MovieStreamReader::DiscardQueuedFrames() {
  return queue_.Clear();
}

// =============================================================================
// RunOnDecoder: single-owner command channel
// =============================================================================

void MovieStreamReader::RunOnDecoder(
    const std::function<void(IDecoderHandle&)>& op) {
  std::unique_lock<std::mutex> lock(command_mutex_);
  if (!loop_active_) {
    // Nobody else owns the handle; holding the lock keeps Start() out.
    op(*decoder_);
    return;
  }

  auto command = std::make_shared<PendingCommand>();
  command->op = &op;
  commands_.push_back(command);
  wake_generation_++;
  wake_cv_.notify_all();
  done_cv_.wait(lock, [&] { return command->done; });
  if (command->error) {
    std::rethrow_exception(command->error);
  }
}

void MovieStreamReader::DrainCommands() {
  std::deque<std::shared_ptr<PendingCommand>> batch;
  {
    std::lock_guard<std::mutex> lock(command_mutex_);
    if (commands_.empty()) return;
    batch.swap(commands_);
  }

  for (auto& command : batch) {
    try {
      (*command->op)(*decoder_);
    } catch (...) {
      // Handed back to the RunOnDecoder caller and rethrown there.
      command->error = std::current_exception();
    }
  }

  {
    std::lock_guard<std::mutex> lock(command_mutex_);
    for (auto& command : batch) {
      command->done = true;
    }
  }
  done_cv_.notify_all();
}

void MovieStreamReader::WaitFor(double seconds) {
  std::unique_lock<std::mutex> lock(command_mutex_);
  const uint64_t generation = wake_generation_;
  wake_cv_.wait_for(lock, std::chrono::duration<double>(seconds), [&] {
    return wake_generation_ != generation || !commands_.empty();
  });
}

// =============================================================================
// Publish: stamp a decoded frame and offer it to the queue
// =============================================================================

bool MovieStreamReader::Publish(MovieFrame frame, const StreamMetadata& metadata) {
  if (!metadata.frame_rate.IsValid()) {
    return false;
  }

  const double frame_interval = metadata.FrameInterval();
  frame.frame_index = FrameIndexFromMovieTime(frame.pts, frame_interval);
  frame.metadata = metadata;
  frame.movie_lib = metadata.movie_lib;

  StreamData entry;
  entry.status = StreamStatus(PlaybackStatus::kPlaying, frame.pts);
  entry.metadata = metadata;
  entry.frame = std::move(frame);

  const int64_t index = entry.frame.frame_index;
  const double pts = entry.frame.pts;
  if (queue_.TryPut(std::move(entry))) {
    frames_published_.fetch_add(1, std::memory_order_relaxed);
  } else {
    frames_dropped_.fetch_add(1, std::memory_order_relaxed);
  }

  if (Logger::DebugEnabled()) {
    std::ostringstream oss;
    oss << "[MovieStreamReader] frame index=" << index << " pts=" << pts
        << " depth=" << queue_.Depth() << " drops=" << queue_.DropsTotal();
    Logger::Debug(oss.str());
  }
  return true;
}

// =============================================================================
// Run: reader thread main loop
// =============================================================================

void MovieStreamReader::Run() {
  const double warmup_sec = ToSeconds(config_.warmup_poll_interval);
  const double paused_sec = ToSeconds(config_.paused_poll_interval);

  decoder_->SetInterruptFlag(&shutdown_);
  ready_.store(false, std::memory_order_release);
  poll_interval_sec_.store(warmup_sec, std::memory_order_release);

  Logger::Info("[MovieStreamReader] ENTER queue_capacity=" +
               std::to_string(queue_.Capacity()));

  PlaybackStatus status = PlaybackStatus::kNotStarted;
  state_.store(status, std::memory_order_release);

  while (status != PlaybackStatus::kStopped) {
    DrainCommands();

    // One-time warm start: unpause the decoder and begin as Playing.
    if (status == PlaybackStatus::kNotStarted) {
      decoder_->SetPause(false);
      status = PlaybackStatus::kPlaying;
      state_.store(status, std::memory_order_release);
      continue;
    }

    status = (request_.load(std::memory_order_acquire) == TransportRequest::kPlay)
                 ? PlaybackStatus::kPlaying
                 : PlaybackStatus::kPaused;
    state_.store(status, std::memory_order_release);

    if (status == PlaybackStatus::kPlaying) {
      if (decoder_->GetPause()) {
        decoder_->SetPause(false);
      }

      DecoderPull pull = decoder_->GetFrame();
      switch (pull.status) {
        case PullStatus::kNotReady:
          not_ready_retries_.fetch_add(1, std::memory_order_relaxed);
          WaitFor(poll_interval_sec_.load(std::memory_order_acquire));
          break;

        case PullStatus::kEndOfStream:
          end_of_stream_.store(true, std::memory_order_release);
          status = PlaybackStatus::kStopping;
          state_.store(status, std::memory_order_release);
          Logger::Info("[MovieStreamReader] End of stream reached");
          break;

        case PullStatus::kFrame: {
          ready_.store(true, std::memory_order_release);
          // Metadata is accurate only once a frame has been pulled.
          const StreamMetadata metadata = decoder_->GetMetadata();
          const double interval = PollIntervalFor(metadata.frame_rate, warmup_sec);
          poll_interval_sec_.store(interval, std::memory_order_release);
          if (!Publish(std::move(pull.frame), metadata)) {
            Logger::Debug("[MovieStreamReader] frame rate not yet known; frame skipped");
          }
          WaitFor(interval);
          break;
        }
      }
    } else {
      if (!decoder_->GetPause()) {
        decoder_->SetPause(true);
      }
      WaitFor(paused_sec);
    }

    if (shutdown_.load(std::memory_order_acquire) ||
        status == PlaybackStatus::kStopping) {
      status = PlaybackStatus::kStopped;
    }
  }

  state_.store(PlaybackStatus::kStopped, std::memory_order_release);
  ready_.store(false, std::memory_order_release);
  decoder_->SetInterruptFlag(nullptr);

  // Hand the decoder back. Commands already queued run here, under the lock,
  // so they cannot overlap an inline RunOnDecoder() from another thread.
  {
    std::lock_guard<std::mutex> lock(command_mutex_);
    loop_active_ = false;
    for (auto& command : commands_) {
      try {
        (*command->op)(*decoder_);
      } catch (...) {
        command->error = std::current_exception();
      }
      command->done = true;
    }
    commands_.clear();
  }
  done_cv_.notify_all();

  std::ostringstream oss;
  oss << "[MovieStreamReader] EXIT reason="
      << (end_of_stream_.load(std::memory_order_acquire) ? "end_of_stream" : "shutdown")
      << " published=" << frames_published_.load(std::memory_order_relaxed)
      << " dropped=" << frames_dropped_.load(std::memory_order_relaxed)
      << " not_ready=" << not_ready_retries_.load(std::memory_order_relaxed);
  Logger::Info(oss.str());
}

}  // namespace stimkit::movie
