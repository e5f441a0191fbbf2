// Repository: stimkit
// Component: MoviePlayer
// Purpose: Consumer-facing movie player built on MovieStreamReader.
// Copyright (c) 2025 stimkit contributors

#include "stimkit/movie/MoviePlayer.hpp"

#include <algorithm>
#include <chrono>
#include <cmath>
#include <sstream>
#include <thread>
#include <utility>

#include "stimkit/movie/MovieErrors.hpp"
#include "stimkit/movie/MovieTiming.hpp"
#include "stimkit/util/Logger.hpp"

namespace stimkit::movie {

using stimkit::util::Logger;

namespace {

void RequireFinite(double value, const char* parameter) {
  if (!std::isfinite(value)) {
    throw TypeMismatchError(parameter);
  }
}

}  // namespace

MoviePlayer::MoviePlayer(PlayerConfig config, DecoderFactory decoder_factory,
                         std::shared_ptr<timing::ExperimentClock> clock)
    : config_(std::move(config)),
      decoder_factory_(std::move(decoder_factory)),
      clock_(std::move(clock)) {
  if (!decoder_factory_) {
    decoder_factory_ = MakeFFmpegDecoderFactory();
  }
  if (!clock_) {
    clock_ = timing::MakeSystemExperimentClock();
  }
}

MoviePlayer::~MoviePlayer() {
  ShutdownReader();
  if (handle_) {
    handle_->Close();
  }
}

void MoviePlayer::AssertLoaded(const char* operation) const {
  if (!handle_) {
    throw NotLoadedError(operation);
  }
}

void MoviePlayer::ShutdownReader() {
  if (!reader_) return;
  reader_->Shutdown();
  reader_->Join();
  reader_.reset();
}

// =============================================================================
// Loading
// =============================================================================

void MoviePlayer::Load(const std::string& path) {
  Unload();
  filename_ = path;
  Logger::Info("[MoviePlayer] Loading: " + path);
  Start();
  status_ = PlaybackStatus::kNotStarted;
}

void MoviePlayer::Unload() {
  if (!handle_) return;

  ShutdownReader();
  handle_->Close();
  handle_.reset();

  Logger::Info("[MoviePlayer] Unloaded: " + filename_);
  filename_.clear();
  last_frame_ = MovieFrame{};
  stream_time_ = 0.0;
  recording_time_ = 0.0;
  recording_bytes_ = 0;
}

void MoviePlayer::WarmUp(IDecoderHandle& handle) {
  const auto deadline = std::chrono::steady_clock::now() + config_.warmup_timeout;
  int64_t pulls = 0;

  while (true) {
    DecoderPull pull = handle.GetFrame();
    ++pulls;
    if (pull.status == PullStatus::kFrame) {
      break;
    }
    if (pull.status == PullStatus::kEndOfStream) {
      throw StreamOpenError("No frames could be decoded from movie: " + filename_);
    }
    if (std::chrono::steady_clock::now() >= deadline) {
      throw StreamOpenError("Timed out waiting for the first frame of movie: " +
                            filename_);
    }
    std::this_thread::sleep_for(config_.warmup_poll_interval);
  }

  Logger::Debug("[MoviePlayer] warm-up pulls=" + std::to_string(pulls));
}

void MoviePlayer::Start() {
  if (handle_) {
    Logger::Debug("[MoviePlayer] Start ignored; stream already open");
    return;
  }
  if (filename_.empty()) {
    throw StreamOpenError("No movie file set; call Load() first");
  }

  std::unique_ptr<IDecoderHandle> handle = decoder_factory_();
  if (!handle || !handle->Open(filename_, config_.decoder_options)) {
    throw StreamOpenError("Failed to open movie: " + filename_);
  }

  // Pull one frame so metadata is populated, then park at the start.
  handle->SetMute(true);
  handle->SetPause(false);
  try {
    WarmUp(*handle);
  } catch (const StreamOpenError&) {
    handle->Close();
    throw;
  }
  handle->SetPause(true);
  if (!handle->Seek(0.0, false)) {
    Logger::Warn("[MoviePlayer] Rewind after warm-up failed: " + filename_);
  }
  handle->SetMute(false);

  last_frame_ = MovieFrame{};
  status_ = PlaybackStatus::kNotStarted;

  const StreamMetadata metadata = handle->GetMetadata();
  handle_ = std::move(handle);
  reader_ = std::make_unique<MovieStreamReader>(handle_.get(), config_);
  reader_->Start();

  std::ostringstream oss;
  oss << "[MoviePlayer] Started: " << filename_ << " " << metadata.frame_size.width
      << "x" << metadata.frame_size.height << " @ " << metadata.frame_rate.num << "/"
      << metadata.frame_rate.den << " fps, duration=" << metadata.duration_sec
      << "s, lib=" << metadata.movie_lib;
  Logger::Info(oss.str());
}

// =============================================================================
// Transport
// =============================================================================

void MoviePlayer::Play() {
  AssertLoaded("Play");
  reader_->Play();
  status_ = PlaybackStatus::kPlaying;
}

bool MoviePlayer::Pause() {
  AssertLoaded("Pause");
  reader_->Pause();
  status_ = PlaybackStatus::kPaused;
  return false;
}

void MoviePlayer::Stop() {
  if (!handle_) {
    throw NotOpenedError();
  }

  ShutdownReader();
  handle_->Close();
  handle_.reset();
  status_ = PlaybackStatus::kStopped;
  Logger::Info("[MoviePlayer] Stopped: " + filename_);
}

double MoviePlayer::Seek(double timestamp) {
  AssertLoaded("Seek");
  RequireFinite(timestamp, "timestamp");

  bool ok = false;
  double pts = 0.0;
  MovieStreamReader* reader = reader_.get();
  reader_->RunOnDecoder([&](IDecoderHandle& decoder) {
    ok = decoder.Seek(timestamp, false);
    // Frames decoded before the seek must never reach the consumer.
    reader->DiscardQueuedFrames();
    pts = decoder.GetPresentationTime();
  });
  last_frame_ = MovieFrame{};

  if (!ok) {
    Logger::Warn("[MoviePlayer] Seek to " + std::to_string(timestamp) +
                 "s failed; pts=" + std::to_string(pts));
  } else {
    Logger::Info("[MoviePlayer] Seek target=" + std::to_string(timestamp) +
                 "s pts=" + std::to_string(pts));
  }
  return pts;
}

double MoviePlayer::Rewind(double seconds) {
  AssertLoaded("Rewind");
  RequireFinite(seconds, "seconds");
  return Seek(DecoderPts() - seconds);
}

double MoviePlayer::FastForward(double seconds) {
  AssertLoaded("FastForward");
  RequireFinite(seconds, "seconds");
  return Seek(DecoderPts() + seconds);
}

void MoviePlayer::Replay(bool auto_start) {
  const std::string path = filename_;
  Stop();
  Logger::Info("[MoviePlayer] Replay: " + path);
  Load(path);
  if (auto_start) {
    Play();
  }
  Start();
}

// =============================================================================
// Frames
// =============================================================================

bool MoviePlayer::EnqueueFrame(bool block, double abs_time) {
  std::optional<StreamData> entry = reader_->GetRecentFrame();

  // Wait only while a frame can still arrive: reader alive and asked to play.
  while (!entry && block && reader_->IsRunning() &&
         reader_->RequestedTransport() == MovieStreamReader::TransportRequest::kPlay) {
    std::this_thread::sleep_for(config_.consumer_poll_interval);
    entry = reader_->GetRecentFrame();
  }
  if (!entry) {
    // The reader may have published its last frame just before exiting.
    entry = reader_->GetRecentFrame();
  }
  if (!entry) {
    return false;
  }

  stream_time_ = entry->status.stream_time();
  recording_time_ = entry->status.recording_time();
  recording_bytes_ = entry->status.recording_bytes();
  last_frame_ = std::move(entry->frame);
  last_frame_.abs_time = abs_time;
  return true;
}

const MovieFrame& MoviePlayer::GetMovieFrame(double abs_time, bool block) {
  AssertLoaded("GetMovieFrame");
  RequireFinite(abs_time, "abs_time");
  EnqueueFrame(block, abs_time);
  return last_frame_;
}

// =============================================================================
// Metadata and timing
// =============================================================================

double MoviePlayer::DecoderPts() const {
  double pts = 0.0;
  reader_->RunOnDecoder(
      [&](IDecoderHandle& decoder) { pts = decoder.GetPresentationTime(); });
  return pts;
}

StreamMetadata MoviePlayer::GetMetadata() const {
  AssertLoaded("GetMetadata");
  StreamMetadata metadata;
  reader_->RunOnDecoder(
      [&](IDecoderHandle& decoder) { metadata = decoder.GetMetadata(); });
  metadata.media_path = filename_;
  return metadata;
}

double MoviePlayer::Pts() const {
  if (!handle_) {
    return -1.0;
  }
  return DecoderPts();
}

double MoviePlayer::GetStartAbsTime() const {
  AssertLoaded("GetStartAbsTime");
  return clock_->GetExperimentTime() - DecoderPts();
}

double MoviePlayer::MovieToAbsTime(double movie_time) const {
  AssertLoaded("MovieToAbsTime");
  RequireFinite(movie_time, "movie_time");
  return GetStartAbsTime() + movie_time;
}

double MoviePlayer::AbsToMovieTime(double abs_time) const {
  AssertLoaded("AbsToMovieTime");
  RequireFinite(abs_time, "abs_time");
  return abs_time - GetStartAbsTime();
}

double MoviePlayer::FrameInterval() const {
  return GetMetadata().FrameInterval();
}

double MoviePlayer::MovieTimeFromFrameIndex(int64_t frame_index) const {
  AssertLoaded("MovieTimeFromFrameIndex");
  return ::stimkit::movie::MovieTimeFromFrameIndex(frame_index, FrameInterval());
}

int64_t MoviePlayer::FrameIndexFromMovieTime(double movie_time) const {
  AssertLoaded("FrameIndexFromMovieTime");
  RequireFinite(movie_time, "movie_time");
  return ::stimkit::movie::FrameIndexFromMovieTime(movie_time, FrameInterval());
}

double MoviePlayer::GetNextFrameAbsTime() const {
  if (!handle_) {
    return -1.0;
  }
  const int64_t next_index = std::max<int64_t>(FrameIndex(), -1) + 1;
  return MovieToAbsTime(MovieTimeFromFrameIndex(next_index));
}

double MoviePlayer::GetPercentageComplete() const {
  AssertLoaded("GetPercentageComplete");
  const double duration = GetMetadata().duration_sec;
  if (duration <= 0.0) {
    return 0.0;
  }
  return std::clamp(DecoderPts() / duration * 100.0, 0.0, 100.0);
}

// =============================================================================
// Audio
// =============================================================================

bool MoviePlayer::IsMuted() const {
  AssertLoaded("IsMuted");
  bool muted = false;
  reader_->RunOnDecoder([&](IDecoderHandle& decoder) { muted = decoder.GetMute(); });
  return muted;
}

void MoviePlayer::SetMuted(bool muted) {
  AssertLoaded("SetMuted");
  reader_->RunOnDecoder([&](IDecoderHandle& decoder) { decoder.SetMute(muted); });
}

double MoviePlayer::Volume() const {
  AssertLoaded("Volume");
  double volume = 0.0;
  reader_->RunOnDecoder([&](IDecoderHandle& decoder) { volume = decoder.GetVolume(); });
  return volume;
}

void MoviePlayer::SetVolume(double volume) {
  AssertLoaded("SetVolume");
  RequireFinite(volume, "volume");
  const double clamped = std::clamp(volume, 0.0, 1.0);
  reader_->RunOnDecoder([&](IDecoderHandle& decoder) { decoder.SetVolume(clamped); });
}

double MoviePlayer::VolumeUp(double amount) {
  SetVolume(Volume() + amount);
  return Volume();
}

double MoviePlayer::VolumeDown(double amount) {
  SetVolume(Volume() - amount);
  return Volume();
}

// =============================================================================
// Status
// =============================================================================

PlaybackStatus MoviePlayer::Status() const {
  if (status_ == PlaybackStatus::kPlaying && reader_ &&
      reader_->ReachedEndOfStream()) {
    return PlaybackStatus::kFinished;
  }
  return status_;
}

bool MoviePlayer::IsPaused() const {
  AssertLoaded("IsPaused");
  bool paused = false;
  reader_->RunOnDecoder([&](IDecoderHandle& decoder) { paused = decoder.GetPause(); });
  return paused;
}

}  // namespace stimkit::movie
