// Repository: stimkit
// Component: MoviePlayer
// Purpose: Consumer-facing movie player: transport control, movie/experiment
//          time conversion, and the most recently decoded frame.
// Copyright (c) 2025 stimkit contributors

#ifndef STIMKIT_MOVIE_MOVIE_PLAYER_HPP_
#define STIMKIT_MOVIE_MOVIE_PLAYER_HPP_

#include <cstdint>
#include <memory>
#include <string>

#include "stimkit/movie/IDecoderHandle.hpp"
#include "stimkit/movie/MovieFrame.hpp"
#include "stimkit/movie/MovieStreamReader.hpp"
#include "stimkit/movie/PlaybackStatus.hpp"
#include "stimkit/movie/PlayerConfig.hpp"
#include "stimkit/movie/StreamMetadata.hpp"
#include "stimkit/timing/ExperimentClock.h"

namespace stimkit::movie {

// MoviePlayer owns one decoder handle and the MovieStreamReader that drives
// it. The experiment thread calls Load(), Play(), then GetMovieFrame() once
// per display refresh.
//
// Lifecycle:
//   1. Load(path): opens the decoder, pulls a first frame for metadata,
//      rewinds to 0 and starts the reader (paused, status kNotStarted)
//   2. Play() / Pause() / Seek() ...
//   3. Stop(): joins the reader and closes the decoder. There is no resume;
//      Load() (or Replay()) again to continue.
//
// Every decoder call made after the reader has started is routed through
// MovieStreamReader::RunOnDecoder, so the handle is never used by two
// threads at once.
//
// Errors: every transport/timing method except Load()/Start() throws
// NotLoadedError when no decoder handle is open. Stop() throws
// NotOpenedError instead. Errors are raised before any state changes.
//
// Thread safety: not thread-safe; call from a single (experiment) thread.
class MoviePlayer {
 public:
  // A null factory selects FFmpeg decoding; a null clock selects the
  // system experiment clock.
  explicit MoviePlayer(PlayerConfig config = PlayerConfig(),
                       DecoderFactory decoder_factory = nullptr,
                       std::shared_ptr<timing::ExperimentClock> clock = nullptr);
  ~MoviePlayer();

  MoviePlayer(const MoviePlayer&) = delete;
  MoviePlayer& operator=(const MoviePlayer&) = delete;

  // --- Loading ---

  // Loads a movie file, unloading any movie already open. Throws
  // StreamOpenError if the file cannot be decoded.
  void Load(const std::string& path);

  // Stops the reader, closes the decoder and clears cached state.
  // No-op when nothing is loaded.
  void Unload();

  // Opens the decoder for the current file and starts the reader.
  // No-op while a decoder handle is already open.
  void Start();

  // --- Transport ---

  void Play();

  // Requests a pause. Fire-and-forget: returns false because the reader
  // has not yet been observed to honor the request.
  bool Pause();

  void Stop();

  // Absolute seek. Invalidates queued and cached frames; returns the
  // decoder's post-seek presentation time.
  double Seek(double timestamp);
  double Rewind(double seconds = 5.0);
  double FastForward(double seconds = 5.0);

  // Tears down and reloads the same file. Plays immediately if auto_start.
  void Replay(bool auto_start = true);

  // --- Frames ---

  // Returns the most recent frame. With block=true, waits until the reader
  // publishes a new frame (unless playback is paused or the reader has
  // exited); otherwise returns the cached frame when nothing new arrived.
  const MovieFrame& GetMovieFrame(double abs_time, bool block = true);

  // --- Metadata and timing ---

  StreamMetadata GetMetadata() const;

  // Current movie time in seconds; -1.0 when nothing is loaded.
  double Pts() const;

  // Experiment time at which the movie would have started if played
  // continuously from the beginning. Changes with seeks and pauses.
  double GetStartAbsTime() const;
  double MovieToAbsTime(double movie_time) const;
  double AbsToMovieTime(double abs_time) const;
  double MovieTimeFromFrameIndex(int64_t frame_index) const;
  int64_t FrameIndexFromMovieTime(double movie_time) const;
  double FrameInterval() const;
  double GetNextFrameAbsTime() const;
  double GetPercentageComplete() const;

  // Index of the cached frame; -1 before the first frame or after a seek.
  int64_t FrameIndex() const { return last_frame_.frame_index; }

  // Seeking is allowed, so FrameIndex() may jump.
  bool IsSeekable() const { return true; }

  // --- Audio ---

  bool IsMuted() const;
  void SetMuted(bool muted);
  double Volume() const;
  // Clamped to [0.0, 1.0].
  void SetVolume(double volume);
  double VolumeUp(double amount);
  double VolumeDown(double amount);

  // --- Status ---

  // kFinished once the reader has run to the end of the stream while
  // playing; kStopped only after an explicit Stop().
  PlaybackStatus Status() const;
  bool IsLoaded() const { return handle_ != nullptr; }
  bool IsPlaying() const { return Status() == PlaybackStatus::kPlaying; }
  bool IsNotStarted() const { return Status() == PlaybackStatus::kNotStarted; }
  bool IsStopped() const { return Status() == PlaybackStatus::kStopped; }
  bool IsFinished() const { return Status() == PlaybackStatus::kFinished; }
  // Decoder-reported pause state.
  bool IsPaused() const;

  const std::string& Filename() const { return filename_; }
  double StreamTime() const { return stream_time_; }
  double RecordingTime() const { return recording_time_; }
  uint64_t RecordingBytes() const { return recording_bytes_; }

  // Reader diagnostics; nullptr when nothing is loaded.
  const MovieStreamReader* Reader() const { return reader_.get(); }

 private:
  void AssertLoaded(const char* operation) const;
  // Pulls and discards frames until one is decoded, so metadata is known.
  void WarmUp(IDecoderHandle& handle);
  // Moves the next queued frame into last_frame_. False if none arrived.
  bool EnqueueFrame(bool block, double abs_time);
  void ShutdownReader();
  double DecoderPts() const;

  PlayerConfig config_;
  DecoderFactory decoder_factory_;
  std::shared_ptr<timing::ExperimentClock> clock_;

  std::string filename_;
  std::unique_ptr<IDecoderHandle> handle_;
  std::unique_ptr<MovieStreamReader> reader_;

  MovieFrame last_frame_;
  PlaybackStatus status_ = PlaybackStatus::kNotStarted;

  double stream_time_ = 0.0;
  double recording_time_ = 0.0;
  uint64_t recording_bytes_ = 0;
};

}  // namespace stimkit::movie

#endif  // STIMKIT_MOVIE_MOVIE_PLAYER_HPP_
