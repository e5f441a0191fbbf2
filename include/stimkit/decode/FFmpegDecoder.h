// Repository: stimkit
// Component: FFmpeg Decoder
// Purpose: Production decoder handle using libavformat/libavcodec.
// Copyright (c) 2025 stimkit contributors

#ifndef STIMKIT_DECODE_FFMPEG_DECODER_H_
#define STIMKIT_DECODE_FFMPEG_DECODER_H_

#include <atomic>
#include <chrono>
#include <cstdint>
#include <string>

#include "stimkit/movie/IDecoderHandle.hpp"
#include "stimkit/movie/MovieFrame.hpp"
#include "stimkit/movie/RationalFps.hpp"
#include "stimkit/movie/StreamMetadata.hpp"

// Forward declarations for FFmpeg types (avoids pulling in FFmpeg headers here)
struct AVFormatContext;
struct AVCodecContext;
struct AVFrame;
struct AVPacket;
struct SwsContext;

namespace stimkit::decode {

// DecoderStats tracks decoding performance and errors.
struct DecoderStats {
  uint64_t frames_decoded = 0;
  uint64_t frames_skipped = 0;   // decoded but already late; never presented
  uint64_t decode_errors = 0;
  double average_decode_time_ms = 0.0;
};

// FFmpegDecoder decodes the first video stream of a media file.
//
// Presentation clock:
// - Runs in movie seconds while unpaused, frozen while paused.
// - Seek() rebases it to the seek target.
// - GetFrame() returns the newest decoded frame whose pts is due on the
//   clock. Frames that fell behind are decoded and skipped. kNotReady means
//   the next frame is not due yet.
//
// Output:
// - Native pixel format; raw planes packed with alignment 1.
// - Native size, or DecoderOptions target size via libswscale.
//
// Thread Safety:
// - Not thread-safe: use from a single thread (the stream reader).
//
// Error Handling:
// - Returns false / kEndOfStream on errors with stats updated.
// - Transient read/decode errors are retried on the next pull; a run of
//   kMaxConsecutiveErrors ends the stream.
class FFmpegDecoder : public movie::IDecoderHandle {
 public:
  FFmpegDecoder();
  ~FFmpegDecoder() override;

  FFmpegDecoder(const FFmpegDecoder&) = delete;
  FFmpegDecoder& operator=(const FFmpegDecoder&) = delete;

  bool Open(const std::string& path, const movie::DecoderOptions& options) override;
  void Close() override;
  bool IsOpen() const override { return format_ctx_ != nullptr; }

  movie::DecoderPull GetFrame() override;
  movie::StreamMetadata GetMetadata() const override;
  double GetPresentationTime() const override;
  bool Seek(double timestamp, bool relative) override;

  void SetPause(bool paused) override;
  bool GetPause() const override { return paused_; }
  void SetMute(bool muted) override { muted_ = muted; }
  bool GetMute() const override { return muted_; }
  void SetVolume(double volume) override { volume_ = volume; }
  double GetVolume() const override { return volume_; }

  void SetInterruptFlag(std::atomic<bool>* flag) override;

  const DecoderStats& GetStats() const { return stats_; }

  movie::RationalFps GetVideoRationalFps() const;
  double GetVideoDuration() const;

  static constexpr const char* kMovieLib = "ffmpeg";
  static constexpr int kMaxConsecutiveErrors = 16;

 private:
  bool FindVideoStream();
  bool InitializeCodec();
  // Only when a target size differing from the native size is requested.
  bool InitializeScaler();

  // Reads packets until one video frame is decoded. False on EOF or error.
  bool ReadAndDecodeFrame(movie::MovieFrame& output_frame);
  bool ConvertFrame(AVFrame* av_frame, movie::MovieFrame& output_frame);

  // Seeks to the keyframe at or before `position_sec` and resets decode state.
  bool SeekToSec(double position_sec);

  double PresentationClock() const;
  void RebaseClock(double pts);
  void UpdateStats(double decode_time_ms);

  std::string path_;
  movie::DecoderOptions options_;
  DecoderStats stats_;

  AVFormatContext* format_ctx_ = nullptr;
  AVCodecContext* codec_ctx_ = nullptr;
  AVFrame* frame_ = nullptr;
  AVFrame* scaled_frame_ = nullptr;
  AVPacket* packet_ = nullptr;
  SwsContext* sws_ctx_ = nullptr;

  int video_stream_index_ = -1;
  int output_width_ = 0;
  int output_height_ = 0;
  // Source geometry the scaler context was built for.
  int scaler_src_width_ = 0;
  int scaler_src_height_ = 0;
  int scaler_src_format_ = -1;
  bool eof_reached_ = false;
  bool draining_ = false;  // demuxer hit EOF; flushing codec
  int consecutive_errors_ = 0;

  // Read by the FFmpeg interrupt callback; see SetInterruptFlag().
  std::atomic<bool>* interrupt_flag_ = nullptr;

  // Timing
  int64_t start_time_ = 0;
  double time_base_ = 0.0;

  // One-frame lookahead: decoded but not yet due.
  bool has_pending_frame_ = false;
  movie::MovieFrame pending_frame_;

  // Presentation clock
  bool paused_ = true;
  double clock_base_pts_ = 0.0;
  std::chrono::steady_clock::time_point clock_resumed_at_;

  bool muted_ = false;
  double volume_ = 1.0;
};

// Packs the planes of `frame` into out.color_data (alignment 1) using the
// frame's own width, height and pixel format, and sets out.size to match.
// False when the layout is unsupported.
bool PackFrameImage(const AVFrame* frame, movie::MovieFrame& out);

}  // namespace stimkit::decode

#endif  // STIMKIT_DECODE_FFMPEG_DECODER_H_
