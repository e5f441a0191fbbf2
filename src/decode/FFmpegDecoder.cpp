// Repository: stimkit
// Component: FFmpeg Decoder
// Purpose: Production decoder handle using libavformat/libavcodec.
// Copyright (c) 2025 stimkit contributors

#include "stimkit/decode/FFmpegDecoder.h"

#include <algorithm>
#include <memory>
#include <sstream>

#include "stimkit/util/Logger.hpp"

extern "C" {
#include <libavcodec/avcodec.h>
#include <libavformat/avformat.h>
#include <libavutil/dict.h>
#include <libavutil/error.h>
#include <libavutil/frame.h>
#include <libavutil/imgutils.h>
#include <libavutil/log.h>  // For av_log_set_level
#include <libavutil/mem.h>  // av_freep (for av_image_alloc buffer)
#include <libavutil/pixdesc.h>
#include <libswscale/swscale.h>
}

namespace {

using stimkit::util::Logger;

// FFmpeg interrupt callback: return non-zero to abort I/O.
// `opaque` points at the decoder's interrupt_flag_ slot.
int InterruptCallback(void* opaque) {
  auto* slot = static_cast<std::atomic<bool>**>(opaque);
  if (*slot && (*slot)->load(std::memory_order_acquire)) return 1;
  return 0;
}

std::string AvErrorString(int err) {
  char errbuf[AV_ERROR_MAX_STRING_SIZE];
  av_strerror(err, errbuf, sizeof(errbuf));
  return errbuf;
}

// A frame within half a millisecond of the clock counts as due.
constexpr double kDueToleranceSec = 0.0005;

}  // namespace

namespace stimkit::decode {

FFmpegDecoder::FFmpegDecoder() : clock_resumed_at_(std::chrono::steady_clock::now()) {}

FFmpegDecoder::~FFmpegDecoder() {
  Close();
}

bool FFmpegDecoder::Open(const std::string& path, const movie::DecoderOptions& options) {
  if (IsOpen()) {
    Close();
  }
  path_ = path;
  options_ = options;
  Logger::Info("[FFmpegDecoder] Opening: " + path_);

  if (options_.sync != "video") {
    Logger::Warn("[FFmpegDecoder] sync='" + options_.sync +
                 "' not supported; pacing by the video clock");
  }

  // Suppress FFmpeg warnings but keep errors visible
  av_log_set_level(AV_LOG_ERROR);

  format_ctx_ = avformat_alloc_context();
  if (!format_ctx_) {
    Logger::Error("[FFmpegDecoder] Failed to allocate format context");
    return false;
  }

  // Set interrupt callback so av_read_frame etc. abort promptly on shutdown.
  format_ctx_->interrupt_callback.callback = InterruptCallback;
  format_ctx_->interrupt_callback.opaque = &interrupt_flag_;

  // On failure avformat_open_input frees the context and nulls the pointer.
  int ret = avformat_open_input(&format_ctx_, path_.c_str(), nullptr, nullptr);
  if (ret < 0) {
    Logger::Error("[FFmpegDecoder] DECODER_STEP open_input FAILED uri=" + path_ +
                  " err=" + AvErrorString(ret));
    format_ctx_ = nullptr;
    return false;
  }

  ret = avformat_find_stream_info(format_ctx_, nullptr);
  if (ret < 0) {
    Logger::Error("[FFmpegDecoder] DECODER_STEP find_stream_info FAILED uri=" + path_ +
                  " err=" + AvErrorString(ret));
    Close();
    return false;
  }

  if (!FindVideoStream()) {
    Logger::Error("[FFmpegDecoder] DECODER_STEP find_video_stream FAILED uri=" + path_ +
                  " (no video stream)");
    Close();
    return false;
  }

  if (!InitializeCodec()) {
    Logger::Error("[FFmpegDecoder] DECODER_STEP initialize_codec FAILED uri=" + path_);
    Close();
    return false;
  }

  if (!InitializeScaler()) {
    Logger::Error("[FFmpegDecoder] DECODER_STEP initialize_scaler FAILED uri=" + path_);
    Close();
    return false;
  }

  packet_ = av_packet_alloc();
  if (!packet_) {
    Logger::Error("[FFmpegDecoder] DECODER_STEP packet_alloc FAILED uri=" + path_);
    Close();
    return false;
  }

  paused_ = true;
  RebaseClock(0.0);

  const movie::RationalFps fps = GetVideoRationalFps();
  std::ostringstream oss;
  oss << "[FFmpegDecoder] DECODER_STEP open_input OK uri=" << path_ << " "
      << output_width_ << "x" << output_height_ << " @ " << fps.num << "/" << fps.den
      << " fps";
  Logger::Info(oss.str());
  return true;
}

void FFmpegDecoder::SetInterruptFlag(std::atomic<bool>* flag) {
  // The callback reads the slot, so no re-registration is needed.
  interrupt_flag_ = flag;
}

void FFmpegDecoder::Close() {
  if (format_ctx_) {
    Logger::Debug("[FFmpegDecoder] Closing decoder: " + path_);
  }

  if (sws_ctx_) {
    sws_freeContext(sws_ctx_);
    sws_ctx_ = nullptr;
  }

  if (scaled_frame_) {
    // scaled_frame_ buffer was allocated with av_image_alloc(); AVFrame does not own it.
    if (scaled_frame_->data[0]) {
      av_freep(&scaled_frame_->data[0]);
    }
    av_frame_free(&scaled_frame_);
  }

  if (frame_) {
    av_frame_free(&frame_);
  }

  if (packet_) {
    av_packet_free(&packet_);
  }

  if (codec_ctx_) {
    avcodec_free_context(&codec_ctx_);
  }

  if (format_ctx_) {
    avformat_close_input(&format_ctx_);
  }

  video_stream_index_ = -1;
  output_width_ = 0;
  output_height_ = 0;
  scaler_src_width_ = 0;
  scaler_src_height_ = 0;
  scaler_src_format_ = -1;
  eof_reached_ = false;
  draining_ = false;
  consecutive_errors_ = 0;
  has_pending_frame_ = false;
  pending_frame_ = movie::MovieFrame{};
}

// =============================================================================
// Presentation clock
// =============================================================================

double FFmpegDecoder::PresentationClock() const {
  if (paused_) {
    return clock_base_pts_;
  }
  const auto elapsed = std::chrono::steady_clock::now() - clock_resumed_at_;
  return clock_base_pts_ + std::chrono::duration<double>(elapsed).count();
}

void FFmpegDecoder::RebaseClock(double pts) {
  clock_base_pts_ = pts;
  clock_resumed_at_ = std::chrono::steady_clock::now();
}

void FFmpegDecoder::SetPause(bool paused) {
  if (paused == paused_) return;
  if (paused) {
    clock_base_pts_ = PresentationClock();
  } else {
    clock_resumed_at_ = std::chrono::steady_clock::now();
  }
  paused_ = paused;
}

double FFmpegDecoder::GetPresentationTime() const {
  double pts = PresentationClock();
  const double duration = GetVideoDuration();
  if (duration > 0.0) {
    pts = std::min(pts, duration);
  }
  return pts;
}

// =============================================================================
// GetFrame: newest due frame, skipping late ones
// =============================================================================

movie::DecoderPull FFmpegDecoder::GetFrame() {
  movie::DecoderPull result;
  if (!IsOpen()) {
    result.status = movie::PullStatus::kEndOfStream;
    return result;
  }
  if (paused_) {
    return result;  // kNotReady
  }

  const double now = PresentationClock();
  bool have_frame = false;

  while (true) {
    if (!has_pending_frame_) {
      if (eof_reached_) break;
      if (!ReadAndDecodeFrame(pending_frame_)) {
        if (!eof_reached_ && consecutive_errors_ >= kMaxConsecutiveErrors) {
          Logger::Error("[FFmpegDecoder] Too many consecutive decode errors; ending stream uri=" +
                        path_);
          eof_reached_ = true;
        }
        break;
      }
      has_pending_frame_ = true;
    }

    if (pending_frame_.pts > now + kDueToleranceSec) {
      break;  // next frame not due yet; keep it as lookahead
    }

    if (have_frame) {
      stats_.frames_skipped++;
    }
    result.frame = std::move(pending_frame_);
    pending_frame_ = movie::MovieFrame{};
    has_pending_frame_ = false;
    have_frame = true;
  }

  if (have_frame) {
    result.status = movie::PullStatus::kFrame;
  } else if (eof_reached_ && !has_pending_frame_) {
    result.status = movie::PullStatus::kEndOfStream;
  }
  return result;
}

// =============================================================================
// Seeking
// =============================================================================

bool FFmpegDecoder::SeekToSec(double position_sec) {
  if (!format_ctx_ || video_stream_index_ < 0) {
    return false;
  }

  AVStream* stream = format_ctx_->streams[video_stream_index_];
  const int64_t position_us = static_cast<int64_t>(position_sec * 1'000'000.0);
  const int64_t timestamp =
      start_time_ + av_rescale_q(position_us, {1, AV_TIME_BASE}, stream->time_base);

  // Seek to keyframe before the target position (DECODER_STEP: seek)
  int ret = av_seek_frame(format_ctx_, video_stream_index_, timestamp, AVSEEK_FLAG_BACKWARD);
  if (ret < 0) {
    Logger::Error("[FFmpegDecoder] DECODER_STEP seek FAILED position_sec=" +
                  std::to_string(position_sec) + " err=" + AvErrorString(ret));
    return false;
  }

  if (codec_ctx_) {
    avcodec_flush_buffers(codec_ctx_);
  }

  eof_reached_ = false;
  draining_ = false;
  consecutive_errors_ = 0;
  has_pending_frame_ = false;
  pending_frame_ = movie::MovieFrame{};
  return true;
}

bool FFmpegDecoder::Seek(double timestamp, bool relative) {
  if (!IsOpen()) {
    return false;
  }

  double target = relative ? PresentationClock() + timestamp : timestamp;
  target = std::max(target, 0.0);
  const double duration = GetVideoDuration();
  if (duration > 0.0) {
    target = std::min(target, duration);
  }

  if (!SeekToSec(target)) {
    return false;
  }

  // Preroll: decode and discard until the frame covering the target. The
  // first frame at or past the target stays pending for the next pull.
  const double tolerance = GetVideoRationalFps().FrameDurationSec() / 2.0;
  int preroll_count = 0;
  movie::MovieFrame frame;
  while (ReadAndDecodeFrame(frame)) {
    if (frame.pts + tolerance >= target) {
      pending_frame_ = std::move(frame);
      has_pending_frame_ = true;
      break;
    }
    preroll_count++;
  }

  RebaseClock(target);
  Logger::Debug("[FFmpegDecoder] seek target=" + std::to_string(target) +
                " preroll=" + std::to_string(preroll_count));
  return true;
}

// =============================================================================
// Stream info
// =============================================================================

movie::RationalFps FFmpegDecoder::GetVideoRationalFps() const {
  if (!format_ctx_ || video_stream_index_ < 0) return movie::RationalFps{0, 1};

  AVStream* stream = format_ctx_->streams[video_stream_index_];
  // r_frame_rate is the nominal cadence; avg_frame_rate is not authoritative.
  AVRational fps = stream->r_frame_rate;
  if (fps.num <= 0 || fps.den <= 0) {
    fps = stream->avg_frame_rate;
  }
  return movie::RationalFps(static_cast<int64_t>(fps.num), static_cast<int64_t>(fps.den));
}

double FFmpegDecoder::GetVideoDuration() const {
  if (!format_ctx_) return 0.0;

  if (format_ctx_->duration != AV_NOPTS_VALUE) {
    return static_cast<double>(format_ctx_->duration) / AV_TIME_BASE;
  }

  return 0.0;
}

movie::StreamMetadata FFmpegDecoder::GetMetadata() const {
  movie::StreamMetadata metadata;
  metadata.media_path = path_;
  metadata.movie_lib = kMovieLib;
  if (!IsOpen()) {
    return metadata;
  }

  if (const AVDictionaryEntry* title =
          av_dict_get(format_ctx_->metadata, "title", nullptr, 0)) {
    metadata.title = title->value;
  }
  metadata.duration_sec = GetVideoDuration();
  metadata.frame_rate = GetVideoRationalFps();
  metadata.frame_size = movie::FrameSize{output_width_, output_height_};
  if (codec_ctx_) {
    const char* name = av_get_pix_fmt_name(codec_ctx_->pix_fmt);
    metadata.pixel_format = name ? name : "";
  }
  return metadata;
}

// =============================================================================
// Open helpers
// =============================================================================

bool FFmpegDecoder::FindVideoStream() {
  for (unsigned int i = 0; i < format_ctx_->nb_streams; i++) {
    if (format_ctx_->streams[i]->codecpar->codec_type == AVMEDIA_TYPE_VIDEO) {
      video_stream_index_ = static_cast<int>(i);

      AVStream* stream = format_ctx_->streams[i];
      time_base_ = av_q2d(stream->time_base);
      start_time_ = stream->start_time != AV_NOPTS_VALUE ? stream->start_time : 0;

      return true;
    }
  }

  return false;
}

bool FFmpegDecoder::InitializeCodec() {
  AVStream* stream = format_ctx_->streams[video_stream_index_];
  AVCodecParameters* codecpar = stream->codecpar;

  const AVCodec* codec = avcodec_find_decoder(codecpar->codec_id);
  if (!codec) {
    Logger::Error("[FFmpegDecoder] Codec not found: " + std::to_string(codecpar->codec_id));
    return false;
  }

  codec_ctx_ = avcodec_alloc_context3(codec);
  if (!codec_ctx_) {
    Logger::Error("[FFmpegDecoder] Failed to allocate codec context");
    return false;
  }

  if (avcodec_parameters_to_context(codec_ctx_, codecpar) < 0) {
    Logger::Error("[FFmpegDecoder] Failed to copy codec parameters");
    return false;
  }

  if (options_.max_decode_threads > 0) {
    codec_ctx_->thread_count = options_.max_decode_threads;
  }
  codec_ctx_->thread_type = FF_THREAD_FRAME;

  if (avcodec_open2(codec_ctx_, codec, nullptr) < 0) {
    Logger::Error("[FFmpegDecoder] Failed to open codec");
    return false;
  }

  frame_ = av_frame_alloc();
  if (!frame_) {
    Logger::Error("[FFmpegDecoder] Failed to allocate frame");
    return false;
  }

  output_width_ = codec_ctx_->width;
  output_height_ = codec_ctx_->height;
  return true;
}

bool FFmpegDecoder::InitializeScaler() {
  const int src_width = codec_ctx_->width;
  const int src_height = codec_ctx_->height;
  const int dst_width = options_.target_width > 0 ? options_.target_width : src_width;
  const int dst_height = options_.target_height > 0 ? options_.target_height : src_height;

  if (dst_width == src_width && dst_height == src_height) {
    return true;  // native size: frames are copied without scaling
  }

  // Pixel format is unchanged; only the resolution differs.
  const AVPixelFormat format = codec_ctx_->pix_fmt;
  sws_ctx_ = sws_getContext(src_width, src_height, format, dst_width, dst_height, format,
                            SWS_BILINEAR, nullptr, nullptr, nullptr);
  if (!sws_ctx_) {
    Logger::Error("[FFmpegDecoder] Failed to create scaler context");
    return false;
  }

  scaled_frame_ = av_frame_alloc();
  if (!scaled_frame_) {
    Logger::Error("[FFmpegDecoder] Failed to allocate scaled frame");
    return false;
  }

  if (av_image_alloc(scaled_frame_->data, scaled_frame_->linesize, dst_width, dst_height,
                     format, 32) < 0) {
    Logger::Error("[FFmpegDecoder] Failed to allocate scaled frame buffer");
    return false;
  }

  scaled_frame_->width = dst_width;
  scaled_frame_->height = dst_height;
  scaled_frame_->format = format;
  scaler_src_width_ = src_width;
  scaler_src_height_ = src_height;
  scaler_src_format_ = format;

  output_width_ = dst_width;
  output_height_ = dst_height;
  return true;
}

// =============================================================================
// Decode
// =============================================================================

bool FFmpegDecoder::ReadAndDecodeFrame(movie::MovieFrame& output_frame) {
  const auto start_time = std::chrono::steady_clock::now();

  while (true) {
    int ret = avcodec_receive_frame(codec_ctx_, frame_);
    if (ret == 0) {
      const bool ok = ConvertFrame(frame_, output_frame);
      av_frame_unref(frame_);
      if (!ok) {
        stats_.decode_errors++;
        consecutive_errors_++;
        return false;
      }
      consecutive_errors_ = 0;
      UpdateStats(std::chrono::duration<double, std::milli>(
                      std::chrono::steady_clock::now() - start_time)
                      .count());
      return true;
    }
    if (ret == AVERROR_EOF) {
      eof_reached_ = true;
      return false;
    }
    if (ret != AVERROR(EAGAIN)) {
      stats_.decode_errors++;
      consecutive_errors_++;
      return false;
    }

    // Decoder needs input.
    if (draining_) {
      eof_reached_ = true;
      return false;
    }

    ret = av_read_frame(format_ctx_, packet_);
    if (ret == AVERROR_EOF) {
      // Flush frames still buffered in the codec.
      draining_ = true;
      avcodec_send_packet(codec_ctx_, nullptr);
      continue;
    }
    if (ret < 0) {
      stats_.decode_errors++;
      consecutive_errors_++;
      av_packet_unref(packet_);
      return false;
    }

    if (packet_->stream_index != video_stream_index_) {
      av_packet_unref(packet_);
      continue;
    }

    ret = avcodec_send_packet(codec_ctx_, packet_);
    av_packet_unref(packet_);
    if (ret < 0 && ret != AVERROR(EAGAIN)) {
      stats_.decode_errors++;
      consecutive_errors_++;
      return false;
    }
  }
}

bool FFmpegDecoder::ConvertFrame(AVFrame* av_frame, movie::MovieFrame& output_frame) {
  const AVFrame* source = av_frame;
  if (sws_ctx_) {
    // Streams may change geometry or format mid-file; the scaler follows the
    // decoded frame while the destination buffer stays fixed.
    if (av_frame->width != scaler_src_width_ || av_frame->height != scaler_src_height_ ||
        av_frame->format != scaler_src_format_) {
      sws_ctx_ = sws_getCachedContext(
          sws_ctx_, av_frame->width, av_frame->height,
          static_cast<AVPixelFormat>(av_frame->format), scaled_frame_->width,
          scaled_frame_->height, static_cast<AVPixelFormat>(scaled_frame_->format),
          SWS_BILINEAR, nullptr, nullptr, nullptr);
      if (!sws_ctx_) {
        Logger::Error("[FFmpegDecoder] Failed to rebuild scaler context");
        return false;
      }
      scaler_src_width_ = av_frame->width;
      scaler_src_height_ = av_frame->height;
      scaler_src_format_ = av_frame->format;
    }
    sws_scale(sws_ctx_, av_frame->data, av_frame->linesize, 0, av_frame->height,
              scaled_frame_->data, scaled_frame_->linesize);
    source = scaled_frame_;
  }

  if (!PackFrameImage(source, output_frame)) {
    return false;
  }
  output_width_ = output_frame.size.width;
  output_height_ = output_frame.size.height;

  int64_t pts = av_frame->best_effort_timestamp != AV_NOPTS_VALUE
                    ? av_frame->best_effort_timestamp
                    : av_frame->pts;
  output_frame.pts =
      (pts != AV_NOPTS_VALUE) ? static_cast<double>(pts - start_time_) * time_base_ : 0.0;
  output_frame.movie_lib = kMovieLib;
  output_frame.frame_index = -1;
  return true;
}

void FFmpegDecoder::UpdateStats(double decode_time_ms) {
  stats_.frames_decoded++;

  // Update average decode time (exponential moving average)
  const double alpha = 0.1;
  stats_.average_decode_time_ms =
      alpha * decode_time_ms + (1.0 - alpha) * stats_.average_decode_time_ms;
}

bool PackFrameImage(const AVFrame* frame, movie::MovieFrame& out) {
  const auto format = static_cast<AVPixelFormat>(frame->format);
  const int size = av_image_get_buffer_size(format, frame->width, frame->height, 1);
  if (size < 0) {
    Logger::Error("[FFmpegDecoder] Unsupported frame layout: " + AvErrorString(size));
    return false;
  }

  out.color_data.resize(static_cast<size_t>(size));
  const int copied = av_image_copy_to_buffer(out.color_data.data(), size, frame->data,
                                             frame->linesize, format, frame->width,
                                             frame->height, 1);
  if (copied < 0) {
    Logger::Error("[FFmpegDecoder] Frame copy failed: " + AvErrorString(copied));
    return false;
  }
  out.size = movie::FrameSize{frame->width, frame->height};
  return true;
}

}  // namespace stimkit::decode

namespace stimkit::movie {

DecoderFactory MakeFFmpegDecoderFactory() {
  return []() -> std::unique_ptr<IDecoderHandle> {
    return std::make_unique<decode::FFmpegDecoder>();
  };
}

}  // namespace stimkit::movie
