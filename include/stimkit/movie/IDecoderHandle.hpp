// Repository: stimkit
// Component: IDecoderHandle
// Purpose: Decoder surface used by the movie stream reader and player.
//          Production uses decode::FFmpegDecoder; tests inject a scripted
//          fake so reader/player timing can be exercised without media.
// Copyright (c) 2025 stimkit contributors

#ifndef STIMKIT_MOVIE_IDECODER_HANDLE_HPP_
#define STIMKIT_MOVIE_IDECODER_HANDLE_HPP_

#include <atomic>
#include <functional>
#include <memory>
#include <string>

#include "stimkit/movie/MovieFrame.hpp"
#include "stimkit/movie/StreamMetadata.hpp"

namespace stimkit::movie {

// Options handed to IDecoderHandle::Open().
struct DecoderOptions {
  std::string sync = "video";  // master clock the decoder paces frames by
  int target_width = 0;        // 0 = native size
  int target_height = 0;       // 0 = native size
  int max_decode_threads = 0;  // 0 = library default
};

// Result of a frame pull. kNotReady means "nothing due yet, ask again";
// it is never surfaced to callers of the player.
enum class PullStatus {
  kFrame,
  kNotReady,
  kEndOfStream,
};

struct DecoderPull {
  PullStatus status = PullStatus::kNotReady;
  MovieFrame frame;  // valid only when status == kFrame (size, pts, color_data)
};

// IDecoderHandle is NOT thread-safe. Exactly one thread may use a handle at a
// time; once a MovieStreamReader owns it, every call is made on the reader
// thread (see MovieStreamReader::RunOnDecoder).
class IDecoderHandle {
 public:
  virtual ~IDecoderHandle() = default;

  virtual bool Open(const std::string& path, const DecoderOptions& options) = 0;
  virtual void Close() = 0;
  virtual bool IsOpen() const = 0;

  // Non-blocking pull of the next frame due for presentation.
  virtual DecoderPull GetFrame() = 0;

  virtual StreamMetadata GetMetadata() const = 0;

  // Current presentation time in movie seconds.
  virtual double GetPresentationTime() const = 0;

  // relative=false seeks to `timestamp`; relative=true seeks by `timestamp`
  // from the current presentation time.
  virtual bool Seek(double timestamp, bool relative) = 0;

  virtual void SetPause(bool paused) = 0;
  virtual bool GetPause() const = 0;
  virtual void SetMute(bool muted) = 0;
  virtual bool GetMute() const = 0;
  virtual void SetVolume(double volume) = 0;
  virtual double GetVolume() const = 0;

  // When the flag becomes true, blocking I/O inside the decoder aborts
  // promptly. Call with nullptr to clear.
  virtual void SetInterruptFlag(std::atomic<bool>* flag) { (void)flag; }
};

// Creates an unopened handle. The player calls Open() on it.
using DecoderFactory = std::function<std::unique_ptr<IDecoderHandle>()>;

// Default factory: FFmpeg-backed handles (decode::FFmpegDecoder).
DecoderFactory MakeFFmpegDecoderFactory();

}  // namespace stimkit::movie

#endif  // STIMKIT_MOVIE_IDECODER_HANDLE_HPP_
