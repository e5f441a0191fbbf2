#ifndef STIMKIT_TESTS_FIXTURES_FAKE_DECODER_HANDLE_H_
#define STIMKIT_TESTS_FIXTURES_FAKE_DECODER_HANDLE_H_

#include <atomic>
#include <chrono>
#include <cmath>
#include <cstdint>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

#include "stimkit/movie/IDecoderHandle.hpp"
#include "stimkit/movie/RationalFps.hpp"

namespace stimkit::tests::fixtures {

// Scripted IDecoderHandle. Emits frames 0..total_frames-1 back to back
// whenever it is unpaused (no wall clock), pts = index * den/num.
//
// Every IDecoderHandle call is checked for overlap with another call; any
// overlap bumps ConcurrentAccessViolations(). The observation accessors
// (Observed*, *Count) are not decoder calls and are safe from any thread.
class FakeDecoderHandle : public movie::IDecoderHandle {
 public:
  struct Script {
    movie::RationalFps frame_rate{30, 1};
    int total_frames = 300;
    int width = 4;
    int height = 2;
    // GetMetadata() reports an unknown (0/1) rate until this many frames
    // have been emitted.
    int invalid_rate_frames = 0;
    // The first N GetFrame() calls return kNotReady.
    int leading_not_ready = 0;
    bool fail_open = false;
    std::string title = "fake movie";
    std::string pixel_format = "rgb24";
    // Time spent inside each GetFrame() call.
    std::chrono::microseconds pull_delay{0};
  };

  FakeDecoderHandle() : FakeDecoderHandle(Script{}) {}
  explicit FakeDecoderHandle(Script script) : script_(std::move(script)) {}

  // --- IDecoderHandle ---

  bool Open(const std::string& path, const movie::DecoderOptions& options) override {
    CallGuard guard(this);
    open_count_++;
    path_ = path;
    options_ = options;
    if (script_.fail_open) return false;
    open_.store(true);
    return true;
  }

  void Close() override {
    CallGuard guard(this);
    close_count_++;
    open_.store(false);
  }

  bool IsOpen() const override {
    CallGuard guard(this);
    return open_.load();
  }

  movie::DecoderPull GetFrame() override {
    CallGuard guard(this);
    pull_count_++;
    if (script_.pull_delay.count() > 0) {
      std::this_thread::sleep_for(script_.pull_delay);
    }

    movie::DecoderPull pull;
    if (!open_.load()) {
      pull.status = movie::PullStatus::kEndOfStream;
      return pull;
    }
    if (paused_.load()) {
      return pull;  // kNotReady
    }
    if (leading_not_ready_left_ < script_.leading_not_ready) {
      leading_not_ready_left_++;
      not_ready_count_++;
      return pull;
    }
    if (next_frame_ >= script_.total_frames) {
      pull.status = movie::PullStatus::kEndOfStream;
      return pull;
    }

    const int64_t index = next_frame_++;
    pull.status = movie::PullStatus::kFrame;
    pull.frame.pts = static_cast<double>(index) * Interval();
    pull.frame.size = movie::FrameSize{script_.width, script_.height};
    pull.frame.color_data.assign(
        static_cast<size_t>(script_.width * script_.height * 3),
        static_cast<uint8_t>(index % 256));
    position_ = pull.frame.pts;
    frames_emitted_++;
    return pull;
  }

  movie::StreamMetadata GetMetadata() const override {
    CallGuard guard(this);
    movie::StreamMetadata metadata;
    metadata.media_path = path_;
    metadata.title = script_.title;
    metadata.duration_sec = static_cast<double>(script_.total_frames) * Interval();
    metadata.frame_rate = frames_emitted_.load() > script_.invalid_rate_frames
                              ? script_.frame_rate
                              : movie::RationalFps{0, 1};
    metadata.frame_size = movie::FrameSize{script_.width, script_.height};
    metadata.pixel_format = script_.pixel_format;
    metadata.movie_lib = kMovieLib;
    return metadata;
  }

  double GetPresentationTime() const override {
    CallGuard guard(this);
    return position_;
  }

  bool Seek(double timestamp, bool relative) override {
    CallGuard guard(this);
    seek_count_++;
    double target = relative ? position_ + timestamp : timestamp;
    if (target < 0.0) target = 0.0;
    last_seek_target_.store(target);
    next_frame_ = static_cast<int64_t>(std::floor(target / Interval() + 1e-7));
    position_ = target;
    return true;
  }

  void SetPause(bool paused) override {
    CallGuard guard(this);
    paused_.store(paused);
  }
  bool GetPause() const override {
    CallGuard guard(this);
    return paused_.load();
  }
  void SetMute(bool muted) override {
    CallGuard guard(this);
    muted_.store(muted);
  }
  bool GetMute() const override {
    CallGuard guard(this);
    return muted_.load();
  }
  void SetVolume(double volume) override {
    CallGuard guard(this);
    volume_.store(volume);
  }
  double GetVolume() const override {
    CallGuard guard(this);
    return volume_.load();
  }

  void SetInterruptFlag(std::atomic<bool>* flag) override {
    CallGuard guard(this);
    interrupt_flag_set_.store(flag != nullptr);
  }

  // --- Observation (safe from any thread) ---

  int ConcurrentAccessViolations() const { return violations_.load(); }
  int OpenCount() const { return open_count_.load(); }
  int CloseCount() const { return close_count_.load(); }
  int SeekCount() const { return seek_count_.load(); }
  int64_t PullCount() const { return pull_count_.load(); }
  int64_t NotReadyCount() const { return not_ready_count_.load(); }
  int64_t FramesEmitted() const { return frames_emitted_.load(); }
  double LastSeekTarget() const { return last_seek_target_.load(); }
  bool ObservedOpen() const { return open_.load(); }
  bool ObservedPaused() const { return paused_.load(); }
  bool ObservedMuted() const { return muted_.load(); }
  double ObservedVolume() const { return volume_.load(); }
  bool ObservedInterruptFlagSet() const { return interrupt_flag_set_.load(); }
  const Script& script() const { return script_; }

  static constexpr const char* kMovieLib = "fake";

 private:
  class CallGuard {
   public:
    explicit CallGuard(const FakeDecoderHandle* owner) : owner_(owner) {
      if (owner_->in_call_.fetch_add(1) != 0) {
        owner_->violations_.fetch_add(1);
      }
    }
    ~CallGuard() { owner_->in_call_.fetch_sub(1); }

   private:
    const FakeDecoderHandle* owner_;
  };

  double Interval() const { return script_.frame_rate.FrameDurationSec(); }

  Script script_;
  std::string path_;
  movie::DecoderOptions options_;

  int64_t next_frame_ = 0;
  double position_ = 0.0;
  int leading_not_ready_left_ = 0;

  std::atomic<bool> open_{false};
  std::atomic<bool> paused_{true};
  std::atomic<bool> muted_{false};
  std::atomic<double> volume_{1.0};
  std::atomic<bool> interrupt_flag_set_{false};
  std::atomic<double> last_seek_target_{-1.0};

  std::atomic<int> open_count_{0};
  std::atomic<int> close_count_{0};
  std::atomic<int> seek_count_{0};
  std::atomic<int64_t> pull_count_{0};
  std::atomic<int64_t> not_ready_count_{0};
  std::atomic<int64_t> frames_emitted_{0};

  mutable std::atomic<int> in_call_{0};
  mutable std::atomic<int> violations_{0};
};

// Hands out FakeDecoderHandles built from one script and remembers them.
// Handles are owned by whoever called the factory; Created() pointers are
// valid only while that owner keeps them.
class FakeDecoderFactory {
 public:
  explicit FakeDecoderFactory(FakeDecoderHandle::Script script = FakeDecoderHandle::Script())
      : script_(std::move(script)) {}

  movie::DecoderFactory Make() {
    return [this]() -> std::unique_ptr<movie::IDecoderHandle> {
      auto handle = std::make_unique<FakeDecoderHandle>(script_);
      std::lock_guard<std::mutex> lock(mutex_);
      created_.push_back(handle.get());
      return handle;
    };
  }

  FakeDecoderHandle::Script& script() { return script_; }

  FakeDecoderHandle* Last() {
    std::lock_guard<std::mutex> lock(mutex_);
    return created_.empty() ? nullptr : created_.back();
  }

  size_t CreatedCount() {
    std::lock_guard<std::mutex> lock(mutex_);
    return created_.size();
  }

 private:
  FakeDecoderHandle::Script script_;
  std::mutex mutex_;
  std::vector<FakeDecoderHandle*> created_;
};

}  // namespace stimkit::tests::fixtures

#endif  // STIMKIT_TESTS_FIXTURES_FAKE_DECODER_HANDLE_H_
