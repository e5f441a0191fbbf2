// Repository: stimkit
// Component: MovieStreamReader Contract Tests
// Purpose: Reader state machine, frame-rate driven cadence, publishing and
//          the single-owner decoder command channel.
// Copyright (c) 2025 stimkit contributors

#include <gtest/gtest.h>

#include <atomic>
#include <chrono>
#include <functional>
#include <stdexcept>
#include <thread>
#include <vector>

#include "stimkit/movie/MovieStreamReader.hpp"
#include "stimkit/movie/PlayerConfig.hpp"
#include "../../fixtures/FakeDecoderHandle.h"

namespace stimkit::movie::testing {
namespace {

using stimkit::tests::fixtures::FakeDecoderHandle;

// Poll until pred() is true or timeout expires.
bool WaitFor(std::function<bool()> pred, std::chrono::milliseconds timeout) {
  auto deadline = std::chrono::steady_clock::now() + timeout;
  while (std::chrono::steady_clock::now() < deadline) {
    if (pred()) return true;
    std::this_thread::sleep_for(std::chrono::milliseconds(1));
  }
  return pred();
}

FakeDecoderHandle::Script FastScript(int frames) {
  FakeDecoderHandle::Script script;
  script.frame_rate = RationalFps{100, 1};
  script.total_frames = frames;
  return script;
}

PlayerConfig ConfigWithCapacity(std::size_t capacity) {
  PlayerConfig config;
  config.frame_queue_capacity = capacity;
  return config;
}

// =============================================================================
// Poll cadence
// =============================================================================

TEST(MovieStreamReaderTest, PollIntervalIsExactlyDenOverNum) {
  EXPECT_EQ(MovieStreamReader::PollIntervalFor(RationalFps{30000, 1001}, 0.001),
            1001.0 / 30000.0);
  EXPECT_EQ(MovieStreamReader::PollIntervalFor(RationalFps{30, 1}, 0.001), 1.0 / 30.0);
  EXPECT_EQ(MovieStreamReader::PollIntervalFor(RationalFps{25, 1}, 0.001), 0.04);
}

TEST(MovieStreamReaderTest, UnknownRateFallsBackToWarmupCadence) {
  EXPECT_EQ(MovieStreamReader::PollIntervalFor(RationalFps{0, 1}, 0.001), 0.001);
  EXPECT_EQ(MovieStreamReader::PollIntervalFor(RationalFps{30, 0}, 0.001), 0.001);
}

// =============================================================================
// Transport requests
// =============================================================================

TEST(MovieStreamReaderTest, LatestTransportRequestWinsWithoutThread) {
  FakeDecoderHandle decoder;
  MovieStreamReader reader(&decoder, PlayerConfig());

  EXPECT_EQ(reader.RequestedTransport(), MovieStreamReader::TransportRequest::kPause);
  reader.Play();
  reader.Pause();
  EXPECT_EQ(reader.RequestedTransport(), MovieStreamReader::TransportRequest::kPause);
  reader.Play();
  EXPECT_EQ(reader.RequestedTransport(), MovieStreamReader::TransportRequest::kPlay);
  EXPECT_EQ(reader.state(), PlaybackStatus::kNotStarted);
  EXPECT_FALSE(reader.IsRunning());
}

TEST(MovieStreamReaderTest, PlayThenPauseBeforeRunResolvesToPaused) {
  FakeDecoderHandle decoder(FastScript(50));
  ASSERT_TRUE(decoder.Open("fake.mp4", DecoderOptions()));
  MovieStreamReader reader(&decoder, PlayerConfig());

  reader.Play();
  reader.Pause();
  ASSERT_TRUE(reader.Start());

  ASSERT_TRUE(WaitFor([&] { return reader.state() == PlaybackStatus::kPaused; },
                      std::chrono::milliseconds(1000)));
  std::this_thread::sleep_for(std::chrono::milliseconds(30));
  EXPECT_EQ(reader.state(), PlaybackStatus::kPaused);
  EXPECT_TRUE(decoder.ObservedPaused());
  EXPECT_EQ(reader.FramesPublished(), 0);

  reader.Shutdown();
  reader.Join();
  EXPECT_EQ(reader.state(), PlaybackStatus::kStopped);
}

TEST(MovieStreamReaderTest, StartTwiceReturnsFalse) {
  FakeDecoderHandle decoder(FastScript(5));
  ASSERT_TRUE(decoder.Open("fake.mp4", DecoderOptions()));
  MovieStreamReader reader(&decoder, PlayerConfig());
  EXPECT_TRUE(reader.Start());
  EXPECT_FALSE(reader.Start());
}

TEST(MovieStreamReaderTest, ShutdownIsSticky) {
  FakeDecoderHandle decoder(FastScript(1000));
  ASSERT_TRUE(decoder.Open("fake.mp4", DecoderOptions()));
  MovieStreamReader reader(&decoder, ConfigWithCapacity(4));
  reader.Play();
  ASSERT_TRUE(reader.Start());
  reader.Shutdown();
  reader.Play();
  reader.Join();

  EXPECT_TRUE(reader.IsShutdownRequested());
  EXPECT_FALSE(reader.IsRunning());
  EXPECT_FALSE(reader.ReachedEndOfStream());
  EXPECT_EQ(reader.state(), PlaybackStatus::kStopped);
}

// =============================================================================
// Playing
// =============================================================================

TEST(MovieStreamReaderTest, PublishesFramesInDecodeOrderUntilEndOfStream) {
  FakeDecoderHandle decoder(FastScript(10));
  ASSERT_TRUE(decoder.Open("fake.mp4", DecoderOptions()));
  MovieStreamReader reader(&decoder, ConfigWithCapacity(16));

  EXPECT_FALSE(reader.IsReady());
  reader.Play();
  ASSERT_TRUE(reader.Start());
  ASSERT_TRUE(WaitFor([&] { return !reader.IsRunning(); }, std::chrono::milliseconds(3000)));

  EXPECT_TRUE(reader.ReachedEndOfStream());
  EXPECT_EQ(reader.state(), PlaybackStatus::kStopped);
  EXPECT_FALSE(reader.IsReady());
  EXPECT_EQ(reader.FramesPublished(), 10);
  EXPECT_EQ(reader.FramesDropped(), 0);

  for (int64_t i = 0; i < 10; ++i) {
    auto entry = reader.GetRecentFrame();
    ASSERT_TRUE(entry.has_value());
    EXPECT_EQ(entry->frame.frame_index, i);
    EXPECT_DOUBLE_EQ(entry->frame.pts, i * 0.01);
    EXPECT_DOUBLE_EQ(entry->status.stream_time(), entry->frame.pts);
    EXPECT_EQ(entry->status.status(), PlaybackStatus::kPlaying);
    EXPECT_EQ(entry->metadata.frame_rate, (RationalFps{100, 1}));
    EXPECT_EQ(entry->frame.movie_lib, FakeDecoderHandle::kMovieLib);
  }
  EXPECT_FALSE(reader.GetRecentFrame().has_value());
}

TEST(MovieStreamReaderTest, PollIntervalFollowsStreamFrameRate) {
  FakeDecoderHandle::Script script;
  script.frame_rate = RationalFps{30000, 1001};
  script.total_frames = 1000;
  FakeDecoderHandle decoder(script);
  ASSERT_TRUE(decoder.Open("fake.mp4", DecoderOptions()));
  MovieStreamReader reader(&decoder, ConfigWithCapacity(4));

  EXPECT_DOUBLE_EQ(reader.CurrentPollIntervalSec(), 0.001);
  reader.Play();
  ASSERT_TRUE(reader.Start());
  ASSERT_TRUE(WaitFor([&] { return reader.IsReady(); }, std::chrono::milliseconds(1000)));
  ASSERT_TRUE(WaitFor([&] { return reader.FramesPublished() > 0; },
                      std::chrono::milliseconds(1000)));
  EXPECT_EQ(reader.CurrentPollIntervalSec(), 1001.0 / 30000.0);
}

TEST(MovieStreamReaderTest, FramesWithUnknownRateAreNotPublished) {
  FakeDecoderHandle::Script script = FastScript(10);
  script.invalid_rate_frames = 2;
  FakeDecoderHandle decoder(script);
  ASSERT_TRUE(decoder.Open("fake.mp4", DecoderOptions()));
  MovieStreamReader reader(&decoder, ConfigWithCapacity(16));

  reader.Play();
  ASSERT_TRUE(reader.Start());
  ASSERT_TRUE(WaitFor([&] { return !reader.IsRunning(); }, std::chrono::milliseconds(3000)));

  EXPECT_EQ(reader.FramesPublished(), 8);
  auto first = reader.GetRecentFrame();
  ASSERT_TRUE(first.has_value());
  EXPECT_EQ(first->frame.frame_index, 2);
}

TEST(MovieStreamReaderTest, NotReadyPullsAreRetried) {
  FakeDecoderHandle::Script script = FastScript(3);
  script.leading_not_ready = 5;
  FakeDecoderHandle decoder(script);
  ASSERT_TRUE(decoder.Open("fake.mp4", DecoderOptions()));
  MovieStreamReader reader(&decoder, ConfigWithCapacity(4));

  reader.Play();
  ASSERT_TRUE(reader.Start());
  ASSERT_TRUE(WaitFor([&] { return !reader.IsRunning(); }, std::chrono::milliseconds(3000)));

  EXPECT_GE(reader.NotReadyRetries(), 5);
  EXPECT_EQ(reader.FramesPublished(), 3);
  EXPECT_TRUE(reader.ReachedEndOfStream());
}

TEST(MovieStreamReaderTest, FullQueueDropsNewFrames) {
  FakeDecoderHandle decoder(FastScript(10));
  ASSERT_TRUE(decoder.Open("fake.mp4", DecoderOptions()));
  MovieStreamReader reader(&decoder, ConfigWithCapacity(1));

  reader.Play();
  ASSERT_TRUE(reader.Start());
  ASSERT_TRUE(WaitFor([&] { return !reader.IsRunning(); }, std::chrono::milliseconds(3000)));

  EXPECT_EQ(reader.FramesPublished(), 1);
  EXPECT_EQ(reader.FramesDropped(), 9);
  EXPECT_EQ(reader.Queue().DropsTotal(), 9);
  auto entry = reader.GetRecentFrame();
  ASSERT_TRUE(entry.has_value());
  EXPECT_EQ(entry->frame.frame_index, 0);
}

TEST(MovieStreamReaderTest, DiscardQueuedFramesEmptiesQueue) {
  FakeDecoderHandle decoder(FastScript(4));
  ASSERT_TRUE(decoder.Open("fake.mp4", DecoderOptions()));
  MovieStreamReader reader(&decoder, ConfigWithCapacity(8));

  reader.Play();
  ASSERT_TRUE(reader.Start());
  ASSERT_TRUE(WaitFor([&] { return !reader.IsRunning(); }, std::chrono::milliseconds(3000)));
  EXPECT_EQ(reader.DiscardQueuedFrames(), 4u);
  EXPECT_FALSE(reader.GetRecentFrame().has_value());
}

TEST(MovieStreamReaderTest, InterruptFlagInstalledOnlyWhileRunning) {
  FakeDecoderHandle decoder(FastScript(1000));
  ASSERT_TRUE(decoder.Open("fake.mp4", DecoderOptions()));
  MovieStreamReader reader(&decoder, ConfigWithCapacity(4));

  ASSERT_TRUE(reader.Start());
  ASSERT_TRUE(WaitFor([&] { return decoder.ObservedInterruptFlagSet(); },
                      std::chrono::milliseconds(1000)));
  reader.Shutdown();
  reader.Join();
  EXPECT_FALSE(decoder.ObservedInterruptFlagSet());
}

// =============================================================================
// RunOnDecoder: single-owner command channel
// =============================================================================

TEST(MovieStreamReaderTest, RunOnDecoderRunsInlineWhenNotStarted) {
  FakeDecoderHandle decoder;
  MovieStreamReader reader(&decoder, PlayerConfig());

  std::thread::id ran_on;
  reader.RunOnDecoder([&](IDecoderHandle& d) {
    ran_on = std::this_thread::get_id();
    d.SetVolume(0.25);
  });
  EXPECT_EQ(ran_on, std::this_thread::get_id());
  EXPECT_DOUBLE_EQ(decoder.ObservedVolume(), 0.25);
}

TEST(MovieStreamReaderTest, RunOnDecoderRunsOnReaderThreadWhileActive) {
  FakeDecoderHandle decoder(FastScript(100000));
  ASSERT_TRUE(decoder.Open("fake.mp4", DecoderOptions()));
  MovieStreamReader reader(&decoder, ConfigWithCapacity(1));
  reader.Play();
  ASSERT_TRUE(reader.Start());

  std::thread::id ran_on;
  double pts = -1.0;
  reader.RunOnDecoder([&](IDecoderHandle& d) {
    ran_on = std::this_thread::get_id();
    pts = d.GetPresentationTime();
  });
  EXPECT_NE(ran_on, std::this_thread::get_id());
  EXPECT_GE(pts, 0.0);
}

TEST(MovieStreamReaderTest, RunOnDecoderPropagatesExceptions) {
  FakeDecoderHandle decoder(FastScript(100000));
  ASSERT_TRUE(decoder.Open("fake.mp4", DecoderOptions()));
  MovieStreamReader reader(&decoder, ConfigWithCapacity(1));
  reader.Play();
  ASSERT_TRUE(reader.Start());

  EXPECT_THROW(reader.RunOnDecoder([](IDecoderHandle&) {
    throw std::runtime_error("boom");
  }),
               std::runtime_error);
  EXPECT_TRUE(reader.IsRunning());
}

TEST(MovieStreamReaderTest, RoutedCommandsNeverOverlapReaderPulls) {
  FakeDecoderHandle decoder(FastScript(100000));
  ASSERT_TRUE(decoder.Open("fake.mp4", DecoderOptions()));
  MovieStreamReader reader(&decoder, ConfigWithCapacity(1));
  reader.Play();
  ASSERT_TRUE(reader.Start());

  std::vector<std::thread> callers;
  for (int t = 0; t < 3; ++t) {
    callers.emplace_back([&] {
      for (int i = 0; i < 100; ++i) {
        reader.RunOnDecoder([](IDecoderHandle& d) {
          d.GetMetadata();
          d.GetPresentationTime();
        });
        reader.GetRecentFrame();
      }
    });
  }
  for (auto& caller : callers) caller.join();

  reader.Shutdown();
  reader.Join();
  EXPECT_EQ(decoder.ConcurrentAccessViolations(), 0);
}

TEST(MovieStreamReaderTest, RunOnDecoderAfterExitRunsInline) {
  FakeDecoderHandle decoder(FastScript(2));
  ASSERT_TRUE(decoder.Open("fake.mp4", DecoderOptions()));
  MovieStreamReader reader(&decoder, ConfigWithCapacity(4));
  reader.Play();
  ASSERT_TRUE(reader.Start());
  ASSERT_TRUE(WaitFor([&] { return !reader.IsRunning(); }, std::chrono::milliseconds(3000)));

  std::thread::id ran_on;
  reader.RunOnDecoder([&](IDecoderHandle&) { ran_on = std::this_thread::get_id(); });
  EXPECT_EQ(ran_on, std::this_thread::get_id());
}

}  // namespace
}  // namespace stimkit::movie::testing
