// Repository: stimkit
// Component: EyetrackerControl Contract Tests
// Purpose: Recording state follows routine status transitions.
// Copyright (c) 2025 stimkit contributors

#include <gtest/gtest.h>

#include <vector>

#include "stimkit/eyetracker/EyetrackerControl.h"
#include "../../fixtures/FakeEyetracker.h"

namespace stimkit::eyetracker::testing {
namespace {

using movie::PlaybackStatus;
using stimkit::tests::fixtures::FakeEventServer;
using stimkit::tests::fixtures::FakeEyetrackerDevice;

class EyetrackerControlTest : public ::testing::Test {
 protected:
  FakeEventServer server_;
  FakeEyetrackerDevice tracker_;
  EyetrackerControl control_{server_, tracker_};
};

TEST_F(EyetrackerControlTest, StartsNotStartedAndIdle) {
  EXPECT_EQ(control_.status(), PlaybackStatus::kNotStarted);
  EXPECT_TRUE(tracker_.recording_calls.empty());
  EXPECT_EQ(server_.clear_count, 0);
}

TEST_F(EyetrackerControlTest, StartFromNotStartedClearsEventsAndRecords) {
  control_.SetStatus(movie::kStarted);
  EXPECT_EQ(control_.status(), PlaybackStatus::kPlaying);
  EXPECT_EQ(server_.clear_count, 1);
  EXPECT_EQ(tracker_.recording_calls, (std::vector<bool>{true}));
}

TEST_F(EyetrackerControlTest, ResumeFromPauseKeepsEvents) {
  control_.SetStatus(movie::kStarted);
  control_.SetStatus(PlaybackStatus::kPaused);
  control_.SetStatus(movie::kStarted);

  EXPECT_EQ(server_.clear_count, 1);
  EXPECT_EQ(tracker_.recording_calls, (std::vector<bool>{true, false, true}));
}

TEST_F(EyetrackerControlTest, RestartAfterStopClearsEventsAgain) {
  control_.SetStatus(movie::kStarted);
  control_.SetStatus(PlaybackStatus::kStopped);
  control_.SetStatus(movie::kStarted);
  control_.SetStatus(PlaybackStatus::kFinished);
  control_.SetStatus(movie::kStarted);

  EXPECT_EQ(server_.clear_count, 3);
  EXPECT_EQ(tracker_.recording_calls,
            (std::vector<bool>{true, false, true, false, true}));
}

TEST_F(EyetrackerControlTest, SameStatusIsNoOp) {
  control_.SetStatus(movie::kStarted);
  control_.SetStatus(movie::kStarted);
  control_.SetStatus(PlaybackStatus::kNotStarted);
  control_.SetStatus(PlaybackStatus::kNotStarted);

  EXPECT_EQ(server_.clear_count, 1);
  EXPECT_EQ(tracker_.recording_calls, (std::vector<bool>{true, false}));
}

TEST_F(EyetrackerControlTest, StoppingDoesNotTouchRecording) {
  control_.SetStatus(movie::kStarted);
  control_.SetStatus(PlaybackStatus::kStopping);
  EXPECT_EQ(control_.status(), PlaybackStatus::kStopping);
  EXPECT_EQ(tracker_.recording_calls, (std::vector<bool>{true}));
}

TEST_F(EyetrackerControlTest, PositionForwardsTrackerSample) {
  EXPECT_FALSE(control_.GetPos().has_value());
  tracker_.position = GazePosition{0.25, -0.5};
  auto pos = control_.GetPos();
  ASSERT_TRUE(pos.has_value());
  EXPECT_DOUBLE_EQ(pos->x, 0.25);
  EXPECT_DOUBLE_EQ(pos->y, -0.5);
}

}  // namespace
}  // namespace stimkit::eyetracker::testing
