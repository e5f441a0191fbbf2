// Repository: stimkit
// Component: EyetrackerControl
// Purpose: Binds an eyetracker's recording state to the routine status.
// Copyright (c) 2025 stimkit contributors

#include "stimkit/eyetracker/EyetrackerControl.h"

#include <string>

#include "stimkit/util/Logger.hpp"

namespace stimkit::eyetracker {

using movie::PlaybackStatus;
using stimkit::util::Logger;

namespace {

bool IsIdle(PlaybackStatus status) {
  return status == PlaybackStatus::kNotStarted ||
         status == PlaybackStatus::kStopped ||
         status == PlaybackStatus::kFinished;
}

}  // namespace

EyetrackerControl::EyetrackerControl(IEventServer& server,
                                     IEyetrackerDevice& tracker)
    : server_(server), tracker_(tracker) {}

void EyetrackerControl::SetStatus(PlaybackStatus status) {
  if (status == status_) {
    return;
  }
  const PlaybackStatus previous = status_;
  status_ = status;

  if (status == movie::kStarted) {
    if (IsIdle(previous)) {
      server_.ClearEvents();
    }
    tracker_.SetRecordingState(true);
  } else if (IsIdle(status) || status == PlaybackStatus::kPaused) {
    tracker_.SetRecordingState(false);
  }

  Logger::Debug(std::string("[EyetrackerControl] status ") + movie::ToString(previous) +
                " -> " + movie::ToString(status));
}

}  // namespace stimkit::eyetracker
