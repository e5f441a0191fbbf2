// Repository: stimkit
// Component: EyetrackerControl
// Purpose: Binds an eyetracker's recording state to the routine status.
// Copyright (c) 2025 stimkit contributors

#ifndef STIMKIT_EYETRACKER_EYETRACKER_CONTROL_H_
#define STIMKIT_EYETRACKER_EYETRACKER_CONTROL_H_

#include <optional>

#include "stimkit/movie/PlaybackStatus.hpp"

namespace stimkit::eyetracker {

struct GazePosition {
  double x = 0.0;
  double y = 0.0;
};

// Vendor tracker device. Implemented by the hardware layer.
class IEyetrackerDevice {
 public:
  virtual ~IEyetrackerDevice() = default;

  virtual void SetRecordingState(bool recording) = 0;
  // Latest gaze sample, or empty when the tracker has none.
  virtual std::optional<GazePosition> GetPosition() const = 0;
};

// Event server the tracker reports into.
class IEventServer {
 public:
  virtual ~IEventServer() = default;

  virtual void ClearEvents() = 0;
};

// EyetrackerControl follows routine status changes:
//   → kStarted: clear buffered events when (re)starting from
//     NotStarted/Stopped/Finished, then start recording.
//   → NotStarted/Paused/Stopped/Finished: stop recording.
// Setting the current status again does nothing.
//
// Both collaborators are borrowed and must outlive the control.
class EyetrackerControl {
 public:
  EyetrackerControl(IEventServer& server, IEyetrackerDevice& tracker);

  movie::PlaybackStatus status() const { return status_; }
  void SetStatus(movie::PlaybackStatus status);

  std::optional<GazePosition> GetPos() const { return tracker_.GetPosition(); }

 private:
  IEventServer& server_;
  IEyetrackerDevice& tracker_;
  movie::PlaybackStatus status_ = movie::PlaybackStatus::kNotStarted;
};

}  // namespace stimkit::eyetracker

#endif  // STIMKIT_EYETRACKER_EYETRACKER_CONTROL_H_
