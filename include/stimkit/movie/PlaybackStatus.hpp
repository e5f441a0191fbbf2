// Repository: stimkit
// Component: PlaybackStatus
// Purpose: Closed status enum shared by the movie subsystem and the
//          eyetracker control. Values map 1:1 to stream reader states.
// Copyright (c) 2025 stimkit contributors

#ifndef STIMKIT_MOVIE_PLAYBACK_STATUS_HPP_
#define STIMKIT_MOVIE_PLAYBACK_STATUS_HPP_

namespace stimkit::movie {

enum class PlaybackStatus {
  kNotStarted = 0,
  kPlaying = 1,
  kPaused = 2,
  kStopping = 3,
  kStopped = 4,
  kFinished = 5,
};

// The experiment engine's STARTED state is the same value as PLAYING.
inline constexpr PlaybackStatus kStarted = PlaybackStatus::kPlaying;

inline const char* ToString(PlaybackStatus status) {
  switch (status) {
    case PlaybackStatus::kNotStarted: return "NOT_STARTED";
    case PlaybackStatus::kPlaying:    return "PLAYING";
    case PlaybackStatus::kPaused:     return "PAUSED";
    case PlaybackStatus::kStopping:   return "STOPPING";
    case PlaybackStatus::kStopped:    return "STOPPED";
    case PlaybackStatus::kFinished:   return "FINISHED";
  }
  return "UNKNOWN";
}

}  // namespace stimkit::movie

#endif  // STIMKIT_MOVIE_PLAYBACK_STATUS_HPP_
