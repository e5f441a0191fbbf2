// Repository: stimkit
// Component: Movie Errors
// Purpose: Exceptions raised by the movie player facade.
// Copyright (c) 2025 stimkit contributors

#ifndef STIMKIT_MOVIE_MOVIE_ERRORS_HPP_
#define STIMKIT_MOVIE_MOVIE_ERRORS_HPP_

#include <stdexcept>
#include <string>

namespace stimkit::movie {

// Base for every error the facade raises. A facade error never leaves the
// player half-mutated; callers may catch it and keep using the player
// (e.g. call Load()).
class MovieError : public std::runtime_error {
 public:
  explicit MovieError(const std::string& what) : std::runtime_error(what) {}
};

// Transport or timing operation invoked with no open decoder handle.
class NotLoadedError : public MovieError {
 public:
  explicit NotLoadedError(const std::string& operation)
      : MovieError("MoviePlayer::" + operation +
                   " requires a successful `Load` first") {}
};

// Stop() invoked when nothing was ever opened.
class NotOpenedError : public MovieError {
 public:
  NotOpenedError() : MovieError("Cannot close stream, not opened yet") {}
};

// Malformed timestamp passed to a timing conversion (NaN or infinite).
class TypeMismatchError : public MovieError {
 public:
  explicit TypeMismatchError(const std::string& parameter)
      : MovieError("Value for parameter `" + parameter +
                   "` must be a finite number of seconds") {}
};

// The decoder could not open the media or never produced a first frame.
class StreamOpenError : public MovieError {
 public:
  explicit StreamOpenError(const std::string& what) : MovieError(what) {}
};

}  // namespace stimkit::movie

#endif  // STIMKIT_MOVIE_MOVIE_ERRORS_HPP_
