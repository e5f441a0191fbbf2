// Repository: stimkit
// Component: Thread-Safe Logger
// Purpose: Mutex-protected log emission; no multi-thread interleave.
// Copyright (c) 2025 stimkit contributors

#ifndef STIMKIT_UTIL_LOGGER_HPP_
#define STIMKIT_UTIL_LOGGER_HPP_

#include <functional>
#include <mutex>
#include <string>

namespace stimkit::util {

// Logger provides thread-safe log emission with a single static mutex.
// Each call acquires the mutex, writes the full line, appends '\n', and
// flushes, so there is no interleave between the experiment thread and
// the movie stream reader threads.
//
// Info  → stdout (lifecycle: load, start, stop, seek, end of stream)
// Debug → stdout only when STIMKIT_DEBUG env is set (per-frame detail)
// Warn  → stderr (degraded but recoverable conditions)
// Error → stderr (decoder failures, contract violations)
//
// Test-only: SetErrorSink / SetInfoSink install callbacks invoked for every
// Error() / Info() line (in addition to the console).
class Logger {
 public:
  static void Info(const std::string& line);
  static void Debug(const std::string& line);
  static void Warn(const std::string& line);
  static void Error(const std::string& line);

  // True when STIMKIT_DEBUG is set. Lets callers skip building debug lines.
  static bool DebugEnabled();

  // Test-only: capture Error() lines. Call with nullptr to clear.
  static void SetErrorSink(std::function<void(const std::string&)> sink);
  // Test-only: capture Info() lines. Call with nullptr to clear.
  static void SetInfoSink(std::function<void(const std::string&)> sink);

 private:
  static std::mutex mutex_;
  static std::function<void(const std::string&)> error_sink_;
  static std::function<void(const std::string&)> info_sink_;
};

}  // namespace stimkit::util

#endif  // STIMKIT_UTIL_LOGGER_HPP_
