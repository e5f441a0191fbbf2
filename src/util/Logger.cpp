// Repository: stimkit
// Component: Thread-Safe Logger
// Purpose: Mutex-protected log emission; no multi-thread interleave.
// Copyright (c) 2025 stimkit contributors

#include "stimkit/util/Logger.hpp"

#include <cstdlib>
#include <iostream>

namespace stimkit::util {

std::mutex Logger::mutex_;
std::function<void(const std::string&)> Logger::error_sink_;
std::function<void(const std::string&)> Logger::info_sink_;

void Logger::SetErrorSink(std::function<void(const std::string&)> sink) {
  std::lock_guard<std::mutex> lock(mutex_);
  error_sink_ = std::move(sink);
}

void Logger::SetInfoSink(std::function<void(const std::string&)> sink) {
  std::lock_guard<std::mutex> lock(mutex_);
  info_sink_ = std::move(sink);
}

bool Logger::DebugEnabled() {
  return std::getenv("STIMKIT_DEBUG") != nullptr;
}

void Logger::Info(const std::string& line) {
  std::lock_guard<std::mutex> lock(mutex_);
  if (info_sink_) {
    info_sink_(line);
  }
  std::cout << line << '\n';
  std::cout.flush();
}

void Logger::Debug(const std::string& line) {
  if (!DebugEnabled()) return;
  std::lock_guard<std::mutex> lock(mutex_);
  std::cout << line << '\n';
  std::cout.flush();
}

void Logger::Warn(const std::string& line) {
  std::lock_guard<std::mutex> lock(mutex_);
  std::cerr << line << '\n';
  std::cerr.flush();
}

void Logger::Error(const std::string& line) {
  std::lock_guard<std::mutex> lock(mutex_);
  if (error_sink_) {
    error_sink_(line);
  }
  std::cerr << line << '\n';
  std::cerr.flush();
}

}  // namespace stimkit::util
