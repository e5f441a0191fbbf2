// Repository: stimkit
// Component: PlayerConfig
// Purpose: Environment overrides for player tunables.
// Copyright (c) 2025 stimkit contributors

#include "stimkit/movie/PlayerConfig.hpp"

#include <cerrno>
#include <cstdlib>
#include <optional>
#include <string>

#include "stimkit/util/Logger.hpp"

namespace stimkit::movie {

namespace {

using stimkit::util::Logger;

// Parses a base-10 integer env var. nullopt when unset or malformed.
std::optional<long long> ReadIntegerEnv(const char* name) {
  const char* raw = std::getenv(name);
  if (raw == nullptr || raw[0] == '\0') return std::nullopt;
  errno = 0;
  char* end = nullptr;
  const long long value = std::strtoll(raw, &end, 10);
  if (errno != 0 || end == raw || *end != '\0') {
    Logger::Warn(std::string("[PlayerConfig] Ignoring ") + name + "=" + raw +
                 " (not an integer)");
    return std::nullopt;
  }
  return value;
}

}  // namespace

PlayerConfig ApplyEnvironmentOverrides(PlayerConfig base) {
  if (auto depth = ReadIntegerEnv("STIMKIT_FRAME_QUEUE_DEPTH")) {
    if (*depth >= 1) {
      base.frame_queue_capacity = static_cast<std::size_t>(*depth);
    } else {
      Logger::Warn("[PlayerConfig] Ignoring STIMKIT_FRAME_QUEUE_DEPTH=" +
                   std::to_string(*depth) + " (must be >= 1)");
    }
  }

  if (auto threads = ReadIntegerEnv("STIMKIT_DECODE_THREADS")) {
    if (*threads >= 0) {
      base.decoder_options.max_decode_threads = static_cast<int>(*threads);
    } else {
      Logger::Warn("[PlayerConfig] Ignoring STIMKIT_DECODE_THREADS=" +
                   std::to_string(*threads) + " (must be >= 0)");
    }
  }

  if (auto timeout_ms = ReadIntegerEnv("STIMKIT_WARMUP_TIMEOUT_MS")) {
    if (*timeout_ms > 0) {
      base.warmup_timeout = std::chrono::milliseconds(*timeout_ms);
    } else {
      Logger::Warn("[PlayerConfig] Ignoring STIMKIT_WARMUP_TIMEOUT_MS=" +
                   std::to_string(*timeout_ms) + " (must be > 0)");
    }
  }

  return base;
}

}  // namespace stimkit::movie
