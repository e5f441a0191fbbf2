// Repository: stimkit
// Component: System Experiment Clock
// Purpose: Steady-clock backed experiment time.
// Copyright (c) 2025 stimkit contributors

#include "stimkit/timing/ExperimentClock.h"

#include <chrono>
#include <memory>

namespace stimkit::timing {

namespace {

class SystemExperimentClock : public ExperimentClock {
 public:
  SystemExperimentClock() : origin_(std::chrono::steady_clock::now()) {}

  double GetExperimentTime() const override {
    const auto delta = std::chrono::steady_clock::now() - origin_;
    return std::chrono::duration<double>(delta).count();
  }

 private:
  std::chrono::steady_clock::time_point origin_;
};

}  // namespace

std::shared_ptr<ExperimentClock> MakeSystemExperimentClock() {
  return std::make_shared<SystemExperimentClock>();
}

}  // namespace stimkit::timing
