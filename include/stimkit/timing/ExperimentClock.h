// Repository: stimkit
// Component: Experiment Clock
// Purpose: Wall-clock of the running experiment, used to map movie time to
//          experiment time.
// Copyright (c) 2025 stimkit contributors

#ifndef STIMKIT_TIMING_EXPERIMENT_CLOCK_H_
#define STIMKIT_TIMING_EXPERIMENT_CLOCK_H_

#include <memory>

namespace stimkit::timing {

// ExperimentClock reports experiment time in seconds. It is supplied by the
// presentation engine; tests use a manually advanced clock.
class ExperimentClock {
 public:
  virtual ~ExperimentClock() = default;

  // Monotonic experiment time in seconds.
  virtual double GetExperimentTime() const = 0;
};

// Steady-clock experiment time; zero at construction.
std::shared_ptr<ExperimentClock> MakeSystemExperimentClock();

}  // namespace stimkit::timing

#endif  // STIMKIT_TIMING_EXPERIMENT_CLOCK_H_
