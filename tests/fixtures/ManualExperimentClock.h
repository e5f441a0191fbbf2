#ifndef STIMKIT_TESTS_FIXTURES_MANUAL_EXPERIMENT_CLOCK_H_
#define STIMKIT_TESTS_FIXTURES_MANUAL_EXPERIMENT_CLOCK_H_

#include <atomic>

#include "stimkit/timing/ExperimentClock.h"

namespace stimkit::tests::fixtures {

// Experiment clock that only moves when the test says so.
class ManualExperimentClock : public timing::ExperimentClock {
 public:
  explicit ManualExperimentClock(double start_sec = 100.0) : now_sec_(start_sec) {}

  double GetExperimentTime() const override {
    return now_sec_.load(std::memory_order_acquire);
  }

  void Set(double sec) { now_sec_.store(sec, std::memory_order_release); }

  void Advance(double delta_sec) {
    now_sec_.store(now_sec_.load(std::memory_order_acquire) + delta_sec,
                   std::memory_order_release);
  }

 private:
  std::atomic<double> now_sec_;
};

}  // namespace stimkit::tests::fixtures

#endif  // STIMKIT_TESTS_FIXTURES_MANUAL_EXPERIMENT_CLOCK_H_
