#ifndef STIMKIT_TESTS_FIXTURES_FAKE_EYETRACKER_H_
#define STIMKIT_TESTS_FIXTURES_FAKE_EYETRACKER_H_

#include <optional>
#include <vector>

#include "stimkit/eyetracker/EyetrackerControl.h"

namespace stimkit::tests::fixtures {

class FakeEyetrackerDevice : public eyetracker::IEyetrackerDevice {
 public:
  void SetRecordingState(bool recording) override { recording_calls.push_back(recording); }

  std::optional<eyetracker::GazePosition> GetPosition() const override { return position; }

  std::vector<bool> recording_calls;
  std::optional<eyetracker::GazePosition> position;
};

class FakeEventServer : public eyetracker::IEventServer {
 public:
  void ClearEvents() override { clear_count++; }

  int clear_count = 0;
};

}  // namespace stimkit::tests::fixtures

#endif  // STIMKIT_TESTS_FIXTURES_FAKE_EYETRACKER_H_
