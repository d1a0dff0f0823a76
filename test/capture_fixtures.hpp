/// @file capture_fixtures.hpp
/// @brief Capture windows for decoder and sampler tests

#ifndef CAPTURE_FIXTURES_HPP
#define CAPTURE_FIXTURES_HPP

#include <cstdint>
#include <dhtexpo/hardware/pulse_source.hpp>
#include <dhtexpo/hardware/synthetic_pulse_source.hpp>
#include <dhtexpo/models/capture_window.hpp>

namespace Fixtures {

// Window holding a clean transmission of frame, starting at t=1000 us
inline CaptureWindow windowFor(const uint8_t (&frame)[5]) {
  CaptureWindow window;
  SyntheticPulseSource::encodeFrame(frame, 1000, window);
  return window;
}

// Keep only the first n edges
inline CaptureWindow truncated(const CaptureWindow& full, std::size_t n) {
  CaptureWindow out;
  for (std::size_t i = 0; i < n && i < full.count; ++i) {
    out.push(full.edges[i].level, full.edges[i].timestamp_us);
  }
  return out;
}

// Index of the first data-bit rising edge in a windowFor() window:
// host release, response low, response high, bit-0 low
static constexpr std::size_t kFirstBitEdge = 4;

// PulseSource that replays scripted outcomes, one per capture() call
class ScriptedPulseSource : public PulseSource {
public:
  struct Step {
    SensorStatus status;
    CaptureWindow window;
  };

  static constexpr std::size_t kMaxSteps = 16;

  void add(SensorStatus status, const CaptureWindow& window = CaptureWindow()) {
    if (stepCount < kMaxSteps) {
      steps[stepCount].status = status;
      steps[stepCount].window = window;
      ++stepCount;
    }
  }

  SensorStatus capture(uint32_t trigger_low_us, uint32_t timeout_us, CaptureWindow& out) override {
    lastTriggerLowUs = trigger_low_us;
    lastTimeoutUs = timeout_us;
    ++calls;
    out.clear();
    if (stepIdx >= stepCount) {
      return SensorStatus::HARDWARE_UNAVAILABLE;
    }
    const Step& step = steps[stepIdx++];
    out = step.window;
    return step.status;
  }

  Step steps[kMaxSteps] = {};
  std::size_t stepCount = 0;
  std::size_t stepIdx = 0;
  std::size_t calls = 0;
  uint32_t lastTriggerLowUs = 0;
  uint32_t lastTimeoutUs = 0;
};

} // namespace Fixtures

#endif // CAPTURE_FIXTURES_HPP
