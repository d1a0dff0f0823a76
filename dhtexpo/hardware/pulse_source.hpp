#ifndef PULSE_SOURCE_HPP
#define PULSE_SOURCE_HPP

#include <cstdint>
#include <dhtexpo/models/capture_window.hpp>
#include <dhtexpo/models/sensor_status.hpp>

// Single-wire data line that can be triggered and then observed.
// Implementations: GpioPulseSource (hardware), SyntheticPulseSource (dummy mode).
class PulseSource {
public:
    virtual ~PulseSource() = default;

    // Hold the line low for trigger_low_us, release it, then record every
    // transition into out until a full frame's worth of edges has been seen or
    // timeout_us passes without a transition. out is cleared first.
    // Returns OK or HARDWARE_UNAVAILABLE; decoding the window is the caller's job.
    virtual SensorStatus capture(uint32_t trigger_low_us, uint32_t timeout_us, CaptureWindow& out) = 0;
};

#endif // PULSE_SOURCE_HPP
