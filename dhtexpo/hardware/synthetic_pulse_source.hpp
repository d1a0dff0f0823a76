#ifndef SYNTHETIC_PULSE_SOURCE_HPP
#define SYNTHETIC_PULSE_SOURCE_HPP

#include <cstdint>
#include <random>
#include <dhtexpo/hardware/pulse_source.hpp>

// Dummy-mode stand-in for the sensor: every capture holds a well-formed DHT22
// transmission of a random reading in the 15.0..30.0 range (humidity and
// temperature drawn independently, one decimal).
class SyntheticPulseSource : public PulseSource {
public:
    // Nominal DHT22 timings (microseconds)
    static constexpr uint32_t response_low_us = 80;
    static constexpr uint32_t response_high_us = 80;
    static constexpr uint32_t bit_low_us = 50;
    static constexpr uint32_t bit_zero_high_us = 26;
    static constexpr uint32_t bit_one_high_us = 70;

    explicit SyntheticPulseSource(uint32_t seed);

    SensorStatus capture(uint32_t trigger_low_us, uint32_t timeout_us, CaptureWindow& out) override;

    // Write the edges a sensor produces for frame, starting at start_us: the
    // 80/80 us response, 40 bits, and the final release. Appends to out.
    static void encodeFrame(const uint8_t (&frame)[5], int64_t start_us, CaptureWindow& out);

    // Build the DHT22 frame (checksum included) for the given tenths
    static void buildFrame(uint16_t humidity_tenths, int16_t temperature_tenths, uint8_t (&frame)[5]);

private:
    std::minstd_rand rng;
    std::uniform_int_distribution<int> tenths;
    int64_t clock_us; // virtual monotonic clock, advanced per capture
};

#endif // SYNTHETIC_PULSE_SOURCE_HPP
