#include <dhtexpo/hardware/synthetic_pulse_source.hpp>

namespace {
    // Gap between the host releasing the line and the sensor answering
    static constexpr uint32_t RESPONSE_DELAY_US = 30;
    // Dummy readings span 15.0..30.0 in both channels
    static constexpr int MIN_TENTHS = 150;
    static constexpr int MAX_TENTHS = 300;
}

SyntheticPulseSource::SyntheticPulseSource(uint32_t seed)
    : rng(seed == 0 ? 1U : seed), // minstd_rand must not be seeded with 0
      tenths(MIN_TENTHS, MAX_TENTHS),
      clock_us(0) {}

SensorStatus SyntheticPulseSource::capture(uint32_t trigger_low_us, uint32_t timeout_us, CaptureWindow& out) {
    out.clear();

    uint8_t frame[5];
    const uint16_t humidity = static_cast<uint16_t>(tenths(rng));
    const int16_t temperature = static_cast<int16_t>(tenths(rng));
    buildFrame(humidity, temperature, frame);

    clock_us += trigger_low_us;
    encodeFrame(frame, clock_us, out);
    // Leave the virtual clock where a real capture would end: last edge + idle timeout
    clock_us = out.edges[out.count - 1].timestamp_us + timeout_us;
    return SensorStatus::OK;
}

void SyntheticPulseSource::buildFrame(uint16_t humidity_tenths, int16_t temperature_tenths, uint8_t (&frame)[5]) {
    uint16_t magnitude = static_cast<uint16_t>(temperature_tenths < 0 ? -temperature_tenths : temperature_tenths);
    frame[0] = static_cast<uint8_t>(humidity_tenths >> 8);
    frame[1] = static_cast<uint8_t>(humidity_tenths & 0xFF);
    frame[2] = static_cast<uint8_t>((magnitude >> 8) & 0x7F);
    if (temperature_tenths < 0) {
        frame[2] |= 0x80;
    }
    frame[3] = static_cast<uint8_t>(magnitude & 0xFF);
    frame[4] = static_cast<uint8_t>(frame[0] + frame[1] + frame[2] + frame[3]);
}

void SyntheticPulseSource::encodeFrame(const uint8_t (&frame)[5], int64_t start_us, CaptureWindow& out) {
    int64_t t = start_us;
    out.push(true, t); // host releases the line

    t += RESPONSE_DELAY_US;
    out.push(false, t);
    t += response_low_us;
    out.push(true, t);
    t += response_high_us;
    out.push(false, t);

    for (int i = 0; i < 40; ++i) {
        const bool one = ((frame[i / 8] >> (7 - (i % 8))) & 0x01) != 0;
        t += bit_low_us;
        out.push(true, t);
        t += one ? bit_one_high_us : bit_zero_high_us;
        out.push(false, t);
    }

    // Sensor lets go of the line after the last bit
    t += bit_low_us;
    out.push(true, t);
}
