#ifndef DHT_DECODER_HPP
#define DHT_DECODER_HPP

#include <cstdint>
#include <dhtexpo/config/config.hpp>
#include <dhtexpo/models/capture_window.hpp>
#include <dhtexpo/models/reading.hpp>
#include <dhtexpo/models/sensor_model.hpp>
#include <dhtexpo/models/sensor_status.hpp>

// Start pulse length the model needs
uint32_t triggerLowUs(SensorModel model);

struct DecoderSettings {
    SensorModel model = SensorModel::DHT22;
    uint32_t bit_one_threshold_us = Config::Hardware::Dht::bit_one_threshold_us;
    uint32_t response_min_us = Config::Hardware::Dht::response_min_us;
    uint32_t response_max_us = Config::Hardware::Dht::response_max_us;
};

namespace DhtDecoder {
    static constexpr int kFrameBytes = 5;
    static constexpr int kFrameBits = kFrameBytes * 8;

    // Plausibility bounds; a frame outside them is rejected even with a good checksum
    static constexpr float humidity_min_pct = 0.0f;
    static constexpr float humidity_max_pct = 100.0f;
    static constexpr float temperature_min_c = -40.0f;
    static constexpr float temperature_max_c = 80.0f;

    // Turn one capture into 5 frame bytes. Pulses are measured on the high
    // phase of each bit: below settings.bit_one_threshold_us is 0, otherwise 1.
    // Returns OK, RESPONSE_MISSING or INCOMPLETE_FRAME.
    SensorStatus extractFrame(const CaptureWindow& window, const DecoderSettings& settings,
                              uint8_t (&frame)[kFrameBytes]);

    // Validate checksum and convert frame bytes to physical units.
    // Returns OK, CHECKSUM_ERROR or OUT_OF_RANGE. out.timestamp_s is not touched.
    SensorStatus decodeFrame(const uint8_t (&frame)[kFrameBytes], SensorModel model, Reading& out);

    // extractFrame + decodeFrame. Pure; out is written only on OK.
    SensorStatus decode(const CaptureWindow& window, const DecoderSettings& settings, Reading& out);

    inline uint8_t checksum(const uint8_t (&frame)[kFrameBytes]) {
        return static_cast<uint8_t>(frame[0] + frame[1] + frame[2] + frame[3]);
    }
}

#endif // DHT_DECODER_HPP
