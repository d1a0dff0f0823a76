#ifndef SENSOR_SAMPLER_HPP
#define SENSOR_SAMPLER_HPP

#include <cstdint>
#include <dhtexpo/config/config.hpp>
#include <dhtexpo/config/settings.hpp>
#include <dhtexpo/hardware/pulse_source.hpp>
#include <dhtexpo/models/reading.hpp>
#include <dhtexpo/models/sensor_status.hpp>
#include <dhtexpo/protocol/dht_decoder.hpp>
#include <dhtexpo/state/metrics_store.hpp>

struct SamplerSettings {
    DecoderSettings decoder;
    uint32_t trigger_low_us = Config::Hardware::Dht::trigger_low_dht22_us;
    uint32_t idle_timeout_us = Config::Hardware::Dht::idle_timeout_us;
};

// Sampler settings derived from the boot-time runtime settings
SamplerSettings samplerSettingsFrom(const RuntimeSettings& settings);

// Runs one trigger/capture/decode cycle per call and publishes the outcome.
// A failed cycle counts an error and leaves the last good values in place;
// there is no retry inside a cycle and no limit on consecutive failures.
class SensorSampler {
public:
    // Unix seconds used to stamp readings; 0 = wall time not known yet
    using ClockFn = uint32_t (*)();

    SensorSampler(PulseSource& source, MetricsStore& store, const SamplerSettings& settings, ClockFn clock);

    SensorStatus sample();

    bool hasReading() const { return has_reading; }
    const Reading& lastGoodReading() const { return last_good_reading; }
    uint32_t consecutiveFailures() const { return consecutive_failures; }

private:
    PulseSource& source;
    MetricsStore& store;
    SamplerSettings settings;
    ClockFn clock;

    CaptureWindow window;
    Reading last_good_reading;
    bool has_reading;
    uint32_t consecutive_failures;
};

#endif // SENSOR_SAMPLER_HPP
