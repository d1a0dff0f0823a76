#include <dhtexpo/sensor/sensor_sampler.hpp>

SamplerSettings samplerSettingsFrom(const RuntimeSettings& settings) {
    SamplerSettings sampler;
    sampler.decoder.model = settings.model;
    sampler.decoder.bit_one_threshold_us = settings.bit_one_threshold_us;
    sampler.trigger_low_us = triggerLowUs(settings.model);
    sampler.idle_timeout_us = Config::Hardware::Dht::idle_timeout_us;
    return sampler;
}

SensorSampler::SensorSampler(PulseSource& source, MetricsStore& store, const SamplerSettings& settings, ClockFn clock)
    : source(source),
      store(store),
      settings(settings),
      clock(clock),
      window(),
      last_good_reading{0.0f, 0.0f, 0},
      has_reading(false),
      consecutive_failures(0) {}

SensorStatus SensorSampler::sample() {
    const uint32_t captured_at = clock();

    SensorStatus status = source.capture(settings.trigger_low_us, settings.idle_timeout_us, window);
    Reading reading{0.0f, 0.0f, captured_at};
    if (status == SensorStatus::OK) {
        status = DhtDecoder::decode(window, settings.decoder, reading);
    }

    if (status != SensorStatus::OK) {
        // Hardware and decode failures are handled alike; the stale reading stays published
        ++consecutive_failures;
        store.increment(MetricField::READ_ERRORS_TOTAL);
        return status;
    }

    consecutive_failures = 0;
    last_good_reading = reading;
    has_reading = true;
    if (reading.timestamp_s == 0) {
        // A boot-relative time would read as 1970 on the dashboard
        store.publish({
            {MetricField::HUMIDITY, reading.humidity_pct},
            {MetricField::TEMPERATURE, reading.temperature_c},
        });
    } else {
        store.publish({
            {MetricField::HUMIDITY, reading.humidity_pct},
            {MetricField::TEMPERATURE, reading.temperature_c},
            {MetricField::LAST_SUCCESS_TIMESTAMP, static_cast<double>(reading.timestamp_s)},
        });
    }
    return SensorStatus::OK;
}
