#ifndef METRICS_STORE_HPP
#define METRICS_STORE_HPP

#include <initializer_list>
#include <mutex>
#include <dhtexpo/models/metrics_snapshot.hpp>

// Current values of the exported series.
// One writer (the sensor sampler), any number of readers (HTTP handlers).
// The lock is held only while copying values in or out, so a scrape never
// waits on a sensor read and never sees half of a publish.
class MetricsStore {
public:
    MetricsStore() = default;
    MetricsStore(const MetricsStore&) = delete;
    MetricsStore& operator=(const MetricsStore&) = delete;

    void publish(MetricField field, double value);

    // Apply several fields as one update
    void publish(std::initializer_list<MetricSample> samples);

    // Counter bump
    void increment(MetricField field, double delta = 1.0);

    MetricsSnapshot snapshot() const;

private:
    mutable std::mutex mutex;
    MetricsSnapshot current;
};

#endif // METRICS_STORE_HPP
