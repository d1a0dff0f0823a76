#include <dhtexpo/state/metrics_store.hpp>

void MetricsStore::publish(MetricField field, double value) {
    std::lock_guard<std::mutex> lock(mutex);
    current.values[metricIndex(field)] = value;
    current.has_value[metricIndex(field)] = true;
}

void MetricsStore::publish(std::initializer_list<MetricSample> samples) {
    std::lock_guard<std::mutex> lock(mutex);
    for (const MetricSample& sample : samples) {
        current.values[metricIndex(sample.field)] = sample.value;
        current.has_value[metricIndex(sample.field)] = true;
    }
}

void MetricsStore::increment(MetricField field, double delta) {
    std::lock_guard<std::mutex> lock(mutex);
    current.values[metricIndex(field)] += delta;
    current.has_value[metricIndex(field)] = true;
}

MetricsSnapshot MetricsStore::snapshot() const {
    std::lock_guard<std::mutex> lock(mutex);
    return current;
}
