#ifndef METRICS_SNAPSHOT_HPP
#define METRICS_SNAPSHOT_HPP

#include <cstddef>
#include <cstdint>

// Fixed set of exported series
enum class MetricField : uint8_t {
    HUMIDITY = 0,
    TEMPERATURE = 1,
    READ_ERRORS_TOTAL = 2,
    LAST_SUCCESS_TIMESTAMP = 3
};

static constexpr std::size_t kMetricFieldCount = 4;

inline std::size_t metricIndex(MetricField field) {
    return static_cast<std::size_t>(field);
}

inline const char* metricName(MetricField field) {
    switch (field) {
        case MetricField::HUMIDITY:               return "humidity";
        case MetricField::TEMPERATURE:            return "temperature";
        case MetricField::READ_ERRORS_TOTAL:      return "read_errors_total";
        case MetricField::LAST_SUCCESS_TIMESTAMP: return "last_success_timestamp";
    }
    return "unknown";
}

struct MetricSample {
    MetricField field;
    double      value;
};

// Consistent copy of every series taken under one lock
struct MetricsSnapshot {
    double values[kMetricFieldCount] = {};
    bool   has_value[kMetricFieldCount] = {};

    double value(MetricField field) const { return values[metricIndex(field)]; }
    bool has(MetricField field) const { return has_value[metricIndex(field)]; }
};

#endif // METRICS_SNAPSHOT_HPP
