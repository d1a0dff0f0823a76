#ifndef PROMETHEUS_FORMAT_HPP
#define PROMETHEUS_FORMAT_HPP

#include <cstddef>
#include <dhtexpo/models/metrics_snapshot.hpp>

namespace PrometheusFormat {
    // Render the snapshot in text exposition format 0.0.4, one HELP/TYPE/value
    // block per series. Gauges never published render as NaN; the counter and
    // last_success_timestamp start at 0.
    // Returns false if out_size is too small (out is still null-terminated).
    bool render(const MetricsSnapshot& snapshot, char* out, std::size_t out_size);
}

#endif // PROMETHEUS_FORMAT_HPP
