#include <dhtexpo/exposition/prometheus_format.hpp>
#include <cstdio>

namespace {
    struct SeriesInfo {
        MetricField field;
        const char* help;
        const char* type;
        const char* value_format;
        bool        zero_when_unset; // counters and timestamps start at 0, gauges at NaN
    };

    static constexpr SeriesInfo SERIES[kMetricFieldCount] = {
        // The sensor resolves 0.1 in both channels
        {MetricField::HUMIDITY, "Relative humidity (percent) as read by the sensor", "gauge", "%s %.1f\n", false},
        {MetricField::TEMPERATURE, "Temperature (Celsius) as read by the sensor", "gauge", "%s %.1f\n", false},
        {MetricField::READ_ERRORS_TOTAL, "Sensor reads that failed for any reason", "counter", "%s %.0f\n", true},
        {MetricField::LAST_SUCCESS_TIMESTAMP, "Unix time of the last successful sensor read", "gauge", "%s %.0f\n", true},
    };

    // snprintf into the remaining space; false once the buffer is exhausted
    template <typename... Args>
    bool append(char* out, std::size_t out_size, std::size_t& used, const char* fmt, Args... args) {
        int n = std::snprintf(out + used, out_size - used, fmt, args...);
        if (n < 0 || static_cast<std::size_t>(n) >= out_size - used) {
            return false;
        }
        used += static_cast<std::size_t>(n);
        return true;
    }
}

namespace PrometheusFormat {
    bool render(const MetricsSnapshot& snapshot, char* out, std::size_t out_size) {
        if (out == nullptr || out_size == 0) {
            return false;
        }
        out[0] = '\0';
        std::size_t used = 0;

        for (const SeriesInfo& series : SERIES) {
            const char* name = metricName(series.field);
            if (!append(out, out_size, used, "# HELP %s %s\n# TYPE %s %s\n", name, series.help, name, series.type)) {
                return false;
            }

            bool ok = false;
            if (snapshot.has(series.field)) {
                ok = append(out, out_size, used, series.value_format, name, snapshot.value(series.field));
            } else if (series.zero_when_unset) {
                ok = append(out, out_size, used, "%s 0\n", name);
            } else {
                ok = append(out, out_size, used, "%s NaN\n", name);
            }
            if (!ok) {
                return false;
            }
        }
        return true;
    }
}
