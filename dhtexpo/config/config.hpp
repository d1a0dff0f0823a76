#ifndef CONFIG_HPP
#define CONFIG_HPP

#include <cstdint>

// Compile-time defaults. Values under Runtime:: may be overridden from NVS at
// boot (see state/runtime_settings.hpp); everything else is fixed per build.
// Kept free of IDF headers so the portable core can include it on a host.
namespace Config {

namespace Hardware {
namespace Pins {
    // Store as plain int; cast to gpio_num_t at the driver boundary
    static constexpr int dht_gpio = 4;
    // Highest GPIO number accepted from NVS (ESP32-S3 tops out at 48)
    static constexpr int max_gpio = 48;
} // namespace Pins

// DHT single-wire timing (microseconds)
namespace Dht {
    // Host start signal: DHT11 needs >= 18 ms, DHT22/AM2302 is happy with ~1 ms
    static constexpr uint32_t trigger_low_dht11_us = 18000;
    static constexpr uint32_t trigger_low_dht22_us = 1100;

    // Capture ends after this long without a transition
    static constexpr uint32_t idle_timeout_us = 1000;
    // Hard ceiling on one capture, even on a line that keeps toggling
    static constexpr uint32_t capture_max_us = 10000;

    // Sensor response: ~80 us low then ~80 us high
    static constexpr uint32_t response_min_us = 40;
    static constexpr uint32_t response_max_us = 120;

    // High pulse of a bit: ~26-28 us for 0, ~70 us for 1.
    // Calibration value; override with the bit1_us NVS key after measuring.
    static constexpr uint32_t bit_one_threshold_us = 50;
    // Thresholds at or above this are rejected as misconfiguration
    static constexpr uint32_t bit_one_threshold_limit_us = 200;
} // namespace Dht
} // namespace Hardware

namespace Runtime {
    static constexpr uint32_t interval_seconds = 10;
    // One day; longer periods overflow the 32-bit tick count at 1 kHz
    static constexpr uint32_t interval_seconds_max = 86400;
    static constexpr uint16_t http_port = 9200;
    static constexpr const char* http_addr = "0.0.0.0";
    static constexpr bool dummy_mode = false;
}

namespace Tasks {
namespace Sampling {
    static constexpr uint32_t stack_bytes = 4096;
    // Longest single vTaskDelay between watchdog feeds while waiting for a tick
    static constexpr uint32_t feed_slice_ms = 1000;
}
}

namespace Watchdog {
    static constexpr uint32_t timeout_ms = 8000;
}

namespace Http {
    static constexpr const char* metrics_uri = "/metrics";
    static constexpr const char* content_type = "text/plain; version=0.0.4; charset=utf-8";
    // Rendered exposition is well under 1 KiB for the four series
    static constexpr uint32_t response_buffer_bytes = 1024;
    static constexpr uint32_t server_stack_bytes = 4096;
}

namespace TimeSync {
    static constexpr unsigned int boot_wait_ms = 10000;
    static constexpr unsigned int poll_step_ms = 100;
    static constexpr const char* servers[] = {"pool.ntp.org", "time.google.com"};
    // 2024-01-01T00:00:00Z; anything earlier is the unsynced boot clock
    static constexpr uint32_t min_valid_epoch = 1704067200;
}

// Task priority levels (higher number = higher priority, can preempt lower).
// Plain ints here; tasks add them to tskIDLE_PRIORITY.
namespace TaskPriorities {
    // Sensor capture needs the CPU promptly once the start pulse is released
    static constexpr int HIGH   = 2;
    // HTTP exposition tolerates latency
    static constexpr int NORMAL = 1;
}

} // namespace Config

#endif // CONFIG_HPP
