#ifndef NETWORK_CONFIG_HPP
#define NETWORK_CONFIG_HPP

#include <cstdint>
#include <dhtexpo/secrets.hpp>

// Network settings for the firmware build only; the portable core never
// includes this header.
namespace Config {
namespace Wifi {
    // Network credentials sourced from secrets.hpp (git-ignored)
    static constexpr const char* ssid = Secrets::WIFI_SSID;
    static constexpr const char* password = Secrets::WIFI_PASSWORD;

    // Behavior
    static constexpr bool auto_connect_on_start = true;
    static constexpr int max_retry_count = 5;           // Event-handler retries before the network task takes over
    static constexpr uint32_t reconnect_interval_ms = 30000;
    static constexpr uint32_t initial_ip_wait_ms = 15000;
}

namespace Device {
    static constexpr const char* id = Secrets::DEVICE_ID;
}

namespace Tasks {
namespace Network {
    static constexpr uint32_t stack_bytes = 4096;
    static constexpr uint32_t poll_period_ms = 1000;
}
}
} // namespace Config

#endif // NETWORK_CONFIG_HPP
