// Copy to secrets.hpp (git-ignored) and fill in before building the firmware.
#ifndef SECRETS_HPP
#define SECRETS_HPP

namespace Secrets {
    static constexpr const char* WIFI_SSID = "your-ssid";
    static constexpr const char* WIFI_PASSWORD = "your-password";
    // Also used as the DHCP hostname
    static constexpr const char* DEVICE_ID = "dhtexpo-01";
}

#endif // SECRETS_HPP
