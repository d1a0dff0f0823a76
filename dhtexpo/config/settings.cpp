#include <dhtexpo/config/settings.hpp>
#include <cstdio>
#include <cstring>

namespace {
    static constexpr uint8_t LOG_LEVEL_MAX = 3; // LogLevel::DEBUG

    void setDefaultAddr(RuntimeSettings& settings) {
        std::snprintf(settings.http_addr, sizeof(settings.http_addr), "%s", Config::Runtime::http_addr);
    }
}

RuntimeSettings::RuntimeSettings() {
    setDefaultAddr(*this);
}

bool parseIpv4(const char* text, uint32_t& out) {
    if (text == nullptr) {
        return false;
    }
    unsigned int a = 0, b = 0, c = 0, d = 0;
    char trailing = '\0';
    // %c catches trailing garbage such as "1.2.3.4x"
    if (std::sscanf(text, "%3u.%3u.%3u.%3u%c", &a, &b, &c, &d, &trailing) != 4) {
        return false;
    }
    if (a > 255 || b > 255 || c > 255 || d > 255) {
        return false;
    }
    out = (a << 24) | (b << 16) | (c << 8) | d;
    return true;
}

uint16_t sanitizeSettings(RuntimeSettings& settings) {
    uint16_t fixups = FIXUP_NONE;
    const RuntimeSettings defaults;

    if (settings.gpio_pin < 0 || settings.gpio_pin > Config::Hardware::Pins::max_gpio) {
        settings.gpio_pin = defaults.gpio_pin;
        fixups |= FIXUP_GPIO_PIN;
    }
    if (settings.interval_seconds < 1 || settings.interval_seconds > Config::Runtime::interval_seconds_max) {
        settings.interval_seconds = defaults.interval_seconds;
        fixups |= FIXUP_INTERVAL;
    }
    if (settings.http_port == 0) {
        settings.http_port = defaults.http_port;
        fixups |= FIXUP_HTTP_PORT;
    }
    // Unterminated or unparsable strings fall back to the wildcard address
    uint32_t addr = 0;
    if (std::memchr(settings.http_addr, '\0', sizeof(settings.http_addr)) == nullptr ||
        !parseIpv4(settings.http_addr, addr)) {
        setDefaultAddr(settings);
        fixups |= FIXUP_HTTP_ADDR;
    }
    if (static_cast<uint8_t>(settings.model) > static_cast<uint8_t>(SensorModel::DHT22)) {
        settings.model = defaults.model;
        fixups |= FIXUP_MODEL;
    }
    if (settings.bit_one_threshold_us == 0 ||
        settings.bit_one_threshold_us >= Config::Hardware::Dht::bit_one_threshold_limit_us) {
        settings.bit_one_threshold_us = defaults.bit_one_threshold_us;
        fixups |= FIXUP_BIT_ONE;
    }
    if (settings.log_level > LOG_LEVEL_MAX) {
        settings.log_level = defaults.log_level;
        fixups |= FIXUP_LOG_LEVEL;
    }
    return fixups;
}
