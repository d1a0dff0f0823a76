#ifndef SETTINGS_HPP
#define SETTINGS_HPP

#include <cstdint>
#include <dhtexpo/config/config.hpp>
#include <dhtexpo/models/sensor_model.hpp>

// Process-wide settings, fixed after boot.
struct RuntimeSettings {
    int32_t     gpio_pin = Config::Hardware::Pins::dht_gpio;
    uint32_t    interval_seconds = Config::Runtime::interval_seconds;
    uint16_t    http_port = Config::Runtime::http_port;
    char        http_addr[16] = {}; // dotted IPv4, "0.0.0.0" = any
    bool        dummy_mode = Config::Runtime::dummy_mode;
    SensorModel model = SensorModel::DHT22;
    uint32_t    bit_one_threshold_us = Config::Hardware::Dht::bit_one_threshold_us;
    uint8_t     log_level = 2; // LogLevel::INFO

    RuntimeSettings();
};

// Bit flags naming the fields sanitizeSettings() reset to their default
enum SettingsFixups : uint16_t {
    FIXUP_NONE        = 0,
    FIXUP_GPIO_PIN    = 1 << 0,
    FIXUP_INTERVAL    = 1 << 1,
    FIXUP_HTTP_PORT   = 1 << 2,
    FIXUP_HTTP_ADDR   = 1 << 3,
    FIXUP_MODEL       = 1 << 4,
    FIXUP_BIT_ONE     = 1 << 5,
    FIXUP_LOG_LEVEL   = 1 << 6,
};

// Parse dotted-quad IPv4 ("a.b.c.d", each 0..255) into host byte order
bool parseIpv4(const char* text, uint32_t& out);

// Replace every invalid field with its default and report which ones changed
uint16_t sanitizeSettings(RuntimeSettings& settings);

#endif // SETTINGS_HPP
