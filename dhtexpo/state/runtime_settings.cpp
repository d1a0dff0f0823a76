#include <dhtexpo/state/runtime_settings.hpp>
#include <dhtexpo/utils/logger.hpp>
#include <nvs.h>
#include <nvs_flash.h>

static const char* TAG = "RUNTIME_CFG";
static const char* NVS_NAMESPACE = "dhtexpo";

namespace {
    static RuntimeSettings s_settings;
    static bool s_initialized = false;

    // A missing key keeps the default silently; any other failure is worth a line
    static bool keyLoaded(esp_err_t err, const char* key) {
        if (err == ESP_OK) {
            return true;
        }
        if (err != ESP_ERR_NVS_NOT_FOUND) {
            LOG_WARN(TAG, "NVS read of '%s' failed: %s", key, esp_err_to_name(err));
        }
        return false;
    }

    static void loadFromNvs() {
        nvs_handle_t handle;
        esp_err_t err = nvs_open(NVS_NAMESPACE, NVS_READONLY, &handle);
        if (err != ESP_OK) {
            LOG_INFO(TAG, "No '%s' NVS namespace (%s); using built-in defaults", NVS_NAMESPACE, esp_err_to_name(err));
            return;
        }

        int32_t i32 = 0;
        uint32_t u32 = 0;
        uint16_t u16 = 0;
        uint8_t u8 = 0;

        if (keyLoaded(nvs_get_i32(handle, "gpio_pin", &i32), "gpio_pin")) {
            s_settings.gpio_pin = i32;
        }
        if (keyLoaded(nvs_get_u32(handle, "interval_s", &u32), "interval_s")) {
            s_settings.interval_seconds = u32;
        }
        if (keyLoaded(nvs_get_u16(handle, "http_port", &u16), "http_port")) {
            s_settings.http_port = u16;
        }
        size_t addr_len = sizeof(s_settings.http_addr);
        (void)keyLoaded(nvs_get_str(handle, "http_addr", s_settings.http_addr, &addr_len), "http_addr");
        if (keyLoaded(nvs_get_u8(handle, "dummy_mode", &u8), "dummy_mode")) {
            s_settings.dummy_mode = (u8 != 0);
        }
        if (keyLoaded(nvs_get_u8(handle, "model", &u8), "model")) {
            s_settings.model = static_cast<SensorModel>(u8);
        }
        if (keyLoaded(nvs_get_u16(handle, "bit1_us", &u16), "bit1_us")) {
            s_settings.bit_one_threshold_us = u16;
        }
        if (keyLoaded(nvs_get_u8(handle, "log_level", &u8), "log_level")) {
            s_settings.log_level = u8;
        }

        nvs_close(handle);
    }

    static void reportFixups(uint16_t fixups) {
        if (fixups & FIXUP_GPIO_PIN)  LOG_WARN(TAG, "%s", "gpio_pin out of range; using default");
        if (fixups & FIXUP_INTERVAL)  LOG_WARN(TAG, "%s", "interval_s must be 1..86400; using default");
        if (fixups & FIXUP_HTTP_PORT) LOG_WARN(TAG, "%s", "http_port must be non-zero; using default");
        if (fixups & FIXUP_HTTP_ADDR) LOG_WARN(TAG, "%s", "http_addr is not a dotted IPv4 address; using 0.0.0.0");
        if (fixups & FIXUP_MODEL)     LOG_WARN(TAG, "%s", "model must be 0 (auto), 1 (DHT11) or 2 (DHT22); using default");
        if (fixups & FIXUP_BIT_ONE)   LOG_WARN(TAG, "%s", "bit1_us out of range; using default");
        if (fixups & FIXUP_LOG_LEVEL) LOG_WARN(TAG, "%s", "log_level must be 0..3; using default");
    }
}

namespace RuntimeSettingsStore {
    void init() {
        if (s_initialized) {
            return;
        }

        loadFromNvs();
        reportFixups(sanitizeSettings(s_settings));

        LOG_INFO(TAG, "gpio=%ld interval=%lus http=%s:%u dummy=%s model=%s bit1=%luus",
                 static_cast<long>(s_settings.gpio_pin),
                 static_cast<unsigned long>(s_settings.interval_seconds),
                 s_settings.http_addr, static_cast<unsigned>(s_settings.http_port),
                 s_settings.dummy_mode ? "yes" : "no",
                 toString(s_settings.model),
                 static_cast<unsigned long>(s_settings.bit_one_threshold_us));
        s_initialized = true;
    }

    const RuntimeSettings& get() {
        return s_settings;
    }
}
