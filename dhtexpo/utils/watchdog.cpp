#include <dhtexpo/utils/watchdog.hpp>
#include <dhtexpo/utils/logger.hpp>
#include <esp_task_wdt.h>

namespace {
    static const char* TAG = "WATCHDOG";
    static bool s_subscribed = false;
}

namespace Watchdog {
    void init(uint32_t timeout_ms) {
        esp_task_wdt_config_t config = {
            .timeout_ms = timeout_ms,
            .idle_core_mask = 0,  // Don't monitor idle tasks
            .trigger_panic = true
        };
        // Reconfigure if IDF already started the TWDT, initialize otherwise
        esp_err_t err = esp_task_wdt_reconfigure(&config);
        if (err == ESP_ERR_INVALID_STATE) {
            err = esp_task_wdt_init(&config);
        }
        if (err == ESP_OK) {
            LOG_INFO(TAG, "TWDT configured: %lu ms timeout", static_cast<unsigned long>(timeout_ms));
        } else {
            LOG_ERROR(TAG, "TWDT config failed: %s", esp_err_to_name(err));
        }
    }

    void subscribe() {
        esp_err_t err = esp_task_wdt_add(nullptr);
        if (err != ESP_OK) {
            LOG_WARN(TAG, "TWDT subscribe failed: %s", esp_err_to_name(err));
            return;
        }
        s_subscribed = true;
    }

    void feed() {
        if (!s_subscribed) {
            return;
        }
        esp_err_t err = esp_task_wdt_reset();
        if (err != ESP_OK) {
            LOG_WARN(TAG, "TWDT reset failed: %s", esp_err_to_name(err));
        }
    }
}
