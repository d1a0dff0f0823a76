#include <dhtexpo/utils/time_sync.hpp>
#include <dhtexpo/config/config.hpp>
#include <dhtexpo/utils/logger.hpp>

#include <ctime>
#include <esp_sntp.h>
#include <freertos/FreeRTOS.h>
#include <freertos/task.h>

namespace {
    static const char* TAG = "TIME_SYNC";
    static bool s_started = false;
    // Bumped from the lwIP task on every completed sync
    static volatile uint32_t s_sync_count = 0;

    static void onSynced(struct timeval* tv) {
        ++s_sync_count;
        struct tm utc;
        const time_t now = tv != nullptr ? tv->tv_sec : time(nullptr);
        gmtime_r(&now, &utc);
        char text[24];
        (void)strftime(text, sizeof(text), "%Y-%m-%dT%H:%M:%SZ", &utc);
        LOG_INFO(TAG, "Clock set to %s (sync #%lu)", text, static_cast<unsigned long>(s_sync_count));
    }
}

namespace TimeSync {
    void init() {
        if (s_started) {
            return;
        }
        esp_sntp_setoperatingmode(ESP_SNTP_OPMODE_POLL);
        uint8_t idx = 0;
        for (const char* server : Config::TimeSync::servers) {
            esp_sntp_setservername(idx++, server);
        }
        esp_sntp_set_time_sync_notification_cb(&onSynced);
        esp_sntp_init();
        s_started = true;
        LOG_INFO(TAG, "SNTP started with %u servers", static_cast<unsigned>(idx));
    }

    bool isSynced() {
        if (s_sync_count > 0) {
            return true;
        }
        // RTC kept across a soft reset also counts
        return static_cast<uint32_t>(time(nullptr)) >= Config::TimeSync::min_valid_epoch;
    }

    bool waitForSync(unsigned int timeout_ms) {
        init();
        const TickType_t start = xTaskGetTickCount();
        const TickType_t budget = pdMS_TO_TICKS(timeout_ms);
        while (!isSynced()) {
            if (xTaskGetTickCount() - start >= budget) {
                LOG_WARN(TAG, "No SNTP answer within %u ms; last_success_timestamp waits for it",
                         timeout_ms);
                return false;
            }
            vTaskDelay(pdMS_TO_TICKS(Config::TimeSync::poll_step_ms));
        }
        return true;
    }

    uint32_t unixSeconds() {
        if (!isSynced()) {
            return 0;
        }
        return static_cast<uint32_t>(time(nullptr));
    }
}
