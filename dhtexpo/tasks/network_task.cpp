#include <dhtexpo/tasks/network_task.hpp>
#include <dhtexpo/config/config.hpp>
#include <dhtexpo/config/network_config.hpp>
#include <dhtexpo/network/wifi_manager.hpp>
#include <dhtexpo/utils/logger.hpp>
#include <dhtexpo/utils/time_sync.hpp>
#include <freertos/FreeRTOS.h>
#include <freertos/task.h>

namespace {
    static const char* TAG = "NET_TASK";

    static StaticTask_t s_task_tcb;
    static StackType_t s_task_stack[Config::Tasks::Network::stack_bytes / sizeof(StackType_t)];

    static WiFiManager s_wifi_manager;

    static void taskFunction(void* arg) {
        (void)arg;
        LOG_INFO(TAG, "%s", "Network Task started");

        bool time_inited = false;
        bool time_synced_once = false;
        TickType_t last_reconnect_attempt = xTaskGetTickCount();
        const TickType_t reconnect_interval = pdMS_TO_TICKS(Config::Wifi::reconnect_interval_ms);
        const TickType_t poll_period = pdMS_TO_TICKS(Config::Tasks::Network::poll_period_ms);

        for (;;) {
            TickType_t now = xTaskGetTickCount();
            const bool has_ip = s_wifi_manager.hasIp();

            if (!has_ip && (now - last_reconnect_attempt) > reconnect_interval) {
                LOG_INFO(TAG, "No IP (link %s); reconnecting WiFi", s_wifi_manager.isConnected() ? "up" : "down");
                (void)s_wifi_manager.reconnect();
                last_reconnect_attempt = now;
            }

            if (has_ip && !time_inited) {
                TimeSync::init();
                time_inited = true;
            }
            // Wait for the first sync once so timestamps are wall-clock from then on
            if (has_ip && time_inited && !time_synced_once) {
                (void)TimeSync::waitForSync(Config::TimeSync::boot_wait_ms);
                time_synced_once = true;
            }

            vTaskDelay(poll_period);
        }
    }
}

namespace NetworkTask {
    bool create() {
        if (!s_wifi_manager.init()) {
            return false;
        }
        if (!s_wifi_manager.waitForIp(Config::Wifi::initial_ip_wait_ms)) {
            // Not fatal: the metrics endpoint comes up as soon as an address is assigned
            LOG_WARN(TAG, "No IP after %lu ms; continuing, reconnect runs in background",
                     static_cast<unsigned long>(Config::Wifi::initial_ip_wait_ms));
        }
        xTaskCreateStatic(taskFunction, "network",
                          sizeof(s_task_stack) / sizeof(StackType_t), nullptr,
                          tskIDLE_PRIORITY + Config::TaskPriorities::NORMAL, s_task_stack, &s_task_tcb);
        return true;
    }
}
