#include <dhtexpo/tasks/sensor_sampling_task.hpp>
#include <dhtexpo/config/config.hpp>
#include <dhtexpo/utils/logger.hpp>
#include <dhtexpo/utils/watchdog.hpp>
#include <freertos/FreeRTOS.h>
#include <freertos/task.h>

namespace {
    static const char* TAG = "SAMPLE_TASK";

    // Static task resources
    static StaticTask_t s_task_tcb;
    static StackType_t s_task_stack[Config::Tasks::Sampling::stack_bytes / sizeof(StackType_t)];

    // Runtime state
    static SensorSampler* s_sampler = nullptr;
    static TickType_t s_period = 0;

    // vTaskDelayUntil in watchdog-sized slices; intervals may exceed the TWDT timeout
    static void sleepUntil(TickType_t& last_wake, TickType_t period) {
        const TickType_t slice = pdMS_TO_TICKS(Config::Tasks::Sampling::feed_slice_ms);
        const TickType_t wake = last_wake + period;
        for (;;) {
            Watchdog::feed();
            const TickType_t remaining = wake - xTaskGetTickCount();
            // A sample that overran its tick wraps 'remaining'; start the next one now
            if (remaining == 0 || remaining > period) {
                break;
            }
            vTaskDelay(remaining < slice ? remaining : slice);
        }
        last_wake = wake;
        // Don't try to catch up on ticks lost to an overrun
        if (xTaskGetTickCount() - last_wake > period) {
            last_wake = xTaskGetTickCount();
        }
    }

    static void logOutcome(SensorStatus status, uint32_t failures_before) {
        if (status == SensorStatus::OK) {
            const Reading& r = s_sampler->lastGoodReading();
            if (failures_before > 0) {
                LOG_INFO(TAG, "Sensor recovered after %lu failed reads: %.1f %%RH %.1f C",
                         static_cast<unsigned long>(failures_before),
                         static_cast<double>(r.humidity_pct), static_cast<double>(r.temperature_c));
            } else {
                LOG_DEBUG(TAG, "Read %.1f %%RH %.1f C",
                          static_cast<double>(r.humidity_pct), static_cast<double>(r.temperature_c));
            }
            return;
        }
        LOG_WARN(TAG, "Sensor read failed: %s (%lu in a row)%s", toString(status),
                 static_cast<unsigned long>(s_sampler->consecutiveFailures()),
                 s_sampler->hasReading() ? "; serving last good reading" : "");
    }

    static void taskFunction(void* arg) {
        (void)arg;
        LOG_INFO(TAG, "Sensor Sampling Task started, period %lu ms",
                 static_cast<unsigned long>(s_period * portTICK_PERIOD_MS));
        Watchdog::subscribe();

        TickType_t last_wake = xTaskGetTickCount();
        for (;;) {
            const uint32_t failures_before = s_sampler->consecutiveFailures();
            const SensorStatus status = s_sampler->sample();
            logOutcome(status, failures_before);

            sleepUntil(last_wake, s_period);
        }
    }
}

namespace SensorSamplingTask {
    void create(SensorSampler& sampler, uint32_t interval_seconds) {
        s_sampler = &sampler;
        // pdMS_TO_TICKS multiplies in TickType_t; do it in 64 bits instead
        s_period = static_cast<TickType_t>(static_cast<uint64_t>(interval_seconds) * configTICK_RATE_HZ);
        xTaskCreateStatic(taskFunction, "sensor_sampling",
                          sizeof(s_task_stack) / sizeof(StackType_t), nullptr,
                          tskIDLE_PRIORITY + Config::TaskPriorities::HIGH, s_task_stack, &s_task_tcb);
    }
}
