#include <freertos/FreeRTOS.h>
#include <freertos/task.h>
#include <esp_random.h>
#include <esp_system.h>
#include <nvs_flash.h>
#include <dhtexpo/config/config.hpp>
#include <dhtexpo/config/settings.hpp>
#include <dhtexpo/hardware/gpio_pulse_source.hpp>
#include <dhtexpo/hardware/synthetic_pulse_source.hpp>
#include <dhtexpo/network/metrics_http_server.hpp>
#include <dhtexpo/sensor/sensor_sampler.hpp>
#include <dhtexpo/state/metrics_store.hpp>
#include <dhtexpo/state/runtime_settings.hpp>
#include <dhtexpo/tasks/network_task.hpp>
#include <dhtexpo/tasks/sensor_sampling_task.hpp>
#include <dhtexpo/utils/logger.hpp>
#include <dhtexpo/utils/time_sync.hpp>
#include <dhtexpo/utils/watchdog.hpp>

namespace {
    static const char* TAG = "MAIN";

    // Shared by the sampling task (writer) and the HTTP server (readers)
    static MetricsStore s_metrics;

    [[noreturn]] static void fatalStartupError(const char* what) {
        LOG_ERROR(TAG, "Startup failed: %s", what);
        // Resets the chip; the next boot starts over from scratch
        esp_system_abort(what);
    }

    static void initNvs() {
        esp_err_t err = nvs_flash_init();
        if (err == ESP_ERR_NVS_NO_FREE_PAGES || err == ESP_ERR_NVS_NEW_VERSION_FOUND) {
            ESP_ERROR_CHECK(nvs_flash_erase());
            err = nvs_flash_init();
        }
        if (err != ESP_OK) {
            // Settings fall back to compile-time defaults; WiFi will report its own failure
            LOG_ERROR(TAG, "NVS init failed: %s", esp_err_to_name(err));
        }
    }

    static PulseSource& createPulseSource(const RuntimeSettings& settings) {
        if (settings.dummy_mode) {
            static SyntheticPulseSource dummy(esp_random());
            LOG_INFO(TAG, "Running in dummy mode. Metrics will be updated every %lu seconds",
                     static_cast<unsigned long>(settings.interval_seconds));
            return dummy;
        }

        static GpioPulseSource gpio(static_cast<gpio_num_t>(settings.gpio_pin));
        if (!gpio.init()) {
            fatalStartupError("cannot acquire the sensor GPIO");
        }
        LOG_INFO(TAG, "Will read %s on GPIO %ld every %lu seconds", toString(settings.model),
                 static_cast<long>(settings.gpio_pin), static_cast<unsigned long>(settings.interval_seconds));
        return gpio;
    }
}

extern "C" void app_main(void)
{
    Logger::setLevel(LogLevel::INFO);
    LOG_INFO(TAG, "%s", "---DHT metrics exporter started---");

    initNvs();
    RuntimeSettingsStore::init();
    const RuntimeSettings& settings = RuntimeSettingsStore::get();
    Logger::setLevel(static_cast<LogLevel>(settings.log_level));
    if (!Logger::enabled(LogLevel::DEBUG)) {
        // Driver chatter on every reconnect and request
        Logger::setEspLogLevel("wifi", ESP_LOG_WARN);
        Logger::setEspLogLevel("httpd_txrx", ESP_LOG_WARN);
    }

    if (!NetworkTask::create()) {
        // No network means nobody can scrape; treat like a failed bind
        fatalStartupError("cannot initialize WiFi");
    }

    PulseSource& source = createPulseSource(settings);

    // Static: referenced by tasks after app_main has parked
    static SensorSampler sampler(source, s_metrics, samplerSettingsFrom(settings), &TimeSync::unixSeconds);

    static MetricsHttpServer http_server(s_metrics);
    if (!http_server.start(settings.http_addr, settings.http_port)) {
        fatalStartupError("cannot start the HTTP server");
    }

    Watchdog::init(Config::Watchdog::timeout_ms);
    SensorSamplingTask::create(sampler, settings.interval_seconds);

    // Main task has nothing to do after initialization - block forever
    for (;;) {
        vTaskDelay(portMAX_DELAY);
    }
}
