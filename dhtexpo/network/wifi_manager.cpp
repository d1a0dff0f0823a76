#include <dhtexpo/network/wifi_manager.hpp>
#include <dhtexpo/config/network_config.hpp>
#include <dhtexpo/utils/logger.hpp>

#include <esp_err.h>
#include <esp_wifi.h>
#include <cstdio>

static const char* TAG = "WiFiManager";

namespace {
    static constexpr EventBits_t GOT_IP_BIT = BIT0;
}

WiFiManager::WiFiManager()
    : initialized(false),
      connected(false),
      got_ip(false),
      retry_count(0),
      netif(nullptr),
      events(nullptr),
      events_storage(),
      wifi_any_id_instance(nullptr),
      ip_got_ip_instance(nullptr) {}

bool WiFiManager::init() {
    if (initialized) {
        return true;
    }

    events = xEventGroupCreateStatic(&events_storage);

    esp_err_t err = esp_netif_init();
    if (err != ESP_OK) {
        LOG_ERROR(TAG, "esp_netif_init failed: %s", esp_err_to_name(err));
        return false;
    }
    err = esp_event_loop_create_default();
    if (err != ESP_OK && err != ESP_ERR_INVALID_STATE) {
        LOG_ERROR(TAG, "Event loop create failed: %s", esp_err_to_name(err));
        return false;
    }

    netif = esp_netif_create_default_wifi_sta();
    if (netif == nullptr) {
        LOG_ERROR(TAG, "%s", "Failed to create STA netif");
        return false;
    }
    (void)esp_netif_set_hostname(netif, Config::Device::id);

    wifi_init_config_t cfg = WIFI_INIT_CONFIG_DEFAULT();
    err = esp_wifi_init(&cfg);
    if (err != ESP_OK) {
        LOG_ERROR(TAG, "esp_wifi_init failed: %s", esp_err_to_name(err));
        return false;
    }

    ESP_ERROR_CHECK(esp_event_handler_instance_register(
        WIFI_EVENT,
        ESP_EVENT_ANY_ID,
        &WiFiManager::wifiEventHandler,
        this,
        &wifi_any_id_instance
    ));
    ESP_ERROR_CHECK(esp_event_handler_instance_register(
        IP_EVENT,
        IP_EVENT_STA_GOT_IP,
        &WiFiManager::ipEventHandler,
        this,
        &ip_got_ip_instance
    ));

    ESP_ERROR_CHECK(esp_wifi_set_mode(WIFI_MODE_STA));

    wifi_config_t wifi_config = {};
    // IDF expects zero-terminated credentials
    snprintf(reinterpret_cast<char*>(wifi_config.sta.ssid),
             sizeof(wifi_config.sta.ssid), "%s", Config::Wifi::ssid);
    snprintf(reinterpret_cast<char*>(wifi_config.sta.password),
             sizeof(wifi_config.sta.password), "%s", Config::Wifi::password);
    wifi_config.sta.threshold.authmode = WIFI_AUTH_WPA2_PSK;
    wifi_config.sta.sae_pwe_h2e = WPA3_SAE_PWE_BOTH;
    wifi_config.sta.pmf_cfg.capable = true;
    wifi_config.sta.pmf_cfg.required = false;

    ESP_ERROR_CHECK(esp_wifi_set_config(WIFI_IF_STA, &wifi_config));
    // Modem sleep adds tens of ms to every scrape
    (void)esp_wifi_set_ps(WIFI_PS_NONE);
    ESP_ERROR_CHECK(esp_wifi_start());

    initialized = true;
    LOG_INFO(TAG, "STA started, SSID: %s", Config::Wifi::ssid);
    return true;
}

bool WiFiManager::connect() {
    if (!initialized) {
        if (!init()) {
            return false;
        }
    }
    retry_count = 0;
    got_ip = false;
    xEventGroupClearBits(events, GOT_IP_BIT);
    esp_err_t err = esp_wifi_connect();
    if (err != ESP_OK) {
        LOG_ERROR(TAG, "esp_wifi_connect failed: %s", esp_err_to_name(err));
        return false;
    }
    LOG_INFO(TAG, "Connecting to SSID: %s", Config::Wifi::ssid);
    return true;
}

void WiFiManager::disconnect() {
    esp_err_t err = esp_wifi_disconnect();
    if (err != ESP_OK && err != ESP_ERR_WIFI_NOT_STARTED) {
        LOG_WARN(TAG, "esp_wifi_disconnect failed: %s", esp_err_to_name(err));
    }
    connected = false;
    got_ip = false;
    if (events != nullptr) {
        xEventGroupClearBits(events, GOT_IP_BIT);
    }
}

bool WiFiManager::reconnect() {
    disconnect();
    return connect();
}

bool WiFiManager::waitForIp(uint32_t timeout_ms) {
    if (events == nullptr) {
        return false;
    }
    EventBits_t bits = xEventGroupWaitBits(events, GOT_IP_BIT, pdFALSE, pdTRUE, pdMS_TO_TICKS(timeout_ms));
    return (bits & GOT_IP_BIT) != 0;
}

void WiFiManager::wifiEventHandler(void* arg, esp_event_base_t event_base, int32_t event_id, void* event_data) {
    (void)event_base;
    (void)event_data;
    WiFiManager* self = static_cast<WiFiManager*>(arg);
    switch (event_id) {
        case WIFI_EVENT_STA_START:
            LOG_INFO(TAG, "%s", "WIFI_EVENT_STA_START");
            if (Config::Wifi::auto_connect_on_start) {
                (void)esp_wifi_connect();
            }
            break;
        case WIFI_EVENT_STA_CONNECTED:
            LOG_INFO(TAG, "%s", "WIFI_EVENT_STA_CONNECTED");
            self->connected = true;
            break;
        case WIFI_EVENT_STA_DISCONNECTED:
            LOG_WARN(TAG, "%s", "WIFI_EVENT_STA_DISCONNECTED");
            self->connected = false;
            self->got_ip = false;
            xEventGroupClearBits(self->events, GOT_IP_BIT);
            if (self->retry_count < Config::Wifi::max_retry_count) {
                self->retry_count++;
                LOG_INFO(TAG, "Retrying WiFi (%d/%d)", self->retry_count, Config::Wifi::max_retry_count);
                (void)esp_wifi_connect();
            } else {
                LOG_ERROR(TAG, "WiFi connect failed after %d retries; waiting for periodic reconnect",
                          Config::Wifi::max_retry_count);
            }
            break;
        case WIFI_EVENT_STA_STOP:
            LOG_INFO(TAG, "%s", "WIFI_EVENT_STA_STOP");
            self->connected = false;
            self->got_ip = false;
            break;
        default:
            break;
    }
}

void WiFiManager::ipEventHandler(void* arg, esp_event_base_t event_base, int32_t event_id, void* event_data) {
    (void)event_base;
    WiFiManager* self = static_cast<WiFiManager*>(arg);
    if (event_id == IP_EVENT_STA_GOT_IP) {
        const ip_event_got_ip_t* event = static_cast<const ip_event_got_ip_t*>(event_data);
        self->got_ip = true;
        self->connected = true;
        self->retry_count = 0;
        xEventGroupSetBits(self->events, GOT_IP_BIT);
        LOG_INFO(TAG, "Got IP address " IPSTR, IP2STR(&event->ip_info.ip));
    }
}
