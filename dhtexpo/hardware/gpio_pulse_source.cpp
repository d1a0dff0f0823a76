#include <dhtexpo/hardware/gpio_pulse_source.hpp>
#include <dhtexpo/config/config.hpp>
#include <dhtexpo/utils/logger.hpp>
#include <esp_rom_sys.h>
#include <esp_timer.h>

static const char* TAG_PULSE = "GpioPulse";

namespace {
    // Host release + 3 response edges + 2 per bit. The sensor's final release
    // is not needed to decode, so the capture can stop here.
    static constexpr std::size_t FRAME_EDGES = 1 + 3 + 2 * 40;
    // Poll step while waiting for edges; well under the shortest pulse
    static constexpr uint32_t POLL_STEP_US = 10;
}

GpioPulseSource::GpioPulseSource(gpio_num_t pin)
    : pin(pin),
      initialized(false),
      isr_attached(false),
      active_window(nullptr),
      last_edge_us(0) {
    portMUX_INITIALIZE(&mux);
}

GpioPulseSource::~GpioPulseSource() {
    if (isr_attached) {
        (void)gpio_intr_disable(pin);
        (void)gpio_isr_handler_remove(pin);
    }
}

bool GpioPulseSource::init() {
    if (initialized) {
        return true;
    }
    if (!GPIO_IS_VALID_OUTPUT_GPIO(pin)) {
        LOG_ERROR(TAG_PULSE, "GPIO %d cannot drive the data line", static_cast<int>(pin));
        return false;
    }

    gpio_config_t io = {};
    io.pin_bit_mask = 1ULL << static_cast<uint32_t>(pin);
    io.mode = GPIO_MODE_INPUT_OUTPUT_OD;
    io.pull_up_en = GPIO_PULLUP_ENABLE;
    io.pull_down_en = GPIO_PULLDOWN_DISABLE;
    io.intr_type = GPIO_INTR_ANYEDGE;
    esp_err_t err = gpio_config(&io);
    if (err != ESP_OK) {
        LOG_ERROR(TAG_PULSE, "gpio_config failed on GPIO %d: %s", static_cast<int>(pin), esp_err_to_name(err));
        return false;
    }
    // Idle high; edges are only wanted while a capture is armed
    (void)gpio_set_level(pin, 1);
    (void)gpio_intr_disable(pin);

    // Another driver may have installed the shared ISR service already
    err = gpio_install_isr_service(0);
    if (err != ESP_OK && err != ESP_ERR_INVALID_STATE) {
        LOG_ERROR(TAG_PULSE, "gpio_install_isr_service failed: %s", esp_err_to_name(err));
        return false;
    }
    err = gpio_isr_handler_add(pin, &GpioPulseSource::onEdge, this);
    if (err != ESP_OK) {
        LOG_ERROR(TAG_PULSE, "gpio_isr_handler_add failed: %s", esp_err_to_name(err));
        return false;
    }
    isr_attached = true;
    initialized = true;
    LOG_INFO(TAG_PULSE, "DHT data line on GPIO %d", static_cast<int>(pin));
    return true;
}

void GpioPulseSource::onEdge(void* arg) {
    GpioPulseSource* self = static_cast<GpioPulseSource*>(arg);
    const int64_t now = esp_timer_get_time();
    const bool level = gpio_get_level(self->pin) != 0;

    taskENTER_CRITICAL_ISR(&self->mux);
    if (self->active_window != nullptr) {
        (void)self->active_window->push(level, now);
        self->last_edge_us = now;
    }
    taskEXIT_CRITICAL_ISR(&self->mux);
}

SensorStatus GpioPulseSource::capture(uint32_t trigger_low_us, uint32_t timeout_us, CaptureWindow& out) {
    out.clear();
    if (!initialized) {
        return SensorStatus::HARDWARE_UNAVAILABLE;
    }

    // Start signal
    esp_err_t err = gpio_set_level(pin, 0);
    if (err != ESP_OK) {
        LOG_DEBUG(TAG_PULSE, "Pulling line low failed: %s", esp_err_to_name(err));
        return SensorStatus::HARDWARE_UNAVAILABLE;
    }
    esp_rom_delay_us(trigger_low_us);

    // Arm before releasing so the sensor's answer 20-40 us later is not missed
    taskENTER_CRITICAL(&mux);
    active_window = &out;
    last_edge_us = esp_timer_get_time();
    taskEXIT_CRITICAL(&mux);

    err = gpio_intr_enable(pin);
    if (err == ESP_OK) {
        err = gpio_set_level(pin, 1);
    }
    if (err != ESP_OK) {
        (void)gpio_set_level(pin, 1);
        (void)gpio_intr_disable(pin);
        taskENTER_CRITICAL(&mux);
        active_window = nullptr;
        taskEXIT_CRITICAL(&mux);
        LOG_DEBUG(TAG_PULSE, "Releasing line failed: %s", esp_err_to_name(err));
        return SensorStatus::HARDWARE_UNAVAILABLE;
    }

    const int64_t started_us = esp_timer_get_time();
    for (;;) {
        const int64_t now = esp_timer_get_time();
        taskENTER_CRITICAL(&mux);
        const std::size_t seen = out.count;
        const int64_t last = last_edge_us;
        taskEXIT_CRITICAL(&mux);

        if (seen >= FRAME_EDGES) {
            break;
        }
        if (now - last > static_cast<int64_t>(timeout_us)) {
            break;
        }
        if (now - started_us > static_cast<int64_t>(Config::Hardware::Dht::capture_max_us)) {
            break;
        }
        esp_rom_delay_us(POLL_STEP_US);
    }

    (void)gpio_intr_disable(pin);
    taskENTER_CRITICAL(&mux);
    active_window = nullptr;
    taskEXIT_CRITICAL(&mux);

    if (out.overflow > 0) {
        LOG_DEBUG(TAG_PULSE, "Dropped %u edges (noisy line?)", static_cast<unsigned>(out.overflow));
    }
    return SensorStatus::OK;
}
