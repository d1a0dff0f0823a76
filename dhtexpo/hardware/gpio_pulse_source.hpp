#ifndef GPIO_PULSE_SOURCE_HPP
#define GPIO_PULSE_SOURCE_HPP

#include <cstdint>
#include <driver/gpio.h>
#include <freertos/FreeRTOS.h>
#include <dhtexpo/hardware/pulse_source.hpp>

// DHT data line on a real GPIO.
// The pin runs open-drain with the internal pull-up, so the host can pull it
// low for the start pulse and otherwise leave it to the sensor. An any-edge
// interrupt timestamps each transition with esp_timer while capture() waits.
class GpioPulseSource : public PulseSource {
public:
    explicit GpioPulseSource(gpio_num_t pin);
    ~GpioPulseSource() override;

    GpioPulseSource(const GpioPulseSource&) = delete;
    GpioPulseSource& operator=(const GpioPulseSource&) = delete;

    // Configure the pin and attach the edge ISR. false means the pin cannot be
    // used at all, which is a startup failure.
    bool init();

    SensorStatus capture(uint32_t trigger_low_us, uint32_t timeout_us, CaptureWindow& out) override;

private:
    static void onEdge(void* arg);

    gpio_num_t pin;
    bool initialized;
    bool isr_attached;

    // Written by the ISR while armed, read by capture() under the spinlock
    portMUX_TYPE mux;
    CaptureWindow* active_window;
    volatile int64_t last_edge_us;
};

#endif // GPIO_PULSE_SOURCE_HPP
