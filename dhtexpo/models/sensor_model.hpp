#ifndef SENSOR_MODEL_HPP
#define SENSOR_MODEL_HPP

#include <cstdint>

// Wire encoding of the sensor. Values match the `model` NVS key.
enum class SensorModel : uint8_t {
    AUTO = 0,  // try DHT22 layout, fall back to DHT11
    DHT11 = 1, // integer humidity/temperature bytes
    DHT22 = 2  // 16-bit x0.1 humidity, sign/magnitude x0.1 temperature
};

inline const char* toString(SensorModel model) {
    switch (model) {
        case SensorModel::AUTO:  return "auto";
        case SensorModel::DHT11: return "DHT11";
        case SensorModel::DHT22: return "DHT22";
    }
    return "unknown";
}

#endif // SENSOR_MODEL_HPP
