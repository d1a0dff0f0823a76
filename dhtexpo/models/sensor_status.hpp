#ifndef SENSOR_STATUS_HPP
#define SENSOR_STATUS_HPP

#include <cstdint>

// Outcome of one sample attempt. Everything except OK is recoverable and is
// retried on the next tick.
enum class SensorStatus : uint8_t {
    OK = 0,
    HARDWARE_UNAVAILABLE = 1, // pin could not be driven
    RESPONSE_MISSING = 2,     // no valid 80/80 us response after the start pulse
    INCOMPLETE_FRAME = 3,     // fewer than 40 decodable bits
    CHECKSUM_ERROR = 4,
    OUT_OF_RANGE = 5          // checksum ok but values physically implausible
};

inline const char* toString(SensorStatus status) {
    switch (status) {
        case SensorStatus::OK:                   return "ok";
        case SensorStatus::HARDWARE_UNAVAILABLE: return "hardware unavailable";
        case SensorStatus::RESPONSE_MISSING:     return "response missing";
        case SensorStatus::INCOMPLETE_FRAME:     return "incomplete frame";
        case SensorStatus::CHECKSUM_ERROR:       return "checksum error";
        case SensorStatus::OUT_OF_RANGE:         return "out of range";
    }
    return "unknown";
}

#endif // SENSOR_STATUS_HPP
