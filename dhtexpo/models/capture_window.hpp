#ifndef CAPTURE_WINDOW_HPP
#define CAPTURE_WINDOW_HPP

#include <array>
#include <cstddef>
#include <cstdint>

// One level transition on the data line
struct Edge {
    bool    level;        // line level after the transition
    int64_t timestamp_us; // monotonic microseconds
};

// Transitions recorded for one trigger-to-timeout cycle.
// Fixed capacity: 3 response edges + 80 bit edges + release, plus headroom.
struct CaptureWindow {
    static constexpr std::size_t capacity = 96;

    std::array<Edge, capacity> edges{};
    std::size_t count = 0;
    std::size_t overflow = 0; // transitions dropped because the window was full

    bool push(bool level, int64_t timestamp_us) {
        if (count >= capacity) {
            ++overflow;
            return false;
        }
        edges[count].level = level;
        edges[count].timestamp_us = timestamp_us;
        ++count;
        return true;
    }

    void clear() {
        count = 0;
        overflow = 0;
    }
};

#endif // CAPTURE_WINDOW_HPP
