#ifndef READING_HPP
#define READING_HPP

#include <cstdint>

// Decoded sensor sample
struct Reading {
    float    humidity_pct;  // relative humidity 0.0..100.0
    float    temperature_c; // temperature in Celsius
    uint32_t timestamp_s;   // unix seconds at capture
};

#endif // READING_HPP
