#ifndef WATCHDOG_HPP
#define WATCHDOG_HPP

#include <cstdint>

namespace Watchdog {
    // Configure TWDT (call once from app_main before the sampling task starts)
    void init(uint32_t timeout_ms);
    // Subscribe calling task to TWDT
    void subscribe();
    // Feed the watchdog (reset timer) - call at least once per timeout
    void feed();
}

#endif // WATCHDOG_HPP
