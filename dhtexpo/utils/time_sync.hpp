#ifndef TIME_SYNC_HPP
#define TIME_SYNC_HPP

#include <cstdint>

// Wall clock for reading timestamps, set over SNTP once the network is up.
namespace TimeSync {
    // Start SNTP polling. Idempotent.
    void init();

    // True after the first SNTP answer, or if the RTC already holds a plausible date.
    bool isSynced();

    // Starts SNTP if needed and blocks until synced or timeout_ms passes.
    bool waitForSync(unsigned int timeout_ms);

    // Unix seconds, or 0 while the clock has not been set.
    uint32_t unixSeconds();
}

#endif // TIME_SYNC_HPP
