#ifndef RUNTIME_SETTINGS_HPP
#define RUNTIME_SETTINGS_HPP

#include <dhtexpo/config/settings.hpp>

namespace RuntimeSettingsStore {
    // Load settings once: compile-time defaults from Config, overridden by any
    // keys present in the "dhtexpo" NVS namespace, then sanitized.
    // Requires nvs_flash_init(). Later calls are no-ops.
    void init();

    // Settings loaded by init(); immutable for the life of the process
    const RuntimeSettings& get();
}

#endif // RUNTIME_SETTINGS_HPP
