#ifndef NETWORK_TASK_HPP
#define NETWORK_TASK_HPP

namespace NetworkTask {
    // Bring WiFi up and start a static task that keeps it up: periodic
    // reconnect while there is no IP, SNTP start and first sync once there is.
    // Returns false if the WiFi driver cannot be initialized at all.
    bool create();
}

#endif // NETWORK_TASK_HPP
