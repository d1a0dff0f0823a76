#ifndef SENSOR_SAMPLING_TASK_HPP
#define SENSOR_SAMPLING_TASK_HPP

#include <cstdint>
#include <dhtexpo/sensor/sensor_sampler.hpp>

namespace SensorSamplingTask {
    // Creates a static FreeRTOS task that calls sampler.sample() every
    // interval_seconds. Ticks never overlap: the next one is scheduled only
    // after the previous sample() has returned. sampler must outlive the task.
    void create(SensorSampler& sampler, uint32_t interval_seconds);
}

#endif // SENSOR_SAMPLING_TASK_HPP
