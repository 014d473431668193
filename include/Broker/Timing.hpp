#pragma once

#include <functional>
#include <stdint.h>

namespace Broker
{
    /**
     * @brief Millisecond clock function type, wraps around like millis()
     */
    using MillisFunction = std::function<uint32_t()>;

    /**
     * @brief Blocking delay function type, milliseconds
     */
    using DelayFunction = std::function<void(uint32_t)>;

    /**
     * @brief Time source used by the broker
     */
    struct Timing
    {
        MillisFunction millis; // Current time, milliseconds
        DelayFunction delay;   // Suspend the calling thread, milliseconds
    };

    /**
     * @brief Time source based on the monotonic system clock
     *
     * @return Timing functions
     */
    Timing systemTiming();

    /**
     * @brief Calculate elapsed time between two millisecond timestamps
     * @note Valid across the 32-bit wrap of the clock
     *
     * @param since Start timestamp
     * @param now Current timestamp
     * @return Elapsed time, milliseconds
     */
    inline uint32_t elapsedMs(uint32_t since, uint32_t now)
    {
        return now - since;
    }
} // namespace Broker
