/**
 * @file Config.hpp
 * @author Mikhail Kalina (apollo.mk58@gmail.com)
 * @brief Command broker configuration
 * @version 0.1
 * @date 2025-06-02
 *
 * @copyright Copyright (c) 2025
 *
 */

#pragma once

#include <stddef.h>
#include <stdint.h>

namespace Broker
{
    // Maximum count of queued commands and of stored results
    constexpr size_t queueCapacity = 32;

    /**
     * @brief Broker timing parameters, applied when the broker starts
     */
    struct Config
    {
        uint32_t commandTtlMs = 1500;   // Lifetime of a queued command
        uint32_t resultTtlMs = 3000;    // Lifetime of an unread result
        uint32_t pollIntervalMs = 10;   // Result polling interval of waiting clients
        uint32_t idleWaitMs = 5;        // Dispatcher sleep when the queue is empty
        uint32_t busDeadlineMs = 50;    // Longest accepted bus transaction
        uint32_t toggleDelayMs = 100;   // Pulse width of the TOGGLE command
        uint32_t waitTimeoutMs = 1500;  // Default timeout of waiting clients
    };

    /**
     * @brief Clamp configuration values to the usable ranges
     *
     * @param[in,out] config Configuration to check
     * @return true if configuration was valid as is, false if some value was corrected
     */
    bool sanitize(Config &config);
} // namespace Broker
