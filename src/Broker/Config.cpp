#include "Broker/Config.hpp"

#include <Log.hpp>

namespace
{
    /**
     * @brief Clamp one value to the range
     *
     * @param name Value name for logging
     * @param value Value to check
     * @param minValue Minimum allowed value
     * @param maxValue Maximum allowed value
     * @return true if value was in range, false if it was corrected
     */
    bool clamp(const char *name, uint32_t &value, uint32_t minValue, uint32_t maxValue)
    {
        uint32_t clamped = value;

        if (clamped < minValue)
        {
            clamped = minValue;
        }
        if (clamped > maxValue)
        {
            clamped = maxValue;
        }

        if (clamped != value)
        {
            LOG_WARNING("%s %u is out of range [%u, %u], set to %u", name, value, minValue, maxValue, clamped);
            value = clamped;
            return false;
        }

        return true;
    }
} // namespace

bool Broker::sanitize(Config &config)
{
    bool result = true;

    result &= clamp("Command TTL", config.commandTtlMs, 10, 60 * 1000);
    result &= clamp("Result TTL", config.resultTtlMs, 10, 60 * 1000);
    result &= clamp("Poll interval", config.pollIntervalMs, 1, 1000);
    result &= clamp("Idle wait", config.idleWaitMs, 1, 1000);
    result &= clamp("Bus deadline", config.busDeadlineMs, 1, 1000);
    result &= clamp("Toggle delay", config.toggleDelayMs, 1, 5000);
    result &= clamp("Wait timeout", config.waitTimeoutMs, 1, 60 * 1000);

    return result;
}
