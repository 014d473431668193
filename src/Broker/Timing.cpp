#include "Broker/Timing.hpp"

#include <chrono>
#include <thread>

Broker::Timing Broker::systemTiming()
{
    Timing timing;

    timing.millis = []()
    {
        static const auto startTime = std::chrono::steady_clock::now();

        auto elapsed = std::chrono::steady_clock::now() - startTime;
        return static_cast<uint32_t>(std::chrono::duration_cast<std::chrono::milliseconds>(elapsed).count());
    };

    timing.delay = [](uint32_t ms)
    {
        std::this_thread::sleep_for(std::chrono::milliseconds(ms));
    };

    return timing;
}
