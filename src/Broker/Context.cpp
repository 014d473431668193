#include "Broker/Context.hpp"

#include <Log.hpp>

using namespace Broker;

Context::Context(Expander::BusDriver &bus, const Config &config, const Timing &timing)
    : _config(config),
      _timing(timing),
      _store(_timing.millis),
      _dispatcher(_store, bus, _config, _timing),
      _running(false)
{
    sanitize(_config);
}

Context::~Context()
{
    stop();
}

bool Context::start()
{
    std::lock_guard<std::mutex> lock(_lifecycleMutex);

    if (_running.load() == true)
    {
        LOG_WARNING("Broker is already running");
        return false;
    }

    LOG_INFO("Start broker: command TTL %u ms, result TTL %u ms, poll %u ms, idle %u ms, deadline %u ms",
             _config.commandTtlMs, _config.resultTtlMs, _config.pollIntervalMs, _config.idleWaitMs,
             _config.busDeadlineMs);

    _running.store(true);
    _thread = std::thread([this]()
                          { _dispatcher.run(_running); });

    return true;
}

void Context::stop()
{
    std::lock_guard<std::mutex> lock(_lifecycleMutex);

    _running.store(false);

    if (_thread.joinable() == true)
    {
        _thread.join();
        LOG_INFO("Broker stopped");
    }

    _store.clear();
}

bool Context::isRunning() const
{
    return _running.load();
}

bool Context::configure(const Config &config)
{
    std::lock_guard<std::mutex> lock(_lifecycleMutex);

    if (_running.load() == true)
    {
        LOG_WARNING("Broker is running, configuration isn't changed");
        return false;
    }

    Config sanitized = config;
    sanitize(sanitized);

    std::lock_guard<std::mutex> configLock(_configMutex);
    _config = sanitized;

    return true;
}

Config Context::config() const
{
    std::lock_guard<std::mutex> lock(_configMutex);

    return _config;
}

bool Context::restoreDirections(uint8_t address, const std::array<uint8_t, Expander::halfCount> &direction)
{
    std::lock_guard<std::mutex> lock(_lifecycleMutex);

    // Only the dispatcher may touch the bus while it runs
    if (_running.load() == true)
    {
        LOG_WARNING("Broker is running, directions of board 0x%02X aren't restored", address);
        return false;
    }

    return _dispatcher.restoreDirections(address, direction);
}

void Context::setDirectionHandler(DirectionHandler handler)
{
    std::lock_guard<std::mutex> lock(_lifecycleMutex);

    _dispatcher.setDirectionHandler(handler);
}
