/**
 * @file Service.cpp
 * @author Mikhail Kalina (apollo.mk58@gmail.com)
 * @brief Firmware broker instance with persisted configuration implementation
 * @version 0.1
 * @date 2025-06-02
 *
 * @copyright Copyright (c) 2025
 *
 */

#include "Broker/Service.hpp"

#include <assert.h>
#include <memory>
#include <mutex>

#include <Arduino.h>
#include <esp_pthread.h>

#include <Log.hpp>
#include <Settings.hpp>

#include "Broker/BoardStorage.hpp"
#include "Broker/Timing.hpp"

using namespace Broker;

namespace
{
    // Settings identifier in internal storage
    constexpr auto settingsId = Settings::Id::Broker;

    // Dispatcher thread core, serial tasks run on the other one
    constexpr int dispatcherCore = 0;
    // Dispatcher thread stack size, bytes
    constexpr size_t dispatcherStackSize = 4096;
    // Dispatcher thread priority, above the serial tasks
    constexpr size_t dispatcherPriority = 2;

    // Stored configuration
    Config settings;

    std::unique_ptr<Context> brokerContext; // Broker instance
    std::unique_ptr<Client> brokerClient;   // Client facade

    // Serializes restarts requested by the serial tasks
    std::mutex restartMutex;

    /**
     * @brief Arduino time source
     *
     * @return Timing functions
     */
    Timing arduinoTiming()
    {
        Timing timing;

        timing.millis = []()
        {
            return static_cast<uint32_t>(::millis());
        };
        timing.delay = [](uint32_t ms)
        {
            ::delay(ms);
        };

        return timing;
    }

    /**
     * @brief Pin threads created by the calling task to the dispatcher core
     *
     * @return true if configuration is applied, false otherwise
     */
    bool configureDispatcherThread()
    {
        esp_pthread_cfg_t threadConfig = esp_pthread_get_default_config();
        threadConfig.core_id = dispatcherCore;
        threadConfig.stack_size = dispatcherStackSize;
        threadConfig.prio = dispatcherPriority;
        threadConfig.thread_name = "dispatcher";

        esp_err_t status = esp_pthread_set_cfg(&threadConfig);
        if (status != ESP_OK)
        {
            LOG_ERROR("Dispatcher thread configuration failed: %d", status);
            return false;
        }

        return true;
    }
} // namespace

void Service::initialize(Expander::BusDriver &bus)
{
    assert(brokerContext == nullptr);

    Settings::read(settingsId, settings);
    if (sanitize(settings) == false)
    {
        Settings::update(settingsId, settings);
    }

    brokerContext = std::make_unique<Context>(bus, settings, arduinoTiming());
    brokerClient = std::make_unique<Client>(*brokerContext);

    LOG_INFO("Broker initialized on %s", bus.getInfo());

    // Boards that fail to restore are reported lost, so the handler goes after restore
    BoardStorage::initialize();
    BoardStorage::restore(*brokerContext);

    brokerContext->setDirectionHandler(BoardStorage::update);
}

bool Service::start()
{
    assert(brokerContext);

    std::lock_guard<std::mutex> lock(restartMutex);

    if (configureDispatcherThread() == false)
    {
        return false;
    }

    return brokerContext->start();
}

bool Service::reconfigure(const Config &config)
{
    assert(brokerContext);

    std::lock_guard<std::mutex> lock(restartMutex);

    LOG_INFO("Restart broker with the new configuration");

    brokerContext->stop();

    bool result = brokerContext->configure(config);
    if (result == true)
    {
        settings = brokerContext->config();
        Settings::update(settingsId, settings);
    }

    // Restart in any case, with the previous configuration if the new one isn't applied
    if (configureDispatcherThread() == false || brokerContext->start() == false)
    {
        LOG_ERROR("Broker restart failed");
        return false;
    }

    return result;
}

Config Service::config()
{
    std::lock_guard<std::mutex> lock(restartMutex);

    return brokerContext->config();
}

Client &Service::client()
{
    assert(brokerClient);

    return *brokerClient;
}

Statistics Service::statistics()
{
    assert(brokerContext);

    return brokerContext->store().statistics();
}
