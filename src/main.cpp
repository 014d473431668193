/**
 * @file main.cpp
 * @author Mikhail Kalina (apollo.mk58@gmail.com)
 * @brief Main file with setup and loop entry points
 * @version 0.2
 * @date 2025-06-02
 *
 * @copyright Copyright (c) 2025
 *
 */

#include <stdbool.h>
#include <stdint.h>
#include <stdlib.h>

#include <Arduino.h>
#include <Wire.h>

// Lib headers
#include <elapsedMillis.h>
#include <Log.hpp>
#include <Settings.hpp>

// Source headers
#include "Board/Board.hpp"
#include "Broker/Service.hpp"
#include "Expander/Mcp23017.hpp"
#include "Expander/SimulatedBus.hpp"
#include "FwVersion.hpp"
#include "Serial/BrokerLink.hpp"
#include "Serial/SerialManager.hpp"

namespace
{
    // Period of the alive log message with broker statistics, milliseconds (0 - disabled)
    constexpr unsigned long aliveLogPeriodMs = 60 * 1000;
    // LED blink duration of the alive message, milliseconds
    constexpr unsigned long aliveBlinkMs = 50;

#ifdef SIMULATED_BUS
    // Bench run without hardware, every strap address answers
    Expander::SimulatedBus bus;
#else
    // Expanders on the board I2C bus
    Expander::Mcp23017 bus(Wire);
#endif // SIMULATED_BUS

    // Elapsed time since the last alive message
    elapsedMillis aliveElapsed = 0;

    // Runtime log level, stored separately from the other modules
    uint8_t logLevel = LOG_LEVEL;

    /**
     * @brief Start logging to the USB serial port with the stored level
     */
    void initializeLog()
    {
        Log::Output output = {
            .writer = [](const char *line)
            {
                Serial.print(line);
            },
            .clock = []()
            {
                return static_cast<uint32_t>(millis());
            },
            .colors = true,
        };

        Settings::read(Settings::Id::LogModule, logLevel);
        Log::initialize(output, logLevel);

        if (Log::getMaxLevel() != logLevel)
        {
            logLevel = Log::getMaxLevel();
            Settings::update(Settings::Id::LogModule, logLevel);
        }
    }
} // namespace

/**
 * @brief Register serial read command handlers
 */
void registerSerialReadHandlers()
{
    LOG_TRACE("Register serial read common handlers");

    for (size_t id = 0; id < Serials::verbCommandsCount; id++)
    {
        auto commandId = static_cast<Serials::CommandId>(id);

        Serials::Manager::subscribeToRead(commandId,
                                          [commandId](const char *dataString, char *response, size_t size)
                                          {
                                              return Serials::BrokerLink::readVerb(Broker::Service::client(), commandId,
                                                                                   dataString, response, size);
                                          });
    }

    Serials::Manager::subscribeToRead(Serials::CommandId::Result,
                                      [](const char *dataString, char *response, size_t size)
                                      {
                                          return Serials::BrokerLink::readResult(Broker::Service::client(), dataString,
                                                                                 response, size);
                                      });

    for (auto commandId : {Serials::CommandId::CommandTtl, Serials::CommandId::ResultTtl,
                           Serials::CommandId::PollInterval, Serials::CommandId::IdleWait,
                           Serials::CommandId::BusDeadline, Serials::CommandId::ToggleDelay,
                           Serials::CommandId::WaitTimeout})
    {
        Serials::Manager::subscribeToRead(commandId,
                                          [commandId](const char *dataString, char *response, size_t size)
                                          {
                                              return Serials::BrokerLink::readConfig(Broker::Service::config(),
                                                                                     commandId, response, size);
                                          });
    }

    Serials::Manager::subscribeToRead(Serials::CommandId::LogLevel,
                                      [](const char *dataString, char *response, size_t size)
                                      {
                                          snprintf(response, size, "%u", Log::getMaxLevel());
                                          return true;
                                      });

    Serials::Manager::subscribeToRead(Serials::CommandId::Statistics,
                                      [](const char *dataString, char *response, size_t size)
                                      {
                                          Serials::BrokerLink::formatStatistics(Broker::Service::statistics(),
                                                                                response, size);
                                          return true;
                                      });

    Serials::Manager::subscribeToRead(Serials::CommandId::FwVersion,
                                      [](const char *dataString, char *response, size_t size)
                                      {
                                          snprintf(response, size, "%s", FwVersion::getVersionString());
                                          return true;
                                      });
}

/**
 * @brief Register serial write command handlers
 */
void registerSerialWriteHandlers()
{
    LOG_TRACE("Register serial write common handlers");

    for (size_t id = 0; id < Serials::verbCommandsCount; id++)
    {
        auto commandId = static_cast<Serials::CommandId>(id);

        Serials::Manager::subscribeToWrite(commandId,
                                           [commandId](const char *dataString, char *response, size_t size)
                                           {
                                               return Serials::BrokerLink::writeVerb(Broker::Service::client(),
                                                                                     commandId, dataString, response,
                                                                                     size);
                                           });
    }

    for (auto commandId : {Serials::CommandId::CommandTtl, Serials::CommandId::ResultTtl,
                           Serials::CommandId::PollInterval, Serials::CommandId::IdleWait,
                           Serials::CommandId::BusDeadline, Serials::CommandId::ToggleDelay,
                           Serials::CommandId::WaitTimeout})
    {
        Serials::Manager::subscribeToWrite(commandId,
                                           [commandId](const char *dataString, char *response, size_t size)
                                           {
                                               Broker::Config config = Broker::Service::config();

                                               bool result = Serials::BrokerLink::writeConfig(config, commandId,
                                                                                              dataString);
                                               if (result == true)
                                               {
                                                   result = Broker::Service::reconfigure(config);
                                               }

                                               return result;
                                           });
    }

    Serials::Manager::subscribeToWrite(Serials::CommandId::LogLevel,
                                       [](const char *dataString, char *response, size_t size)
                                       {
                                           uint32_t level;
                                           if (Serials::BrokerLink::parseDecimal(dataString, level) == false ||
                                               level >= LOG_LEVEL_COUNT ||
                                               Log::setMaxLevel(static_cast<uint8_t>(level)) == false)
                                           {
                                               return false;
                                           }

                                           logLevel = static_cast<uint8_t>(level);
                                           return Settings::update(Settings::Id::LogModule, logLevel);
                                       });
}

/**
 * @brief Print alive message with broker statistics and blink the LED
 */
void aliveProcess()
{
    if (aliveLogPeriodMs == 0 || aliveElapsed < aliveLogPeriodMs)
    {
        return;
    }

    aliveElapsed = 0;

    Broker::Statistics statistics = Broker::Service::statistics();
    LOG_INFO("Alive: submitted %u, rejected %u, expired %u, published %u, unread %u", statistics.submitted,
             statistics.rejected, statistics.expired, statistics.published, statistics.unread);

    Board::setLED(true);
    delay(aliveBlinkMs);
    Board::setLED(false);
}

/**
 * @brief Setup preliminary stuff before starting the main loop
 */
void setup()
{
    // Setup the board first
    Board::setup();

    // Initialize settings, the log level is stored there
    Settings::initialize();

    // Initialize the log module
    initializeLog();

    LOG_INFO("%s started, version %s", FwVersion::getProductName(), FwVersion::getVersionString());

#ifdef SIMULATED_BUS
    for (uint8_t address = Expander::boardAddressMin; address <= Expander::boardAddressMax; address++)
    {
        bus.setPresent(address, true);
    }
#endif // SIMULATED_BUS

    // Create the broker and restore stored board directions before the dispatcher owns the bus
    Broker::Service::initialize(bus);

    bool status = Broker::Service::start();
    if (status == false)
    {
        LOG_ERROR("Broker start failed");
    }

    // Initialize serial manager
    Serials::Manager::initialize();
    // Register local serial handlers
    registerSerialReadHandlers();
    registerSerialWriteHandlers();
    // Serve the host links
    Serials::Manager::start();

    int coreID = xPortGetCoreID();
    LOG_DEBUG("Main task start on core #%d", coreID);
}

/**
 * @brief The main loop function
 */
void loop()
{
    aliveProcess();

    delay(10);
}
