#include "Serial/SerialManager.hpp"

#include <array>
#include <assert.h>
#include <mutex>
#include <stdio.h>
#include <stdlib.h>

#include <Arduino.h>
#include <freertos/FreeRTOS.h>
#include <freertos/task.h>

#include <Log.hpp>
#include <Settings.hpp>

#include "Board/Board.hpp"
#include "Serial/SerialCommands.hpp"
#include "Serial/SerialDevice.hpp"
#include "Serial/Interfaces/St3485.hpp"
#include "Serial/Interfaces/UsbSerial.hpp"

using namespace Serials;

namespace
{
    // Default serial device slave address
    constexpr int defaultSlaveAddress = 123;

    // Serial task stack size, bytes
    constexpr uint32_t taskStackSize = 4096;
    // Serial task priority
    constexpr UBaseType_t taskPriority = 1;
    // Serial task core, the dispatcher runs on the other one
    constexpr BaseType_t taskCore = 1;
    // Serial input polling period, milliseconds
    constexpr uint32_t taskPeriodMs = 2;

    // Settings identifier in internal storage
    constexpr auto settingsId = Settings::Id::SerialManager;

    /**
     * @brief Serial device identifiers
     */
    enum class SerialDeviceId
    {
        UsbSerial, // USB serial device identifier
        Rs485,     // RS485 device identifier

        Count // Total number of device identifiers
    };

    // Task names of the serial devices
    constexpr const char *taskNames[] = {
        "usbSerialTask", // UsbSerial
        "rs485Task",     // Rs485
    };
    static_assert(sizeof(taskNames) / sizeof(*taskNames) == static_cast<size_t>(SerialDeviceId::Count),
                  "Task names list doesn't match to devices count!");

#pragma pack(push, 1)
    /**
     * @brief Non volatile settings structure
     */
    struct ManagerSettings
    {
        int slaveAddress; // Slave address of the serial devices
    };
#pragma pack(pop)

    // USB serial transceiver
    UsbSerial usbSerial(Serial, Board::UsbConfig::baudrate);
    // ST3485 RS485 transceiver
    St3485 st3485(Serial1, Board::Rs485Config::pins, Board::Rs485Config::baudrate);

    // Serial devices
    std::array<SerialDevice, static_cast<size_t>(SerialDeviceId::Count)> serialDevices = {
        SerialDevice(usbSerial), // USB serial
        SerialDevice(st3485),    // RS485
    };

    std::array<ReadCommandHandler, static_cast<size_t>(CommandId::Commands)> readHandlers;   // Read handlers
    std::array<WriteCommandHandler, static_cast<size_t>(CommandId::Commands)> writeHandlers; // Write handlers

    // Serial manager settings
    ManagerSettings settings = {.slaveAddress = defaultSlaveAddress};
    // Guards settings, ADDR is handled by the task of any device
    std::mutex settingsMutex;

    /**
     * @brief Serial command handler shared by all devices
     *
     * @param device Pointer to the serial device that received the command
     * @param message Received message
     * @param response Response buffer
     * @param size Size of response buffer
     * @return True if handling successfully, false otherwise
     */
    bool commandHandler(SerialDevice *device, const Message &message, char *response, size_t size)
    {
        size_t id = static_cast<size_t>(message.commandId);

        if (id >= static_cast<size_t>(CommandId::Commands) || message.data == nullptr)
        {
            return false;
        }

        const auto &handler = (message.accessMask == AccessMask::read) ? readHandlers[id] : writeHandlers[id];
        if (handler == nullptr)
        {
            LOG_WARNING("%s: command %s has no handler", device->getInfo(), commandString(message.commandId));
            return false;
        }

        return handler(message.data, response, size);
    }

    /**
     * @brief Serial device input processing task function
     *
     * @param pvParameters Pointer to the serial device
     */
    void serialTask(void *pvParameters)
    {
        auto *device = static_cast<SerialDevice *>(pvParameters);
        assert(device);

        int coreID = xPortGetCoreID();
        LOG_DEBUG("%s task start on core #%d", device->getInfo(), coreID);

        while (1)
        {
            // Receive and handle serial commands
            device->process();

            vTaskDelay(pdMS_TO_TICKS(taskPeriodMs));
        }

        vTaskDelete(NULL);
    }

    /**
     * @brief Register handlers for serial commands of the manager itself
     */
    void registerSerialHandlers()
    {
        // Subscribe to provide serial devices address
        Manager::subscribeToRead(CommandId::SlaveAddress,
                                 [](const char *dataString, char *response, size_t size)
                                 {
                                     std::lock_guard<std::mutex> lock(settingsMutex);

                                     snprintf(response, size, "%03d", settings.slaveAddress);
                                     return true;
                                 });

        // Subscribe to handle write serial devices address
        Manager::subscribeToWrite(CommandId::SlaveAddress,
                                  [](const char *dataString, char *response, size_t size)
                                  {
                                      int address = atoi(dataString);

                                      if (MessageParser::isValidAddress(address) == false)
                                      {
                                          return false;
                                      }

                                      std::lock_guard<std::mutex> lock(settingsMutex);

                                      if (address != settings.slaveAddress)
                                      {
                                          LOG_INFO("Set new address: %d", address);

                                          settings.slaveAddress = address;
                                          if (Settings::update(settingsId, settings) == false)
                                          {
                                              LOG_ERROR("Slave address %d isn't stored", address);
                                          }

                                          for (auto &device : serialDevices)
                                          {
                                              device.setSlaveAddress(address);
                                          }
                                      }

                                      return true;
                                  });
    }
} // namespace

/**
 * @brief Initialize serial manager and serial devices
 */
void Manager::initialize()
{
    // Reset read handlers
    readHandlers.fill(nullptr);

    // Reset write handlers
    writeHandlers.fill(nullptr);

    Settings::read(settingsId, settings);

    if (MessageParser::isValidAddress(settings.slaveAddress) == false)
    {
        LOG_WARNING("Slave address %d isn't valid, reset to %d", settings.slaveAddress, defaultSlaveAddress);

        settings.slaveAddress = defaultSlaveAddress;
        Settings::update(settingsId, settings);
    }

    // Initialize serial devices
    for (auto &device : serialDevices)
    {
        device.initialize(commandHandler);
        device.setSlaveAddress(settings.slaveAddress);
    }

    // Register local serial handlers
    registerSerialHandlers();

    LOG_INFO("Serial manager initialized, slave address %03d", settings.slaveAddress);
}

/**
 * @brief Start serial devices, every device is served by its own task
 */
void Manager::start()
{
    for (size_t idx = 0; idx < serialDevices.size(); idx++)
    {
        auto &device = serialDevices[idx];

        device.start();

        BaseType_t status = xTaskCreatePinnedToCore(serialTask, taskNames[idx], taskStackSize, &device, taskPriority,
                                                    NULL, taskCore);
        if (status != pdPASS)
        {
            LOG_ERROR("%s task creation failed", device.getInfo());
            device.stop();
        }
    }
}

/**
 * @brief Subscribe to specified read command to provide read data
 * May be only one subscriber that provides read data
 *
 * @param commandId Command identifier
 * @param handler Handler function
 */
void Manager::subscribeToRead(CommandId commandId, ReadCommandHandler &&handler)
{
    size_t id = static_cast<size_t>(commandId);

    assert(id < readHandlers.size());
    assert(handler);
    assert(commandsList[id].accessMask & AccessMask::read);

    auto &readHandler = readHandlers[id];
    if (readHandler == nullptr)
    {
        readHandler = std::move(handler);

        LOG_TRACE("Read handler for command %s is registered", commandString(commandId));
    }
    else
    {
        LOG_WARNING("Read handler for command %s is already registered", commandString(commandId));
    }
}

/**
 * @brief Subscribe to specified write command to handle write data
 * May be only one subscriber that handle write data
 *
 * @param commandId Command identifier
 * @param handler Handler function
 */
void Manager::subscribeToWrite(CommandId commandId, WriteCommandHandler &&handler)
{
    size_t id = static_cast<size_t>(commandId);

    assert(id < writeHandlers.size());
    assert(handler);
    assert(commandsList[id].accessMask & AccessMask::write);

    auto &writeHandler = writeHandlers[id];
    if (writeHandler == nullptr)
    {
        writeHandler = std::move(handler);

        LOG_TRACE("Write handler for command %s is registered", commandString(commandId));
    }
    else
    {
        LOG_WARNING("Write handler for command %s is already registered", commandString(commandId));
    }
}
