#pragma once

#include <functional>
#include <stddef.h>

#include "Interfaces/SerialInterface.hpp"
#include "MessageParser.hpp"

namespace Serials
{
/**
 * @brief Host link on one serial interface: receives messages, passes them to the handler
 * and replies with the response followed by ACK, or with NACK
 */
class SerialDevice
{
public:
    /**
     * @brief The serial command handler function type.
     * Handler fills the response buffer, an empty response is a bare acknowledge
     */
    using CommandHandler = std::function<bool(SerialDevice *, const Message &, char *, size_t)>;

    explicit SerialDevice(SerialInterface &serialInterface);

    /**
     * @brief Initialize serial interface
     *
     * @param commandHandler Handler of the received messages
     */
    void initialize(CommandHandler &&commandHandler);

    void start();
    void stop();

    /**
     * @brief Receive pending characters and handle a complete message
     */
    void process();

    const char *getInfo();

    int slaveAddress() const;
    void setSlaveAddress(int address);

private:
    /**
     * @brief Run the handler and reply to the host
     *
     * @param message Received message
     */
    void handleMessage(const Message &message);

    /**
     * @brief Send the reply string including the end character
     */
    void send(const char *reply);

    bool _isActive = false;            // Device is started
    SerialInterface &_serialInterface; // Serial interface object
    MessageParser _parser;             // Message accumulation

    char _response[MessageParser::dataMaxLength + 2] = {0}; // Response and ACK

    CommandHandler _commandHandler; // The serial command handler
};
} // namespace Serials
