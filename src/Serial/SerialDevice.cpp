#include "Serial/SerialDevice.hpp"

#include <assert.h>
#include <string.h>

#include <Arduino.h>

#include <Log.hpp>

using namespace Serials;

namespace
{
    constexpr const char *ackString = "\r";   // Acknowledge, accepts the host command
    constexpr const char *nackString = "?\r"; // Not acknowledge, rejects the host command
} // namespace

SerialDevice::SerialDevice(SerialInterface &serialInterface)
    : _serialInterface(serialInterface)
{
}

void SerialDevice::initialize(CommandHandler &&commandHandler)
{
    assert(commandHandler);

    _commandHandler = std::move(commandHandler);

    _serialInterface.initialize();

    LOG_INFO("Serial device initialized, interface: %s", _serialInterface.getInfo());
}

void SerialDevice::start()
{
    if (_isActive == true)
    {
        LOG_WARNING("%s is already started", _serialInterface.getInfo());
        return;
    }

    _serialInterface.start();
    _isActive = true;

    LOG_INFO("%s started, slave address %03d", _serialInterface.getInfo(), _parser.slaveAddress());
}

void SerialDevice::stop()
{
    if (_isActive == false)
    {
        return;
    }

    _serialInterface.stop();
    _isActive = false;

    LOG_INFO("%s stopped", _serialInterface.getInfo());
}

/**
 * @brief Receive pending characters and handle a complete message.
 * Handling of a read verb waits for the broker, input is buffered by the interface meanwhile
 */
void SerialDevice::process()
{
    if (_isActive == false)
    {
        return;
    }

    while (_serialInterface.available() > 0)
    {
        char inputChar = static_cast<char>(_serialInterface.read());

        MessageParser::Status status = _parser.put(inputChar, millis());

        if (status == MessageParser::Status::Complete)
        {
            handleMessage(_parser.message());
        }
        else if (status == MessageParser::Status::Failed && _parser.isBroadcast() == false)
        {
            send(nackString);
        }
    }

    _parser.checkTimeout(millis());
}

const char *SerialDevice::getInfo()
{
    return _serialInterface.getInfo();
}

int SerialDevice::slaveAddress() const
{
    return _parser.slaveAddress();
}

void SerialDevice::setSlaveAddress(int address)
{
    _parser.setSlaveAddress(address);
}

void SerialDevice::handleMessage(const Message &message)
{
    LOG_DEBUG("%s: %s%c%s", _serialInterface.getInfo(), commandString(message.commandId),
              message.accessMask == AccessMask::read ? '?' : '=', message.data);

    _response[0] = '\0';

    // Leave space for the ACK string
    bool result = _commandHandler(this, message, _response, sizeof(_response) - strlen(ackString));
    if (result == false)
    {
        LOG_WARNING("%s: command %s is rejected", _serialInterface.getInfo(), commandString(message.commandId));
        if (message.isBroadcast == false)
        {
            send(nackString);
        }
        return;
    }

    // Broadcast messages get no reply with one exception: request of the slave address
    bool isAddressRead = (message.commandId == CommandId::SlaveAddress && message.accessMask == AccessMask::read);
    if (message.isBroadcast == true && isAddressRead == false)
    {
        return;
    }

    strcat(_response, ackString);
    send(_response);
}

void SerialDevice::send(const char *reply)
{
    LOG_TRACE("%s: reply %s", _serialInterface.getInfo(), reply);

    _serialInterface.write(reply, strlen(reply));
}
