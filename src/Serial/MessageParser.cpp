#include "Serial/MessageParser.hpp"

#include <ctype.h>
#include <stdlib.h>
#include <string.h>

#include <Log.hpp>

#include "Broker/Timing.hpp"

using namespace Serials;

namespace
{
    constexpr size_t addressLength = 3;    // Length of slave address field
    constexpr size_t commandMaxLength = 9; // Maximum length of command identifier field

    constexpr char startChar = '!';       // Start of a new message
    constexpr char separatorChar = ':';   // Separator between address and command
    constexpr char accessReadChar = '?';  // Read access code
    constexpr char accessWriteChar = '='; // Write access code
    constexpr char endChar = '\r';        // End of the message

    /**
     * @brief Find command by its string and access code
     *
     * @param[in] string Command string
     * @param[in] accessMask Access code of the message
     * @param[out] commandId Command identifier
     * @return true if command exists and allows the access, false otherwise
     */
    bool findCommand(const char *string, uint8_t accessMask, CommandId &commandId)
    {
        for (const auto &command : commandsList)
        {
            if (strcmp(string, command.string) == 0)
            {
                commandId = command.id;
                return (command.accessMask & accessMask) != 0;
            }
        }

        return false;
    }
} // namespace

bool MessageParser::isValidAddress(int address)
{
    return (address > broadcastAddress && address <= maxAddress);
}

MessageParser::Status MessageParser::put(char inputChar, uint32_t now)
{
    checkTimeout(now);
    _lastCharAt = now;

    // A start character always begins a new message
    if (inputChar == startChar)
    {
        setState(State::Address);
        return Status::Continue;
    }

    Status status = Status::Continue;

    switch (_state)
    {
    case State::Address:
        status = receiveAddress(inputChar);
        break;

    case State::Command:
        status = receiveCommand(inputChar);
        break;

    case State::Data:
        status = receiveData(inputChar);
        break;

    case State::Start:
    default:
        break;
    }

    if (status == Status::Failed)
    {
        setState(State::Start);
    }

    return status;
}

void MessageParser::checkTimeout(uint32_t now)
{
    if (_state != State::Start && Broker::elapsedMs(_lastCharAt, now) > messageTimeoutMs)
    {
        LOG_DEBUG("Incomplete message is dropped: %s", _input);
        setState(State::Start);
    }
}

bool MessageParser::append(char inputChar, size_t maxLength)
{
    if (_inputLength >= maxLength)
    {
        return false;
    }

    _input[_inputLength++] = inputChar;
    _input[_inputLength] = '\0';

    return true;
}

void MessageParser::setState(State newState)
{
    _state = newState;

    _inputLength = 0;
    _input[0] = '\0';
}

MessageParser::Status MessageParser::receiveAddress(char inputChar)
{
    if (inputChar != separatorChar)
    {
        if (isdigit(static_cast<unsigned char>(inputChar)) == 0 || append(inputChar, addressLength) == false)
        {
            // Not a message for any device, ignore it silently
            setState(State::Start);
        }

        return Status::Continue;
    }

    int address = (_inputLength == addressLength) ? atoi(_input) : invalidAddress;

    if (address != broadcastAddress && address != slaveAddress())
    {
        setState(State::Start);
        return Status::Continue;
    }

    _message.isBroadcast = (address == broadcastAddress);
    setState(State::Command);

    return Status::Continue;
}

MessageParser::Status MessageParser::receiveCommand(char inputChar)
{
    uint8_t accessMask = AccessMask::none;

    if (inputChar == accessReadChar)
    {
        accessMask = AccessMask::read;
    }
    else if (inputChar == accessWriteChar)
    {
        accessMask = AccessMask::write;
    }
    else if (inputChar == endChar)
    {
        // Every command requires an access code
        return Status::Failed;
    }
    else
    {
        return (append(inputChar, commandMaxLength) == true) ? Status::Continue : Status::Failed;
    }

    CommandId commandId;
    if (findCommand(_input, accessMask, commandId) == false)
    {
        LOG_DEBUG("Unknown command %s%c", _input, inputChar);
        return Status::Failed;
    }

    _message.commandId = commandId;
    _message.accessMask = accessMask;
    setState(State::Data);

    return Status::Continue;
}

MessageParser::Status MessageParser::receiveData(char inputChar)
{
    if (inputChar == endChar)
    {
        // Keep the data until the next message starts
        _state = State::Start;
        _message.data = _input;

        return Status::Complete;
    }

    return (append(inputChar, dataMaxLength) == true) ? Status::Continue : Status::Failed;
}
