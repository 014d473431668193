/**
 * @file Dispatcher.cpp
 * @author Mikhail Kalina (apollo.mk58@gmail.com)
 * @brief Single consumer executing broker commands on the expander bus implementation
 * @version 0.1
 * @date 2025-06-02
 *
 * @copyright Copyright (c) 2025
 *
 */

#include "Broker/Dispatcher.hpp"

#include <Log.hpp>

using namespace Broker;
using namespace Expander;

Dispatcher::Dispatcher(CommandStore &store, BusDriver &bus, const Config &config, const Timing &timing)
    : _store(store),
      _bus(bus),
      _config(config),
      _timing(timing)
{
}

void Dispatcher::setDirectionHandler(DirectionHandler handler)
{
    _directionHandler = handler;
}

/**
 * @brief Execute the next live command if there is one and publish its result.
 * A failed command publishes the failure value of its verb, nothing is thrown.
 *
 * @return true if a command was executed, false if the queue was empty
 */
bool Dispatcher::process()
{
    Command command;
    if (_store.dequeueNext(command) == false)
    {
        return false;
    }

    int16_t value = execute(command);

    _store.publishResult(command.token, value, _config.resultTtlMs);

    return true;
}

void Dispatcher::run(const std::atomic<bool> &running)
{
    LOG_INFO("Dispatcher started on %s", _bus.getInfo());

    _bus.setTimeout(_config.busDeadlineMs);

    while (running.load() == true)
    {
        if (process() == false)
        {
            _timing.delay(_config.idleWaitMs);
        }
    }

    LOG_INFO("Dispatcher stopped");
}

int16_t Dispatcher::execute(const Command &command)
{
    LOG_DEBUG("Execute %u: %s 0x%02X,%u", command.token, verbName(command.verb), command.boardAddress, command.index);

    if (isAddressValid(command) == false)
    {
        LOG_WARNING("%s: invalid address 0x%02X,%u", verbName(command.verb), command.boardAddress, command.index);
        return failureValue(command.verb);
    }

    bool result = false;
    int16_t value = 0;

    switch (command.verb)
    {
    case Verb::Identify:
        result = identify(command);
        value = 1;
        break;

    case Verb::GetDirBit:
        result = readBit(command, RegisterType::Direction, value);
        break;

    case Verb::GetDirRegister:
        result = readHalf(command, RegisterType::Direction, value);
        break;

    case Verb::GetIoRegister:
        result = readHalf(command, RegisterType::State, value);
        break;

    case Verb::SetDirBit:
        result = writeDirection(command, true);
        value = 1;
        break;

    case Verb::ClearDirBit:
        result = writeDirection(command, false);
        value = 1;
        break;

    case Verb::GetPin:
        result = readBit(command, RegisterType::State, value);
        break;

    case Verb::SetPin:
        result = writeLatch(command, true);
        value = 1;
        break;

    case Verb::ClearPin:
        result = writeLatch(command, false);
        value = 1;
        break;

    case Verb::TogglePin:
        result = toggle(command);
        value = 1;
        break;

    default:
        LOG_ERROR("Unknown verb %u", static_cast<uint8_t>(command.verb));
        break;
    }

    if (result == false)
    {
        return failureValue(command.verb);
    }

    return value;
}

bool Dispatcher::restoreDirections(uint8_t address, const std::array<uint8_t, halfCount> &direction)
{
    if (isValidBoard(address) == false)
    {
        return false;
    }

    if (prepareBoard(address) == false)
    {
        LOG_WARNING("Board 0x%02X doesn't answer, directions aren't restored", address);
        return false;
    }

    for (uint8_t idx = 0; idx < halfCount; idx++)
    {
        Register reg = registerOf(RegisterType::Direction, static_cast<Half>(idx));

        uint8_t readBack;
        if (writeRegister(address, reg, direction[idx]) == false || readRegister(address, reg, readBack) == false)
        {
            loseBoard(address);
            return false;
        }

        if (readBack != direction[idx])
        {
            LOG_ERROR("Board 0x%02X direction %c verify failed: 0x%02X != 0x%02X", address, 'A' + idx, readBack,
                      direction[idx]);
            loseBoard(address);
            return false;
        }

        _boards[boardSlot(address)].direction[idx] = readBack;
    }

    LOG_INFO("Board 0x%02X directions restored: 0x%04X", address, combine(direction[0], direction[1]));

    return true;
}

void Dispatcher::reset()
{
    for (auto &board : _boards)
    {
        board.initialized = false;
    }
}

bool Dispatcher::probe(uint8_t address)
{
    uint32_t startedAt = _timing.millis();

    bool result = _bus.probe(address);

    return result && isInTime(startedAt);
}

bool Dispatcher::readRegister(uint8_t address, Register reg, uint8_t &value)
{
    uint32_t startedAt = _timing.millis();

    bool result = _bus.readRegister(address, reg, value);
    if (result == false)
    {
        LOG_ERROR("Board 0x%02X register 0x%02X read failed", address, static_cast<uint8_t>(reg));
        return false;
    }

    return isInTime(startedAt);
}

bool Dispatcher::writeRegister(uint8_t address, Register reg, uint8_t value)
{
    uint32_t startedAt = _timing.millis();

    bool result = _bus.writeRegister(address, reg, value);
    if (result == false)
    {
        LOG_ERROR("Board 0x%02X register 0x%02X write failed", address, static_cast<uint8_t>(reg));
        return false;
    }

    return isInTime(startedAt);
}

bool Dispatcher::isInTime(uint32_t startedAt)
{
    uint32_t duration = elapsedMs(startedAt, _timing.millis());

    if (duration > _config.busDeadlineMs)
    {
        LOG_ERROR("Bus transaction took %u ms, deadline %u ms", duration, _config.busDeadlineMs);
        return false;
    }

    return true;
}

/**
 * @brief Initialise the board on its first use: write IOCON and cache the direction registers.
 * Failed board stays uninitialised, the next command retries.
 *
 * @param address 7-bit board address
 * @return true if board is initialised, false otherwise
 */
bool Dispatcher::prepareBoard(uint8_t address)
{
    BoardCache &board = _boards[boardSlot(address)];

    if (board.initialized == true)
    {
        return true;
    }

    if (writeRegister(address, Register::IoCon, controlValue) == false)
    {
        return false;
    }

    for (uint8_t idx = 0; idx < halfCount; idx++)
    {
        if (readRegister(address, registerOf(RegisterType::Direction, static_cast<Half>(idx)), board.direction[idx]) ==
            false)
        {
            return false;
        }
    }

    board.initialized = true;

    LOG_INFO("Board 0x%02X initialized, directions 0x%04X", address, combine(board.direction[0], board.direction[1]));

    return true;
}

void Dispatcher::loseBoard(uint8_t address)
{
    BoardCache &board = _boards[boardSlot(address)];

    if (board.initialized == false)
    {
        return;
    }

    LOG_WARNING("Board 0x%02X is lost", address);

    board.initialized = false;

    if (_directionHandler)
    {
        BoardState state = {.address = address, .present = false, .direction = board.direction};
        _directionHandler(state);
    }
}

void Dispatcher::notify(uint8_t address)
{
    if (_directionHandler)
    {
        const BoardCache &board = _boards[boardSlot(address)];

        BoardState state = {.address = address, .present = true, .direction = board.direction};
        _directionHandler(state);
    }
}

bool Dispatcher::identify(const Command &command)
{
    if (probe(command.boardAddress) == false)
    {
        LOG_DEBUG("Board 0x%02X not found", command.boardAddress);
        loseBoard(command.boardAddress);
        return false;
    }

    bool result = prepareBoard(command.boardAddress);

    return result;
}

bool Dispatcher::readBit(const Command &command, RegisterType type, int16_t &value)
{
    if (prepareBoard(command.boardAddress) == false)
    {
        return false;
    }

    uint8_t registerValue;
    if (readRegister(command.boardAddress, registerOf(type, pinHalf(command.index)), registerValue) == false)
    {
        loseBoard(command.boardAddress);
        return false;
    }

    value = (registerValue & pinMask(command.index)) ? 1 : 0;

    return true;
}

bool Dispatcher::readHalf(const Command &command, RegisterType type, int16_t &value)
{
    if (prepareBoard(command.boardAddress) == false)
    {
        return false;
    }

    uint8_t registerValue;
    if (readRegister(command.boardAddress, registerOf(type, static_cast<Half>(command.index)), registerValue) == false)
    {
        loseBoard(command.boardAddress);
        return false;
    }

    value = registerValue;

    return true;
}

/**
 * @brief Read-modify-write of the pin direction bit
 *
 * @param command Command addressing the pin
 * @param input true - configure pin as input, false - as output
 * @return true if direction is written, false otherwise
 */
bool Dispatcher::writeDirection(const Command &command, bool input)
{
    if (prepareBoard(command.boardAddress) == false)
    {
        return false;
    }

    Half half = pinHalf(command.index);
    Register reg = registerOf(RegisterType::Direction, half);
    uint8_t mask = pinMask(command.index);

    uint8_t direction;
    if (readRegister(command.boardAddress, reg, direction) == false)
    {
        loseBoard(command.boardAddress);
        return false;
    }

    if (input == true)
    {
        direction |= mask;
    }
    else
    {
        direction &= ~mask;
    }

    if (writeRegister(command.boardAddress, reg, direction) == false)
    {
        loseBoard(command.boardAddress);
        return false;
    }

    BoardCache &board = _boards[boardSlot(command.boardAddress)];
    if (board.direction[static_cast<size_t>(half)] != direction)
    {
        board.direction[static_cast<size_t>(half)] = direction;
        notify(command.boardAddress);
    }

    return true;
}

bool Dispatcher::isOutput(const Command &command, bool &output)
{
    int16_t direction;
    if (readBit(command, RegisterType::Direction, direction) == false)
    {
        return false;
    }

    output = (direction == 0);

    if (output == false)
    {
        LOG_WARNING("%s: pin %u of board 0x%02X is an input", verbName(command.verb), command.index,
                    command.boardAddress);
    }

    return true;
}

/**
 * @brief Read-modify-write of the output latch bit
 *
 * @param command Command addressing the pin
 * @param high true - drive pin high, false - drive pin low
 * @return true if latch is written, false otherwise or if pin is an input
 */
bool Dispatcher::writeLatch(const Command &command, bool high)
{
    bool output;
    if (isOutput(command, output) == false || output == false)
    {
        return false;
    }

    Register reg = registerOf(RegisterType::Latch, pinHalf(command.index));
    uint8_t mask = pinMask(command.index);

    uint8_t latch;
    if (readRegister(command.boardAddress, reg, latch) == false)
    {
        loseBoard(command.boardAddress);
        return false;
    }

    if (high == true)
    {
        latch |= mask;
    }
    else
    {
        latch &= ~mask;
    }

    if (writeRegister(command.boardAddress, reg, latch) == false)
    {
        loseBoard(command.boardAddress);
        return false;
    }

    return true;
}

/**
 * @brief Pulse the output pin to the opposite level for the toggle delay and back.
 * The bus stays owned by the dispatcher for the whole pulse.
 *
 * @param command Command addressing the pin
 * @return true if both edges are written, false otherwise
 */
bool Dispatcher::toggle(const Command &command)
{
    bool output;
    if (isOutput(command, output) == false || output == false)
    {
        return false;
    }

    Register reg = registerOf(RegisterType::Latch, pinHalf(command.index));
    uint8_t mask = pinMask(command.index);

    uint8_t latch;
    if (readRegister(command.boardAddress, reg, latch) == false)
    {
        loseBoard(command.boardAddress);
        return false;
    }

    if (writeRegister(command.boardAddress, reg, latch ^ mask) == false)
    {
        loseBoard(command.boardAddress);
        return false;
    }

    _timing.delay(_config.toggleDelayMs);

    if (writeRegister(command.boardAddress, reg, latch) == false)
    {
        loseBoard(command.boardAddress);
        return false;
    }

    return true;
}
