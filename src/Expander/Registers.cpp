/**
 * @file Registers.cpp
 * @author Mikhail Kalina (apollo.mk58@gmail.com)
 * @brief MCP23017 16-Bit I/O Expander register model implementation
 * @version 0.1
 * @date 2025-06-02
 *
 * @copyright Copyright (c) 2025
 *
 */

#include "Expander/Registers.hpp"

#include <assert.h>

using namespace Expander;

namespace
{
    // Physical registers of the logical types, indexed by [type][half]
    constexpr Register registerMap[][halfCount] = {
        {Register::IoDirA, Register::IoDirB}, // Direction
        {Register::GpioA, Register::GpioB},   // State
        {Register::OLatA, Register::OLatB},   // Latch
    };
} // namespace

bool Expander::isValidBoard(uint8_t address)
{
    return (address >= boardAddressMin && address <= boardAddressMax);
}

bool Expander::isValidPin(uint8_t pin)
{
    return (pin < pinCount);
}

bool Expander::isValidHalf(uint8_t half)
{
    return (half < halfCount);
}

size_t Expander::boardSlot(uint8_t address)
{
    assert(isValidBoard(address));

    return address - boardAddressMin;
}

/**
 * @brief Return register half the pin belongs to
 * @note Pins 0..7 are on half A, pins 8..15 on half B
 *
 * @param[in] pin Pin index
 * @return Register half
 */
Half Expander::pinHalf(uint8_t pin)
{
    assert(isValidPin(pin));

    return static_cast<Half>(pin / halfWidth);
}

uint8_t Expander::pinMask(uint8_t pin)
{
    assert(isValidPin(pin));

    return static_cast<uint8_t>(1 << (pin % halfWidth));
}

Register Expander::registerOf(RegisterType type, Half half)
{
    return registerMap[static_cast<size_t>(type)][static_cast<size_t>(half)];
}

uint16_t Expander::combine(uint8_t valueA, uint8_t valueB)
{
    return static_cast<uint16_t>((valueB << halfWidth) | valueA);
}

uint8_t Expander::split(uint16_t value, Half half)
{
    return static_cast<uint8_t>(value >> (halfWidth * static_cast<uint8_t>(half)));
}
