/**
 * @file Registers.hpp
 * @author Mikhail Kalina (apollo.mk58@gmail.com)
 * @brief MCP23017 16-Bit I/O Expander register model
 * @version 0.1
 * @date 2025-06-02
 *
 * @copyright Copyright (c) 2025
 *
 */

#pragma once

#include <stdbool.h>
#include <stddef.h>
#include <stdint.h>

namespace Expander
{
    // Lowest I2C address the chip can be strapped to (A2..A0 = 000)
    constexpr uint8_t boardAddressMin = 0x20;
    // Highest I2C address the chip can be strapped to (A2..A0 = 111)
    constexpr uint8_t boardAddressMax = 0x27;
    // Total count of strap addresses
    constexpr size_t boardCount = boardAddressMax - boardAddressMin + 1;

    // Width of one register half (port) in bits
    constexpr uint8_t halfWidth = 8;
    // Count of register halves (ports A and B)
    constexpr uint8_t halfCount = 2;
    // Total count of pins on one chip
    constexpr uint8_t pinCount = halfWidth * halfCount;

    // IOCON value written on the first access: BANK = 0, sequential addressing, INTPOL active-high
    constexpr uint8_t controlValue = 0x02;
    // Power-on direction value (all pins are inputs)
    constexpr uint8_t directionResetValue = 0xFF;

    /**
     * @brief Register addresses (IOCON.BANK = 0)
     */
    enum class Register : uint8_t
    {
        IoDirA = 0x00,   // I/O direction A (1 - input, 0 - output)
        IoDirB = 0x01,   // I/O direction B
        IPolA = 0x02,    // Input polarity A
        IPolB = 0x03,    // Input polarity B
        GpIntEnA = 0x04, // Interrupt-on-change enable A
        GpIntEnB = 0x05, // Interrupt-on-change enable B
        DefValA = 0x06,  // Default compare value A
        DefValB = 0x07,  // Default compare value B
        IntConA = 0x08,  // Interrupt control A
        IntConB = 0x09,  // Interrupt control B
        IoCon = 0x0A,    // Configuration register
        GpPuA = 0x0C,    // Pull-up resistors A
        GpPuB = 0x0D,    // Pull-up resistors B
        IntFA = 0x0E,    // Interrupt flags A
        IntFB = 0x0F,    // Interrupt flags B
        IntCapA = 0x10,  // Interrupt capture A
        IntCapB = 0x11,  // Interrupt capture B
        GpioA = 0x12,    // Port A logic levels
        GpioB = 0x13,    // Port B logic levels
        OLatA = 0x14,    // Output latches A
        OLatB = 0x15,    // Output latches B

        Count // Size of the register address space
    };

    /**
     * @brief Logical register types, each backed by an A/B pair of physical registers
     */
    enum class RegisterType
    {
        Direction, // IODIR pair
        State,     // GPIO pair
        Latch      // OLAT pair
    };

    /**
     * @brief Register halves
     */
    enum class Half : uint8_t
    {
        A, // Pins 0..7
        B  // Pins 8..15
    };

    /**
     * @brief Check whether address is one of the chip strap addresses
     *
     * @param[in] address 7-bit I2C address
     * @return true if address is valid, false otherwise
     */
    bool isValidBoard(uint8_t address);

    /**
     * @brief Check whether pin index belongs to the chip
     *
     * @param[in] pin Pin index
     * @return true if pin index is valid, false otherwise
     */
    bool isValidPin(uint8_t pin);

    /**
     * @brief Check whether register half index is valid
     *
     * @param[in] half Register half index (0 - A, 1 - B)
     * @return true if half index is valid, false otherwise
     */
    bool isValidHalf(uint8_t half);

    /**
     * @brief Return board slot index (0..7) of the valid board address
     *
     * @param[in] address 7-bit I2C address
     * @return Slot index
     */
    size_t boardSlot(uint8_t address);

    /**
     * @brief Return register half the pin belongs to
     *
     * @param[in] pin Pin index
     * @return Register half
     */
    Half pinHalf(uint8_t pin);

    /**
     * @brief Return bit mask of the pin inside its register half
     *
     * @param[in] pin Pin index
     * @return Bit mask
     */
    uint8_t pinMask(uint8_t pin);

    /**
     * @brief Return physical register for the logical type and half
     *
     * @param[in] type Logical register type
     * @param[in] half Register half
     * @return Physical register address
     */
    Register registerOf(RegisterType type, Half half);

    /**
     * @brief Concatenate two register halves into one logical 16-bit value
     *
     * @param[in] valueA Half A value
     * @param[in] valueB Half B value
     * @return 16-bit value, bit n is pin n
     */
    uint16_t combine(uint8_t valueA, uint8_t valueB);

    /**
     * @brief Extract register half from a logical 16-bit value
     *
     * @param[in] value 16-bit value
     * @param[in] half Register half
     * @return 8-bit half value
     */
    uint8_t split(uint16_t value, Half half);
} // namespace Expander
