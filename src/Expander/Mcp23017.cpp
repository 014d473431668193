/**
 * @file Mcp23017.cpp
 * @author Mikhail Kalina (apollo.mk58@gmail.com)
 * @brief MCP23017 16-Bit I/O Expander with I2C interface driver implementation
 * @version 0.1
 * @date 2025-06-02
 *
 * @copyright Copyright (c) 2025
 *
 */

#include "Expander/Mcp23017.hpp"

#include <stdbool.h>
#include <stdint.h>

#include <Wire.h>

#include <Log.hpp>

using namespace Expander;

/**
 * @brief Construct a new Mcp23017 object
 *
 * @param[in] wire Reference to the I2C transport shared by all chips
 */
Mcp23017::Mcp23017(TwoWire &wire)
    : _wire(wire)
{
}

const char *Mcp23017::getInfo()
{
    return "MCP23017-I2C";
}

void Mcp23017::setTimeout(uint32_t timeoutMs)
{
    _wire.setTimeOut(static_cast<uint16_t>(timeoutMs));

    LOG_DEBUG("I2C timeout %u ms", timeoutMs);
}

/**
 * @brief Check whether a chip acknowledges its address
 *
 * @param[in] address 7-bit chip address
 * @return true if chip answered, false otherwise
 */
bool Mcp23017::probe(uint8_t address)
{
    _wire.beginTransmission(address);
    uint8_t status = _wire.endTransmission();

    LOG_TRACE("Probe 0x%02X: %d", address, status);

    return (status == 0);
}

/**
 * @brief Read chip register
 *
 * @param[in] address 7-bit chip address
 * @param[in] reg Register to read
 * @param[out] value Reference to read value
 * @return true if reading succeed, false otherwise
 */
bool Mcp23017::readRegister(uint8_t address, Register reg, uint8_t &value)
{
    // Write register address
    _wire.beginTransmission(address);
    _wire.write(static_cast<uint8_t>(reg));
    uint8_t status = _wire.endTransmission(false);
    if (status != 0)
    {
        LOG_ERROR("0x%02X write ERROR: %d", address, status);
        return false;
    }

    bool result = false;
    // Read data from specified register
    uint8_t readBytes = _wire.requestFrom(address, static_cast<uint8_t>(1));
    if (readBytes == 1)
    {
        int readValue = _wire.read();
        if (readValue >= 0)
        {
            value = static_cast<uint8_t>(readValue);
            result = true;
        }
    }

    if (result == true)
    {
        LOG_TRACE("0x%02X:0x%02X <- 0x%02X", address, static_cast<uint8_t>(reg), value);
    }
    else
    {
        LOG_TRACE("0x%02X:0x%02X <- FAIL", address, static_cast<uint8_t>(reg));
    }

    return result;
}

/**
 * @brief Write chip register
 *
 * @param[in] address 7-bit chip address
 * @param[in] reg Register to write
 * @param[in] value Value to write
 * @return true if writting succeed, false otherwise
 */
bool Mcp23017::writeRegister(uint8_t address, Register reg, uint8_t value)
{
    _wire.beginTransmission(address);
    _wire.write(static_cast<uint8_t>(reg));
    _wire.write(value);
    uint8_t status = _wire.endTransmission();
    if (status != 0)
    {
        LOG_ERROR("0x%02X write ERROR: %d", address, status);
        return false;
    }

    LOG_TRACE("0x%02X:0x%02X -> 0x%02X", address, static_cast<uint8_t>(reg), value);

    return true;
}
