/**
 * @file Mcp23017.hpp
 * @author Mikhail Kalina (apollo.mk58@gmail.com)
 * @brief MCP23017 16-Bit I/O Expander with I2C interface driver API
 * @version 0.1
 * @date 2025-06-02
 *
 * @copyright Copyright (c) 2025
 *
 */

#pragma once

#include <stdbool.h>
#include <stdint.h>

#include <Wire.h>

#include "BusDriver.hpp"

namespace Expander
{
    /**
     * @brief MCP23017 bus driver over the Arduino I2C transport
     */
    class Mcp23017 : public BusDriver
    {
    public:
        /**
         * @brief Construct a new Mcp23017 object
         *
         * @param[in] wire Reference to the I2C transport shared by all chips
         */
        explicit Mcp23017(TwoWire &wire);

        /**
         * @brief Get information string about bus driver
         *
         * @return const char* Information string
         */
        virtual const char *getInfo() override;

        /**
         * @brief Set I2C transaction timeout, a hanging chip must not stall the caller
         *
         * @param[in] timeoutMs Maximum duration of one transaction, milliseconds
         */
        virtual void setTimeout(uint32_t timeoutMs) override;

        /**
         * @brief Check whether a chip acknowledges its address
         *
         * @param[in] address 7-bit chip address
         * @return true if chip answered, false otherwise
         */
        virtual bool probe(uint8_t address) override;

        /**
         * @brief Read chip register
         *
         * @param[in] address 7-bit chip address
         * @param[in] reg Register to read
         * @param[out] value Reference to read value
         * @return true if reading succeed, false otherwise
         */
        virtual bool readRegister(uint8_t address, Register reg, uint8_t &value) override;

        /**
         * @brief Write chip register
         *
         * @param[in] address 7-bit chip address
         * @param[in] reg Register to write
         * @param[in] value Value to write
         * @return true if writting succeed, false otherwise
         */
        virtual bool writeRegister(uint8_t address, Register reg, uint8_t value) override;

    private:
        TwoWire &_wire; // I2C transport
    };
} // namespace Expander
