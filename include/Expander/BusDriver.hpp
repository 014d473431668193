#pragma once

#include <stdbool.h>
#include <stdint.h>

#include "Registers.hpp"

namespace Expander
{
/**
 * @brief Synchronous bus access to the expander chips
 * @warning The bus is not reentrant, only one transaction may be in progress at a time
 */
struct BusDriver
{
    /**
     * @brief Get information string about bus driver
     *
     * @return const char* Information string
     */
    virtual const char *getInfo() = 0;

    /**
     * @brief Set the longest duration of one bus transaction
     *
     * @param[in] timeoutMs Transaction timeout, milliseconds
     */
    virtual void setTimeout(uint32_t timeoutMs) = 0;

    /**
     * @brief Check whether a device acknowledges its address
     *
     * @param[in] address 7-bit device address
     * @return true if device answered, false otherwise
     */
    virtual bool probe(uint8_t address) = 0;

    /**
     * @brief Read one device register
     *
     * @param[in] address 7-bit device address
     * @param[in] reg Register to read
     * @param[out] value Reference to read value
     * @return true if reading succeed, false otherwise
     */
    virtual bool readRegister(uint8_t address, Register reg, uint8_t &value) = 0;

    /**
     * @brief Write one device register
     *
     * @param[in] address 7-bit device address
     * @param[in] reg Register to write
     * @param[in] value Value to write
     * @return true if writing succeed, false otherwise
     */
    virtual bool writeRegister(uint8_t address, Register reg, uint8_t value) = 0;
};
} // namespace Expander
