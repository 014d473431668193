/**
 * @file Board.hpp
 * @author Mikhail Kalina (apollo.mk58@gmail.com)
 * @brief Board management API
 * @version 0.2
 * @date 2025-06-02
 *
 * @copyright Copyright (c) 2025
 *
 */

#pragma once

#include <stddef.h>
#include <stdint.h>

#include <Arduino.h>

#include "Serial/Interfaces/St3485.hpp"

namespace Board
{
    // USB serial interface configuration
    namespace UsbConfig
    {
        constexpr unsigned long baudrate = 115200;
    } // namespace UsbConfig

    // RS485 serial interface configuration
    namespace Rs485Config
    {
        constexpr unsigned long baudrate = 115200;

        constexpr Serials::St3485::Pins pins = {
            .rx = GPIO_NUM_18,       // Serial Rx pin
            .tx = GPIO_NUM_21,       // Serial Tx pin
            .rxEnable = GPIO_NUM_17, // RE pin
            .txEnable = GPIO_NUM_40, // DE pin
        };
    } // namespace Rs485Config

    // I2C interface configuration of the expanders bus
    namespace I2cConfig
    {
        // Maximum I2C SCL frequency (400 kHz, MCP23017 fast mode)
        constexpr uint32_t frequency = 400 * 1000;
        constexpr auto pinSda = GPIO_NUM_34; // I2C SDA pin
        constexpr auto pinScl = GPIO_NUM_33; // I2C SCL pin
    } // namespace I2cConfig

    /**
     * @brief Setup all interfaces and pins
     */
    void setup();

    /**
     * @brief Setup USB serial interface
     */
    void setupUSB();

    /**
     * @brief Setup I2C interface
     */
    void setupI2C();

    /**
     * @brief Setup build-in LED
     */
    void setupLED();

    /**
     * @brief Switch build-in LED
     *
     * @param on true - turn on, false - turn off
     */
    void setLED(bool on);
} // namespace Board
