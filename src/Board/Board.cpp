/**
 * @file Board.cpp
 * @author Mikhail Kalina (apollo.mk58@gmail.com)
 * @brief Board management implementation
 * @version 0.2
 * @date 2025-06-02
 *
 * @copyright Copyright (c) 2025
 *
 */

#include "Board/Board.hpp"

#include <stddef.h>
#include <stdint.h>

#include <Wire.h>

#include <Log.hpp>

using namespace Board;

/**
 * @brief Setup all interfaces and pins
 */
void Board::setup()
{
    // USB serial goes first to print the log
    setupUSB();

    LOG_DEBUG("Setup board...");

    // Setup I2C interface to communicate with the expanders
    setupI2C();
    // Setup build-in LED (turn off)
    setupLED();

    LOG_INFO("Board setup done");
}

/**
 * @brief Setup USB serial interface
 */
void Board::setupUSB()
{
    Serial.begin(UsbConfig::baudrate);
}

/**
 * @brief Setup I2C interface
 */
void Board::setupI2C()
{
    bool result = Wire.begin(I2cConfig::pinSda, I2cConfig::pinScl, I2cConfig::frequency);
    if (result == false)
    {
        LOG_ERROR("I2C bus initialization failed");
    }
}

/**
 * @brief Setup build-in LED
 */
void Board::setupLED()
{
    pinMode(BUILTIN_LED, OUTPUT);
    // Turn off build-in LED (LOW - off, HIGH - on)
    digitalWrite(BUILTIN_LED, LOW);
}

void Board::setLED(bool on)
{
    digitalWrite(BUILTIN_LED, on ? HIGH : LOW);
}
