#pragma once

#include <stdint.h>

#include <Arduino.h>
#include <HardwareSerial.h>

#include "SerialInterface.hpp"

namespace Serials
{
    /**
     * @brief ST3485 half-duplex RS485 transceiver device class
     */
    class St3485 : public SerialInterface
    {
    public:
        /**
         * @brief Transceiver pins
         */
        struct Pins
        {
            gpio_num_t rx;       // Serial Rx pin
            gpio_num_t tx;       // Serial Tx pin
            gpio_num_t rxEnable; // Receiver output enable (RO is enabled when RE is low)
            gpio_num_t txEnable; // Driver output enable (DO is enabled when DE is high)
        };

        /**
         * @brief Construct a new St3485 object
         *
         * @param serial UART the transceiver is wired to
         * @param pins Transceiver pins
         * @param baudrate Baud rate of the bus
         */
        St3485(HardwareSerial &serial, const Pins &pins, unsigned long baudrate)
            : _serial(serial),
              _pins(pins),
              _baudrate(baudrate)
        {
        }

        virtual void initialize() override
        {
            pinMode(_pins.rxEnable, OUTPUT);
            pinMode(_pins.txEnable, OUTPUT);

            lowPower();
        }

        virtual const char *getInfo() override
        {
            return "RS485-ST3485";
        }

        /**
         * @brief Start UART and switch transceiver into receiver mode
         */
        virtual void start() override
        {
            _serial.begin(_baudrate, SERIAL_8N1, _pins.rx, _pins.tx);

            digitalWrite(_pins.rxEnable, LOW); // Set RE to LOW
        }

        /**
         * @brief Stop UART and switch transceiver into low-power mode
         */
        virtual void stop() override
        {
            _serial.end();

            lowPower();
        }

        virtual int available() override
        {
            return _serial.available();
        }

        virtual int read() override
        {
            return _serial.read();
        }

        /**
         * @brief Transmit buffer, the bus is driven only while transmitting
         *
         * @param buffer Pointer to data
         * @param size Size of transmitted data
         * @return Count of transmitted bytes
         */
        virtual size_t write(const char *buffer, size_t size) override
        {
            digitalWrite(_pins.txEnable, HIGH); // Set DE to HIGH

            size_t txSize = _serial.write(buffer, size);
            _serial.flush();

            digitalWrite(_pins.txEnable, LOW); // Reset DE to LOW

            return txSize;
        }

    private:
        void lowPower()
        {
            digitalWrite(_pins.rxEnable, HIGH); // Set RE to HIGH
            digitalWrite(_pins.txEnable, LOW);  // Reset DE to LOW
        }

        HardwareSerial &_serial; // UART hardware serial interface
        Pins _pins;              // Transceiver pins
        unsigned long _baudrate; // Baud rate
    };
} // namespace Serials
