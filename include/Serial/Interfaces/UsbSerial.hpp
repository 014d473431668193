#pragma once

#include <HardwareSerial.h>

#include "SerialInterface.hpp"

namespace Serials
{
    /**
     * @brief Host link over the USB serial port, the port also carries the log
     */
    class UsbSerial : public SerialInterface
    {
    public:
        UsbSerial(HardwareSerial &port, unsigned long baudrate)
            : _port(port),
              _baudrate(baudrate)
        {
        }

        const char *getInfo() override
        {
            return "USB";
        }

        void start() override
        {
            _port.begin(_baudrate);
        }

        int available() override
        {
            return _port.available();
        }

        int read() override
        {
            return _port.read();
        }

        size_t write(const char *buffer, size_t size) override
        {
            return _port.write(buffer, size);
        }

    private:
        HardwareSerial &_port;
        unsigned long _baudrate;
    };
} // namespace Serials
