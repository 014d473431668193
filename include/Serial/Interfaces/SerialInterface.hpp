#pragma once

#include <stddef.h>

namespace Serials
{
/**
 * @brief Byte stream link to the host
 */
struct SerialInterface
{
    virtual ~SerialInterface() = default;

    // Prepare transceiver pins, the link stays stopped
    virtual void initialize()
    {
    }

    virtual const char *getInfo() = 0;

    virtual void start() = 0;

    // Links shared with the log output are never closed
    virtual void stop()
    {
    }

    /**
     * @return Count of received bytes waiting for read()
     */
    virtual int available() = 0;

    /**
     * @return Next received byte, -1 if there is none
     */
    virtual int read() = 0;

    virtual size_t write(const char *buffer, size_t size) = 0;
};
} // namespace Serials
