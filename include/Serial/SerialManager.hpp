#pragma once

#include <functional>
#include <stddef.h>

#include "SerialCommands.hpp"
#include "SerialDevice.hpp"

namespace Serials
{
    /**
     * @brief The read serial command handler function type.
     * Gets command data (may be empty) and fills the response buffer
     */
    using ReadCommandHandler = std::function<bool(const char *, char *, size_t)>;

    /**
     * @brief The write serial command handler function type.
     * Gets command data and may fill the response buffer, left empty for a bare acknowledge
     */
    using WriteCommandHandler = std::function<bool(const char *, char *, size_t)>;

    namespace Manager
    {
        /**
         * @brief Initialize serial manager and serial devices
         */
        void initialize();

        /**
         * @brief Start serial devices, every device is served by its own task
         * @warning All handlers must be subscribed before start
         */
        void start();

        /**
         * @brief Subscribe to specified read command to provide read data
         * May be only one subscriber that provides read data
         *
         * @param commandId Command identifier
         * @param handler Handler function
         */
        void subscribeToRead(CommandId commandId, ReadCommandHandler &&handler);

        /**
         * @brief Subscribe to specified write command to handle write data
         * May be only one subscriber that handle write data
         *
         * @param commandId Command identifier
         * @param handler Handler function
         */
        void subscribeToWrite(CommandId commandId, WriteCommandHandler &&handler);
    } // namespace Manager
} // namespace Serials
