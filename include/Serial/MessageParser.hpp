/**
 * @file MessageParser.hpp
 * @author Mikhail Kalina (apollo.mk58@gmail.com)
 * @brief Host link message parser
 * @version 0.1
 * @date 2025-06-02
 *
 * @copyright Copyright (c) 2025
 *
 */

#pragma once

#include <atomic>
#include <stddef.h>
#include <stdint.h>

#include "SerialCommands.hpp"

namespace Serials
{
    /**
     * @brief Received host message
     */
    struct Message
    {
        CommandId commandId; // Command identifier
        uint8_t accessMask;  // AccessMask::read or AccessMask::write
        bool isBroadcast;    // Message is addressed to all devices
        const char *data;    // Command data, empty string if there is none
    };

    /**
     * @brief Finite state machine accumulating "!<address>:<command><access><data>\r" messages
     * character by character. Access code '?' reads, '=' writes, address is three decimal digits.
     */
    class MessageParser
    {
        /**
         * @brief State of the receiving message
         */
        enum class State
        {
            Start,   // Waiting the start of the message
            Address, // Receiving slave address up to the separator
            Command, // Receiving command identifier up to the access code
            Data,    // Receiving command data up to the end of the message
        };

    public:
        /**
         * @brief Result of one received character
         */
        enum class Status
        {
            Continue, // Message isn't complete or isn't addressed to this device
            Complete, // Message is complete, see message()
            Failed,   // Message addressed to this device is malformed
        };

        // Maximum length of command data field
        constexpr static size_t dataMaxLength = 100;
        // Invalid slave address
        constexpr static int invalidAddress = -1;
        // Address for broadcast messages
        constexpr static int broadcastAddress = 0;
        // Maximum valid address value
        constexpr static int maxAddress = 999;
        // Maximum time to wait for the rest of the message, milliseconds
        constexpr static uint32_t messageTimeoutMs = 500;

        /**
         * @brief Check whether address may be assigned to a device
         *
         * @param address Slave address
         * @return true if address is valid, false otherwise
         */
        static bool isValidAddress(int address);

        /**
         * @brief Put the next received character
         *
         * @param inputChar Received character
         * @param now Receiving time, milliseconds
         * @return Parsing status
         */
        Status put(char inputChar, uint32_t now);

        /**
         * @brief Drop the incomplete message if the rest of it didn't come in time
         *
         * @param now Current time, milliseconds
         */
        void checkTimeout(uint32_t now);

        /**
         * @brief Get the complete message
         * @warning Valid after put() returned Complete until the next character
         *
         * @return Reference to the message
         */
        const Message &message() const
        {
            return _message;
        }

        /**
         * @brief Check whether the last message is a broadcast one
         *
         * @return true if message is addressed to all devices, false otherwise
         */
        bool isBroadcast() const
        {
            return _message.isBroadcast;
        }

        int slaveAddress() const
        {
            return _slaveAddress.load();
        }

        // Set by the ADDR command from any device task
        void setSlaveAddress(int address)
        {
            _slaveAddress.store(address);
        }

    private:
        bool append(char inputChar, size_t maxLength);
        void setState(State newState);

        Status receiveAddress(char inputChar);
        Status receiveCommand(char inputChar);
        Status receiveData(char inputChar);

        std::atomic<int> _slaveAddress{invalidAddress}; // Own slave address

        State _state = State::Start;           // State of receiving message
        uint32_t _lastCharAt = 0;              // Time of the last received character
        char _input[dataMaxLength + 1] = {0};  // Accumulated field
        size_t _inputLength = 0;               // Length of accumulated field

        Message _message = {
            .commandId = CommandId::SlaveAddress,
            .accessMask = AccessMask::none,
            .isBroadcast = false,
            .data = nullptr,
        }; // The last message
    };
} // namespace Serials
