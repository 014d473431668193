/**
 * @file SerialCommands.hpp
 * @author Mikhail Kalina (apollo.mk58@gmail.com)
 * @brief Serial commands list
 * @version 0.2
 * @date 2025-06-02
 *
 * @copyright Copyright (c) 2025
 *
 */

#pragma once

#include <assert.h>
#include <stddef.h>
#include <stdint.h>

namespace Serials
{
    namespace AccessMask
    {
        constexpr uint8_t none = 0;         // No access code
        constexpr uint8_t read = (1 << 0);  // Read access bitmask
        constexpr uint8_t write = (1 << 1); // Write access bitmask
    } // namespace AccessMask

    /**
     * @brief Serial command identifiers
     */
    enum class CommandId
    {
        // Broker verbs: read - submit and wait for the result, write - submit and reply the token
        Identify,       // 0: Probe board presence
        GetDirBit,      // 1: Get pin direction bit
        GetDirRegister, // 2: Get direction register half
        GetIoRegister,  // 3: Get state register half
        SetDirBit,      // 4: Configure pin as input
        ClearDirBit,    // 5: Configure pin as output
        GetPin,         // 6: Get pin level
        SetPin,         // 7: Drive output pin high
        ClearPin,       // 8: Drive output pin low
        TogglePin,      // 9: Pulse output pin
        Result,         // 10: Get result of the submitted command by token

        // Broker configuration, milliseconds
        CommandTtl,    // 11: Set/Get queued command lifetime
        ResultTtl,     // 12: Set/Get unread result lifetime
        PollInterval,  // 13: Set/Get result polling interval
        IdleWait,      // 14: Set/Get dispatcher idle sleep
        BusDeadline,   // 15: Set/Get longest bus transaction
        ToggleDelay,   // 16: Set/Get TOGGLE pulse width
        WaitTimeout,   // 17: Set/Get default wait timeout

        SlaveAddress, // 18: Set/Get serial device slave address
        LogLevel,     // 19: Set/Get log messages level
        Statistics,   // 20: Get broker statistics
        FwVersion,    // 21: Get FW version information

        Commands // Total number of serial commands
    };

    // Count of the broker verb commands at the start of the list
    constexpr size_t verbCommandsCount = static_cast<size_t>(CommandId::Result);

    /**
     * @brief Command structure
     */
    struct Command
    {
        CommandId id;       // Command identifier
        const char *string; // Command string
        uint8_t accessMask; // Access bitmask
    };

    // List of commands
    constexpr Command commandsList[] = {
        {.id = CommandId::Identify, .string = "IDENTIFY", .accessMask = AccessMask::read | AccessMask::write},
        {.id = CommandId::GetDirBit, .string = "GETDBIT", .accessMask = AccessMask::read | AccessMask::write},
        {.id = CommandId::GetDirRegister, .string = "GETDIRREG", .accessMask = AccessMask::read | AccessMask::write},
        {.id = CommandId::GetIoRegister, .string = "GETIOREG", .accessMask = AccessMask::read | AccessMask::write},
        {.id = CommandId::SetDirBit, .string = "SETDBIT", .accessMask = AccessMask::read | AccessMask::write},
        {.id = CommandId::ClearDirBit, .string = "CLRDBIT", .accessMask = AccessMask::read | AccessMask::write},
        {.id = CommandId::GetPin, .string = "GETPIN", .accessMask = AccessMask::read | AccessMask::write},
        {.id = CommandId::SetPin, .string = "SETPIN", .accessMask = AccessMask::read | AccessMask::write},
        {.id = CommandId::ClearPin, .string = "CLRPIN", .accessMask = AccessMask::read | AccessMask::write},
        {.id = CommandId::TogglePin, .string = "TOGGLE", .accessMask = AccessMask::read | AccessMask::write},
        {.id = CommandId::Result, .string = "RESULT", .accessMask = AccessMask::read},
        {.id = CommandId::CommandTtl, .string = "CMDTTL", .accessMask = AccessMask::read | AccessMask::write},
        {.id = CommandId::ResultTtl, .string = "RESTTL", .accessMask = AccessMask::read | AccessMask::write},
        {.id = CommandId::PollInterval, .string = "POLL", .accessMask = AccessMask::read | AccessMask::write},
        {.id = CommandId::IdleWait, .string = "IDLE", .accessMask = AccessMask::read | AccessMask::write},
        {.id = CommandId::BusDeadline, .string = "DEADLINE", .accessMask = AccessMask::read | AccessMask::write},
        {.id = CommandId::ToggleDelay, .string = "TOGGLEMS", .accessMask = AccessMask::read | AccessMask::write},
        {.id = CommandId::WaitTimeout, .string = "WAITMS", .accessMask = AccessMask::read | AccessMask::write},
        {.id = CommandId::SlaveAddress, .string = "ADDR", .accessMask = AccessMask::read | AccessMask::write},
        {.id = CommandId::LogLevel, .string = "LOGL", .accessMask = AccessMask::read | AccessMask::write},
        {.id = CommandId::Statistics, .string = "STAT", .accessMask = AccessMask::read},
        {.id = CommandId::FwVersion, .string = "FVER", .accessMask = AccessMask::read},
    };
    static_assert(sizeof(commandsList) / sizeof(*commandsList) == static_cast<size_t>(CommandId::Commands),
                  "Commands list doesn't match to commands count!");

    /**
     * @brief Get command string
     *
     * @param commandId Command identifier
     * @return Command string
     */
    inline const char *commandString(CommandId commandId)
    {
        size_t id = static_cast<size_t>(commandId);

        assert(id < static_cast<size_t>(CommandId::Commands));

        return commandsList[id].string;
    }
} // namespace Serials
