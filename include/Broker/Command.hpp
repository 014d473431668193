/**
 * @file Command.hpp
 * @author Mikhail Kalina (apollo.mk58@gmail.com)
 * @brief Broker commands, verbs and results
 * @version 0.1
 * @date 2025-06-02
 *
 * @copyright Copyright (c) 2025
 *
 */

#pragma once

#include <stdbool.h>
#include <stddef.h>
#include <stdint.h>

namespace Broker
{
    /**
     * @brief Command correlation token, never zero for a submitted command
     */
    using Token = uint32_t;

    // Token value that is never assigned
    constexpr Token invalidToken = 0;

    // Result value of a read verb that failed
    constexpr int16_t errorValue = -1;

    /**
     * @brief Command verbs
     */
    enum class Verb : uint8_t
    {
        Identify,       // 0: Probe board presence
        GetDirBit,      // 1: Read direction bit of the pin
        GetDirRegister, // 2: Read direction register half
        GetIoRegister,  // 3: Read state register half
        SetDirBit,      // 4: Configure pin as input
        ClearDirBit,    // 5: Configure pin as output
        GetPin,         // 6: Read pin level
        SetPin,         // 7: Drive output pin high
        ClearPin,       // 8: Drive output pin low
        TogglePin,      // 9: Pulse output pin to the opposite level and back

        Count // Total number of verbs
    };

    /**
     * @brief What the command index field addresses
     */
    enum class Target : uint8_t
    {
        Board, // Whole board, index is ignored
        Pin,   // Pin index 0..15
        Half   // Register half 0..1
    };

    /**
     * @brief Verb description
     */
    struct VerbInfo
    {
        Verb verb;        // Verb identifier
        const char *name; // Verb name used by clients
        Target target;    // Meaning of the index field
        bool isFlag;      // Result is a success flag (true) or a read value (false)
    };

    // List of verbs
    constexpr VerbInfo verbsList[] = {
        {.verb = Verb::Identify, .name = "IDENTIFY", .target = Target::Board, .isFlag = true},
        {.verb = Verb::GetDirBit, .name = "GETDBIT", .target = Target::Pin, .isFlag = false},
        {.verb = Verb::GetDirRegister, .name = "GETDIRREG", .target = Target::Half, .isFlag = false},
        {.verb = Verb::GetIoRegister, .name = "GETIOREG", .target = Target::Half, .isFlag = false},
        {.verb = Verb::SetDirBit, .name = "SETDBIT", .target = Target::Pin, .isFlag = true},
        {.verb = Verb::ClearDirBit, .name = "CLRDBIT", .target = Target::Pin, .isFlag = true},
        {.verb = Verb::GetPin, .name = "GETPIN", .target = Target::Pin, .isFlag = false},
        {.verb = Verb::SetPin, .name = "SETPIN", .target = Target::Pin, .isFlag = true},
        {.verb = Verb::ClearPin, .name = "CLRPIN", .target = Target::Pin, .isFlag = true},
        {.verb = Verb::TogglePin, .name = "TOGGLE", .target = Target::Pin, .isFlag = true},
    };
    static_assert(sizeof(verbsList) / sizeof(*verbsList) == static_cast<size_t>(Verb::Count),
                  "Verbs list doesn't match to verbs count!");

    /**
     * @brief Unit of work for the dispatcher, immutable once submitted
     */
    struct Command
    {
        Token token;           // Correlation token
        Verb verb;             // Command verb
        uint8_t boardAddress;  // 7-bit board address
        uint8_t index;         // Pin index or register half, see VerbInfo::target
        uint32_t submittedAt;  // Submission time, milliseconds
        uint32_t ttlMs;        // Lifetime in the queue, milliseconds
    };

    /**
     * @brief Value produced by executing a command
     */
    struct PendingResult
    {
        Token token;         // Token of the originating command
        int16_t value;       // Flag, bit, register value or errorValue
        uint32_t producedAt; // Production time, milliseconds
    };

    /**
     * @brief Get verb description
     *
     * @param verb Verb identifier
     * @return Reference to the verb description
     */
    const VerbInfo &verbInfo(Verb verb);

    /**
     * @brief Get verb name
     *
     * @param verb Verb identifier
     * @return Verb name string
     */
    const char *verbName(Verb verb);

    /**
     * @brief Recognise verb by its name, case insensitive
     *
     * @param[in] name Verb name string
     * @param[out] verb Recognised verb
     * @return true if name is a known verb, false otherwise
     */
    bool parseVerb(const char *name, Verb &verb);

    /**
     * @brief Parse command arguments "<board>,<index>" given as hexadecimal numbers
     * Index may be omitted for verbs addressing a whole board
     *
     * @param[in] verb Command verb
     * @param[in] string Arguments string, e.g. "20,0A" or "0x20,0x0A"
     * @param[out] boardAddress Parsed board address
     * @param[out] index Parsed pin index or register half
     * @return true if arguments are well formed, false otherwise
     */
    bool parseArguments(Verb verb, const char *string, uint8_t &boardAddress, uint8_t &index);

    /**
     * @brief Check board address and index of the command against the register model
     *
     * @param command Command to check
     * @return true if command addresses existing board strap and pin/half, false otherwise
     */
    bool isAddressValid(const Command &command);

    /**
     * @brief Result value reported for a command that failed
     *
     * @param verb Command verb
     * @return Failure value: false flag for flag verbs, errorValue for read verbs
     */
    int16_t failureValue(Verb verb);
} // namespace Broker
