/**
 * @file Command.cpp
 * @author Mikhail Kalina (apollo.mk58@gmail.com)
 * @brief Broker commands, verbs and results implementation
 * @version 0.1
 * @date 2025-06-02
 *
 * @copyright Copyright (c) 2025
 *
 */

#include "Broker/Command.hpp"

#include <assert.h>
#include <ctype.h>
#include <stdlib.h>
#include <string.h>
#include <strings.h>

#include <Log.hpp>

#include "Expander/Registers.hpp"

using namespace Broker;

namespace
{
    // Separator between board address and index
    constexpr char argumentSeparator = ',';

    /**
     * @brief Parse one hexadecimal byte, "0x" prefix is optional
     *
     * @param[in] begin Start of the number
     * @param[in] end End of the number (exclusive)
     * @param[out] value Parsed value
     * @return true if the whole range is a hexadecimal number up to 0xFF, false otherwise
     */
    bool parseHexByte(const char *begin, const char *end, uint8_t &value)
    {
        // Skip leading spaces
        while (begin < end && isspace(static_cast<unsigned char>(*begin)))
        {
            begin++;
        }
        // Skip trailing spaces
        while (end > begin && isspace(static_cast<unsigned char>(*(end - 1))))
        {
            end--;
        }

        if (end - begin > 2 && begin[0] == '0' && (begin[1] == 'x' || begin[1] == 'X'))
        {
            begin += 2;
        }

        // 1 or 2 hexadecimal digits
        if (begin == end || end - begin > 2)
        {
            return false;
        }

        char digits[3] = {0};
        for (size_t idx = 0; begin + idx < end; idx++)
        {
            if (isxdigit(static_cast<unsigned char>(begin[idx])) == 0)
            {
                return false;
            }

            digits[idx] = begin[idx];
        }

        value = static_cast<uint8_t>(strtoul(digits, nullptr, 16));

        return true;
    }
} // namespace

const VerbInfo &Broker::verbInfo(Verb verb)
{
    size_t id = static_cast<size_t>(verb);

    assert(id < static_cast<size_t>(Verb::Count));

    return verbsList[id];
}

const char *Broker::verbName(Verb verb)
{
    return verbInfo(verb).name;
}

bool Broker::parseVerb(const char *name, Verb &verb)
{
    if (name == nullptr)
    {
        return false;
    }

    for (const auto &info : verbsList)
    {
        if (strcasecmp(name, info.name) == 0)
        {
            verb = info.verb;
            return true;
        }
    }

    LOG_DEBUG("Unknown verb: %s", name);

    return false;
}

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
bool Broker::parseArguments(Verb verb, const char *string, uint8_t &boardAddress, uint8_t &index)
{
    if (string == nullptr)
    {
        return false;
    }

    const char *end = string + strlen(string);
    const char *separator = strchr(string, argumentSeparator);

    if (separator == nullptr)
    {
        // Only whole board verbs may omit the index
        if (verbInfo(verb).target != Target::Board)
        {
            return false;
        }

        index = 0;
        return parseHexByte(string, end, boardAddress);
    }

    uint8_t parsedBoard;
    uint8_t parsedIndex;
    if (parseHexByte(string, separator, parsedBoard) == false ||
        parseHexByte(separator + 1, end, parsedIndex) == false)
    {
        return false;
    }

    boardAddress = parsedBoard;
    index = parsedIndex;

    return true;
}

bool Broker::isAddressValid(const Command &command)
{
    if (Expander::isValidBoard(command.boardAddress) == false)
    {
        return false;
    }

    switch (verbInfo(command.verb).target)
    {
    case Target::Pin:
        return Expander::isValidPin(command.index);
    case Target::Half:
        return Expander::isValidHalf(command.index);
    case Target::Board:
    default:
        return true;
    }
}

int16_t Broker::failureValue(Verb verb)
{
    return verbInfo(verb).isFlag ? 0 : errorValue;
}
