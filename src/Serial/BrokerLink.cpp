#include "Serial/BrokerLink.hpp"

#include <ctype.h>
#include <errno.h>
#include <stdio.h>
#include <stdlib.h>

#include <Log.hpp>

using namespace Serials;

namespace
{
    /**
     * @brief Configuration field served by a serial command
     */
    struct ConfigField
    {
        CommandId id;                   // Command identifier
        uint32_t Broker::Config::*field; // Configuration field
    };

    // Configuration commands
    constexpr ConfigField configFields[] = {
        {.id = CommandId::CommandTtl, .field = &Broker::Config::commandTtlMs},
        {.id = CommandId::ResultTtl, .field = &Broker::Config::resultTtlMs},
        {.id = CommandId::PollInterval, .field = &Broker::Config::pollIntervalMs},
        {.id = CommandId::IdleWait, .field = &Broker::Config::idleWaitMs},
        {.id = CommandId::BusDeadline, .field = &Broker::Config::busDeadlineMs},
        {.id = CommandId::ToggleDelay, .field = &Broker::Config::toggleDelayMs},
        {.id = CommandId::WaitTimeout, .field = &Broker::Config::waitTimeoutMs},
    };

    const ConfigField *findConfigField(CommandId commandId)
    {
        for (const auto &field : configFields)
        {
            if (field.id == commandId)
            {
                return &field;
            }
        }

        return nullptr;
    }

    void formatValue(int16_t value, char *response, size_t size)
    {
        if (value == Broker::errorValue)
        {
            snprintf(response, size, "%s", BrokerLink::errorString);
        }
        else
        {
            snprintf(response, size, "0x%02X", static_cast<unsigned int>(value));
        }
    }
} // namespace

bool BrokerLink::toVerb(CommandId commandId, Broker::Verb &verb)
{
    if (static_cast<size_t>(commandId) >= verbCommandsCount)
    {
        return false;
    }

    return Broker::parseVerb(commandString(commandId), verb);
}

bool BrokerLink::readVerb(Broker::Client &client, CommandId commandId, const char *args, char *response, size_t size)
{
    Broker::Verb verb;
    uint8_t boardAddress;
    uint8_t index;

    if (toVerb(commandId, verb) == false || Broker::parseArguments(verb, args, boardAddress, index) == false)
    {
        return false;
    }

    int16_t value;
    Broker::Status status = client.submitAndWait(verb, boardAddress, index, value);
    if (status == Broker::Status::Ok)
    {
        formatValue(value, response, size);
    }
    else
    {
        snprintf(response, size, "%s", Broker::statusName(status));
    }

    return true;
}

bool BrokerLink::writeVerb(Broker::Client &client, CommandId commandId, const char *args, char *response, size_t size)
{
    Broker::Verb verb;
    uint8_t boardAddress;
    uint8_t index;

    if (toVerb(commandId, verb) == false || Broker::parseArguments(verb, args, boardAddress, index) == false)
    {
        return false;
    }

    Broker::Token token;
    Broker::Status status = client.submit(verb, boardAddress, index, token);
    if (status == Broker::Status::Ok)
    {
        snprintf(response, size, "%u", static_cast<unsigned int>(token));
    }
    else
    {
        snprintf(response, size, "%s", Broker::statusName(status));
    }

    return true;
}

bool BrokerLink::readResult(Broker::Client &client, const char *args, char *response, size_t size)
{
    uint32_t token;
    if (parseDecimal(args, token) == false || token == Broker::invalidToken)
    {
        return false;
    }

    int16_t value;
    Broker::Status status = client.fetch(token, value);
    if (status == Broker::Status::Ok)
    {
        formatValue(value, response, size);
    }
    else
    {
        snprintf(response, size, "%s", Broker::statusName(status));
    }

    return true;
}

bool BrokerLink::readConfig(const Broker::Config &config, CommandId commandId, char *response, size_t size)
{
    const ConfigField *field = findConfigField(commandId);
    if (field == nullptr)
    {
        return false;
    }

    snprintf(response, size, "%u", static_cast<unsigned int>(config.*(field->field)));

    return true;
}

bool BrokerLink::writeConfig(Broker::Config &config, CommandId commandId, const char *data)
{
    const ConfigField *field = findConfigField(commandId);
    if (field == nullptr)
    {
        return false;
    }

    uint32_t value;
    if (parseDecimal(data, value) == false)
    {
        return false;
    }

    Broker::Config newConfig = config;
    newConfig.*(field->field) = value;

    // Out of range value is rejected instead of being clamped
    if (Broker::sanitize(newConfig) == false)
    {
        LOG_WARNING("%s: value %u is rejected", commandString(commandId), value);
        return false;
    }

    config = newConfig;

    return true;
}

void BrokerLink::formatStatistics(const Broker::Statistics &statistics, char *response, size_t size)
{
    snprintf(response, size, "SUB %u REJ %u EXP %u DLV %u PUB %u UNR %u", statistics.submitted, statistics.rejected,
             statistics.expired, statistics.delivered, statistics.published, statistics.unread);
}

bool BrokerLink::parseDecimal(const char *string, uint32_t &value)
{
    if (string == nullptr || isdigit(static_cast<unsigned char>(*string)) == 0)
    {
        return false;
    }

    errno = 0;
    char *end = nullptr;
    unsigned long number = strtoul(string, &end, 10);
    if (*end != '\0' || errno == ERANGE || number > UINT32_MAX)
    {
        return false;
    }

    value = static_cast<uint32_t>(number);

    return true;
}
