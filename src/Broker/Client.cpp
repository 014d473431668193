#include "Broker/Client.hpp"

#include <Log.hpp>

using namespace Broker;

namespace
{
    // Status names
    constexpr const char *statusNames[] = {
        "OK",        // Ok
        "FULL",      // QueueFull
        "TIMEOUT",   // Timeout
        "EXPIRED",   // Expired
        "NOTREADY",  // NotReady
        "UNKNOWN",   // UnknownVerb
    };
    static_assert(sizeof(statusNames) / sizeof(*statusNames) == static_cast<size_t>(Status::UnknownVerb) + 1,
                  "Status names list doesn't match to statuses count!");
} // namespace

const char *Broker::statusName(Status status)
{
    return statusNames[static_cast<size_t>(status)];
}

Client::Client(Context &context)
    : _context(context)
{
}

Status Client::submit(Verb verb, uint8_t boardAddress, uint8_t index, Token &token)
{
    if (static_cast<size_t>(verb) >= static_cast<size_t>(Verb::Count))
    {
        LOG_WARNING("Verb %u is unknown, command rejected", static_cast<uint8_t>(verb));
        return Status::UnknownVerb;
    }

    EnqueueStatus status =
        _context.store().enqueue(verb, boardAddress, index, _context.config().commandTtlMs, token);

    return (status == EnqueueStatus::Queued) ? Status::Ok : Status::QueueFull;
}

Status Client::submitAndWait(Verb verb, uint8_t boardAddress, uint8_t index, uint32_t timeoutMs, int16_t &value)
{
    Token token;
    Status status = submit(verb, boardAddress, index, token);
    if (status != Status::Ok)
    {
        return status;
    }

    const Timing &timing = _context.timing();
    uint32_t pollIntervalMs = _context.config().pollIntervalMs;
    uint32_t startedAt = timing.millis();

    while (true)
    {
        status = fetch(token, value);
        if (status != Status::NotReady)
        {
            return status;
        }

        if (elapsedMs(startedAt, timing.millis()) >= timeoutMs)
        {
            LOG_DEBUG("Command %u %s timed out after %u ms", token, verbName(verb), timeoutMs);
            return Status::Timeout;
        }

        timing.delay(pollIntervalMs);
    }
}

Status Client::submitAndWait(Verb verb, uint8_t boardAddress, uint8_t index, int16_t &value)
{
    return submitAndWait(verb, boardAddress, index, _context.config().waitTimeoutMs, value);
}

Status Client::submitAndWait(const char *verbName, uint8_t boardAddress, uint8_t index, uint32_t timeoutMs,
                             int16_t &value)
{
    Verb verb;
    if (parseVerb(verbName, verb) == false)
    {
        return Status::UnknownVerb;
    }

    return submitAndWait(verb, boardAddress, index, timeoutMs, value);
}

Status Client::fetch(Token token, int16_t &value)
{
    PendingResult result;

    switch (_context.store().fetchResult(token, result))
    {
    case FetchStatus::Ready:
        value = result.value;
        return Status::Ok;

    case FetchStatus::Expired:
        return Status::Expired;

    case FetchStatus::NotReady:
    default:
        return Status::NotReady;
    }
}
