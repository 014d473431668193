#include "Broker/CommandStore.hpp"

#include <algorithm>

#include <Log.hpp>

using namespace Broker;

namespace
{
    // Count of expired tokens remembered per stored entry
    constexpr size_t expiredTokensFactor = 2;

    /**
     * @brief Check whether an entry created at the given time outlived its lifetime
     *
     * @param createdAt Creation time, milliseconds
     * @param ttlMs Lifetime, milliseconds
     * @param now Current time, milliseconds
     * @return true if entry is expired, false otherwise
     */
    bool isExpired(uint32_t createdAt, uint32_t ttlMs, uint32_t now)
    {
        return elapsedMs(createdAt, now) >= ttlMs;
    }
} // namespace

CommandStore::CommandStore(MillisFunction millis, size_t capacity)
    : _millis(millis),
      _capacity(capacity)
{
}

EnqueueStatus CommandStore::enqueue(Verb verb, uint8_t boardAddress, uint8_t index, uint32_t ttlMs, Token &token)
{
    std::lock_guard<std::mutex> lock(_mutex);

    uint32_t now = _millis();

    // Expired commands at the head don't hold capacity
    while (_commands.empty() == false && isExpired(_commands.front().submittedAt, _commands.front().ttlMs, now) == true)
    {
        LOG_TRACE("Command %u %s expired in the queue", _commands.front().token, verbName(_commands.front().verb));
        rememberExpired(_commands.front().token);
        _statistics.expired++;
        _commands.pop_front();
    }

    if (_commands.size() >= _capacity)
    {
        _statistics.rejected++;
        LOG_WARNING("Command queue is full (%u), %s rejected", static_cast<uint32_t>(_capacity), verbName(verb));
        return EnqueueStatus::QueueFull;
    }

    // Zero is never a valid token
    _lastToken++;
    if (_lastToken == invalidToken)
    {
        _lastToken++;
    }

    Command command = {
        .token = _lastToken,
        .verb = verb,
        .boardAddress = boardAddress,
        .index = index,
        .submittedAt = now,
        .ttlMs = ttlMs,
    };
    _commands.push_back(command);
    _statistics.submitted++;

    token = command.token;

    LOG_TRACE("Command %u %s 0x%02X,%u queued", token, verbName(verb), boardAddress, index);

    return EnqueueStatus::Queued;
}

bool CommandStore::dequeueNext(Command &command)
{
    std::lock_guard<std::mutex> lock(_mutex);

    uint32_t now = _millis();

    while (_commands.empty() == false)
    {
        Command head = _commands.front();
        _commands.pop_front();

        if (isExpired(head.submittedAt, head.ttlMs, now) == true)
        {
            LOG_TRACE("Command %u %s expired in the queue", head.token, verbName(head.verb));
            rememberExpired(head.token);
            _statistics.expired++;
            continue;
        }

        _statistics.delivered++;
        command = head;
        return true;
    }

    return false;
}

void CommandStore::publishResult(Token token, int16_t value, uint32_t ttlMs)
{
    std::lock_guard<std::mutex> lock(_mutex);

    uint32_t now = _millis();

    if (_results.size() >= _capacity)
    {
        purgeResults(now);
    }
    if (_results.size() >= _capacity)
    {
        LOG_DEBUG("Result %u evicted unread", _results.front().result.token);
        rememberExpired(_results.front().result.token);
        _statistics.unread++;
        _results.pop_front();
    }

    ResultEntry entry = {
        .result = {.token = token, .value = value, .producedAt = now},
        .ttlMs = ttlMs,
    };
    _results.push_back(entry);
    _statistics.published++;

    LOG_TRACE("Result %u = %d published", token, value);
}

FetchStatus CommandStore::fetchResult(Token token, PendingResult &result)
{
    std::lock_guard<std::mutex> lock(_mutex);

    uint32_t now = _millis();

    auto it = std::find_if(_results.begin(), _results.end(),
                           [token](const ResultEntry &entry)
                           { return entry.result.token == token; });

    if (it != _results.end())
    {
        if (isExpired(it->result.producedAt, it->ttlMs, now) == true)
        {
            LOG_TRACE("Result %u expired unread", token);
            rememberExpired(token);
            _statistics.unread++;
            _results.erase(it);
            return FetchStatus::Expired;
        }

        result = it->result;
        _results.erase(it);
        return FetchStatus::Ready;
    }

    if (isRecentlyExpired(token) == true)
    {
        return FetchStatus::Expired;
    }

    // The command is queued, executing or unknown
    return FetchStatus::NotReady;
}

size_t CommandStore::pendingCount()
{
    std::lock_guard<std::mutex> lock(_mutex);

    return _commands.size();
}

void CommandStore::clear()
{
    std::lock_guard<std::mutex> lock(_mutex);

    _commands.clear();
    _results.clear();
    _expiredTokens.clear();
}

Statistics CommandStore::statistics()
{
    std::lock_guard<std::mutex> lock(_mutex);

    return _statistics;
}

void CommandStore::rememberExpired(Token token)
{
    _expiredTokens.push_back(token);

    while (_expiredTokens.size() > _capacity * expiredTokensFactor)
    {
        _expiredTokens.pop_front();
    }
}

bool CommandStore::isRecentlyExpired(Token token) const
{
    return std::find(_expiredTokens.begin(), _expiredTokens.end(), token) != _expiredTokens.end();
}

void CommandStore::purgeResults(uint32_t now)
{
    for (auto it = _results.begin(); it != _results.end();)
    {
        if (isExpired(it->result.producedAt, it->ttlMs, now) == true)
        {
            LOG_TRACE("Result %u expired unread", it->result.token);
            rememberExpired(it->result.token);
            _statistics.unread++;
            it = _results.erase(it);
        }
        else
        {
            it++;
        }
    }
}
