/**
 * @file CommandStore.hpp
 * @author Mikhail Kalina (apollo.mk58@gmail.com)
 * @brief Expiring store of pending commands and results
 * @version 0.1
 * @date 2025-06-02
 *
 * @copyright Copyright (c) 2025
 *
 */

#pragma once

#include <deque>
#include <mutex>
#include <stddef.h>
#include <stdint.h>

#include "Command.hpp"
#include "Config.hpp"
#include "Timing.hpp"

namespace Broker
{
    /**
     * @brief Status of command submission
     */
    enum class EnqueueStatus
    {
        Queued,   // Command is queued, token is valid
        QueueFull // Store is saturated, command rejected
    };

    /**
     * @brief Status of result fetching
     */
    enum class FetchStatus
    {
        Ready,    // Result is available
        NotReady, // Command is queued or in progress, or token is unknown
        Expired   // Command or result expired before pickup
    };

    /**
     * @brief Store counters
     */
    struct Statistics
    {
        uint32_t submitted; // Commands accepted
        uint32_t rejected;  // Commands rejected by saturation
        uint32_t expired;   // Commands expired in the queue
        uint32_t delivered; // Commands handed to the dispatcher
        uint32_t published; // Results published
        uint32_t unread;    // Results expired or evicted unread
    };

    /**
     * @brief Shared store holding commands awaiting execution and results awaiting pickup.
     * Every entry has a lifetime, expired entries silently vanish.
     * All operations are atomic with respect to each other.
     */
    class CommandStore
    {
    public:
        /**
         * @brief Construct a new Command Store object
         *
         * @param millis Clock used for submission and expiry timestamps
         * @param capacity Maximum number of queued commands, and of stored results
         */
        explicit CommandStore(MillisFunction millis, size_t capacity = queueCapacity);

        /**
         * @brief Insert a command at the queue tail
         *
         * @param[in] verb Command verb
         * @param[in] boardAddress 7-bit board address
         * @param[in] index Pin index or register half
         * @param[in] ttlMs Command lifetime, milliseconds
         * @param[out] token Token of the queued command
         * @return Enqueue status
         */
        EnqueueStatus enqueue(Verb verb, uint8_t boardAddress, uint8_t index, uint32_t ttlMs, Token &token);

        /**
         * @brief Remove the oldest live command from the queue head.
         * Expired commands met before it are discarded.
         *
         * @param[out] command Dequeued command
         * @return true if a live command is returned, false if the queue is empty
         */
        bool dequeueNext(Command &command);

        /**
         * @brief Store a result for pickup
         *
         * @param token Token of the executed command
         * @param value Result value
         * @param ttlMs Result lifetime, milliseconds
         */
        void publishResult(Token token, int16_t value, uint32_t ttlMs);

        /**
         * @brief Non-blocking pickup of a result, a picked up result is removed
         *
         * @param[in] token Command token
         * @param[out] result Result if ready
         * @return Fetch status
         */
        FetchStatus fetchResult(Token token, PendingResult &result);

        /**
         * @brief Count of queued commands, expired ones included until they are discarded
         *
         * @return Queue length
         */
        size_t pendingCount();

        /**
         * @brief Discard all queued commands and results
         */
        void clear();

        /**
         * @brief Get store counters
         *
         * @return Counters snapshot
         */
        Statistics statistics();

    private:
        /**
         * @brief Stored result
         */
        struct ResultEntry
        {
            PendingResult result; // Result
            uint32_t ttlMs;       // Result lifetime, milliseconds
        };

        /**
         * @brief Remember token of an entry that expired
         *
         * @param token Token to remember
         */
        void rememberExpired(Token token);

        /**
         * @brief Check whether token is in the list of recently expired tokens
         *
         * @param token Token to check
         * @return true if token expired recently, false otherwise
         */
        bool isRecentlyExpired(Token token) const;

        /**
         * @brief Discard expired results
         *
         * @param now Current time, milliseconds
         */
        void purgeResults(uint32_t now);

        MillisFunction _millis; // Clock
        size_t _capacity;       // Maximum count of commands and of results

        std::mutex _mutex;                   // Guards all the members below
        std::deque<Command> _commands;       // Queued commands in submission order
        std::deque<ResultEntry> _results;    // Results in publication order
        std::deque<Token> _expiredTokens;    // Recently expired tokens
        Token _lastToken = invalidToken;     // The last assigned token
        Statistics _statistics = {};         // Counters
    };
} // namespace Broker
