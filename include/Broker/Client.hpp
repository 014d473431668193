/**
 * @file Client.hpp
 * @author Mikhail Kalina (apollo.mk58@gmail.com)
 * @brief Command broker client API
 * @version 0.1
 * @date 2025-06-02
 *
 * @copyright Copyright (c) 2025
 *
 */

#pragma once

#include <stdint.h>

#include "Command.hpp"
#include "Context.hpp"

namespace Broker
{
    /**
     * @brief Client call status
     */
    enum class Status
    {
        Ok,          // Command is queued or its result is returned
        QueueFull,   // Command rejected, the store is saturated
        Timeout,     // No result within the caller timeout, the command isn't retracted
        Expired,     // Command or its result expired before pickup
        NotReady,    // Result isn't available yet
        UnknownVerb, // Verb or verb name isn't recognised
    };

    /**
     * @brief Get status name
     *
     * @param status Client call status
     * @return Status name string
     */
    const char *statusName(Status status);

    /**
     * @brief Client facade of the broker, safe to use from any number of threads.
     * Waiting calls block only the calling thread.
     */
    class Client
    {
    public:
        explicit Client(Context &context);

        /**
         * @brief Submit a command without waiting for the result
         *
         * @param[in] verb Command verb
         * @param[in] boardAddress 7-bit board address
         * @param[in] index Pin index or register half
         * @param[out] token Token to fetch the result with
         * @return Ok, QueueFull or UnknownVerb
         */
        Status submit(Verb verb, uint8_t boardAddress, uint8_t index, Token &token);

        /**
         * @brief Submit a command and poll for its result
         *
         * @param[in] verb Command verb
         * @param[in] boardAddress 7-bit board address
         * @param[in] index Pin index or register half
         * @param[in] timeoutMs Longest wait, milliseconds
         * @param[out] value Result value when status is Ok
         * @return Ok, QueueFull, UnknownVerb, Timeout or Expired
         */
        Status submitAndWait(Verb verb, uint8_t boardAddress, uint8_t index, uint32_t timeoutMs, int16_t &value);

        /**
         * @brief Submit a command and poll for its result within the configured wait timeout
         */
        Status submitAndWait(Verb verb, uint8_t boardAddress, uint8_t index, int16_t &value);

        /**
         * @brief Submit a command given by verb name and poll for its result
         *
         * @param[in] verbName Verb name, case insensitive
         * @param[in] boardAddress 7-bit board address
         * @param[in] index Pin index or register half
         * @param[in] timeoutMs Longest wait, milliseconds
         * @param[out] value Result value when status is Ok
         * @return UnknownVerb or a status of the enum overload
         */
        Status submitAndWait(const char *verbName, uint8_t boardAddress, uint8_t index, uint32_t timeoutMs,
                             int16_t &value);

        /**
         * @brief Single non-blocking poll of a result
         *
         * @param[in] token Token returned by submit
         * @param[out] value Result value when status is Ok
         * @return Ok, NotReady or Expired
         */
        Status fetch(Token token, int16_t &value);

    private:
        Context &_context; // Broker instance
    };
} // namespace Broker
