/**
 * @file BrokerLink.hpp
 * @author Mikhail Kalina (apollo.mk58@gmail.com)
 * @brief Serial commands access to the command broker
 * @version 0.1
 * @date 2025-06-02
 *
 * @copyright Copyright (c) 2025
 *
 */

#pragma once

#include <stddef.h>
#include <stdint.h>

#include "Broker/Client.hpp"
#include "Broker/CommandStore.hpp"
#include "Broker/Config.hpp"

#include "SerialCommands.hpp"

namespace Serials
{
    namespace BrokerLink
    {
        // Response to a read verb whose hardware access failed
        constexpr const char *errorString = "ERROR";

        /**
         * @brief Get broker verb of the serial command
         *
         * @param[in] commandId Command identifier
         * @param[out] verb Broker verb
         * @return true if command is a broker verb, false otherwise
         */
        bool toVerb(CommandId commandId, Broker::Verb &verb);

        /**
         * @brief Handle read verb command: submit the command and wait for the result.
         * Response is the value as "0xNN", ERROR, or the status name (TIMEOUT, EXPIRED, FULL)
         *
         * @param[in] client Broker client
         * @param[in] commandId Command identifier
         * @param[in] args Arguments string "<board>,<index>"
         * @param[out] response Response buffer
         * @param[in] size Size of response buffer
         * @return true if command is handled, false if it is malformed
         */
        bool readVerb(Broker::Client &client, CommandId commandId, const char *args, char *response, size_t size);

        /**
         * @brief Handle write verb command: submit the command without waiting.
         * Response is the decimal token or FULL
         *
         * @param[in] client Broker client
         * @param[in] commandId Command identifier
         * @param[in] args Arguments string "<board>,<index>"
         * @param[out] response Response buffer
         * @param[in] size Size of response buffer
         * @return true if command is handled, false if it is malformed
         */
        bool writeVerb(Broker::Client &client, CommandId commandId, const char *args, char *response, size_t size);

        /**
         * @brief Handle result command: single poll of the result by the decimal token.
         * Response is the value as "0xNN", ERROR, NOTREADY or EXPIRED
         *
         * @param[in] client Broker client
         * @param[in] args Token string
         * @param[out] response Response buffer
         * @param[in] size Size of response buffer
         * @return true if command is handled, false if it is malformed
         */
        bool readResult(Broker::Client &client, const char *args, char *response, size_t size);

        /**
         * @brief Format configuration value of the serial command
         *
         * @param[in] config Broker configuration
         * @param[in] commandId Configuration command identifier
         * @param[out] response Response buffer
         * @param[in] size Size of response buffer
         * @return true if command is a configuration command, false otherwise
         */
        bool readConfig(const Broker::Config &config, CommandId commandId, char *response, size_t size);

        /**
         * @brief Parse configuration value of the serial command
         *
         * @param[in,out] config Broker configuration to change
         * @param[in] commandId Configuration command identifier
         * @param[in] data Decimal value, milliseconds
         * @return true if value is valid and set, false otherwise (config isn't changed)
         */
        bool writeConfig(Broker::Config &config, CommandId commandId, const char *data);

        /**
         * @brief Format broker statistics
         *
         * @param[in] statistics Broker statistics
         * @param[out] response Response buffer
         * @param[in] size Size of response buffer
         */
        void formatStatistics(const Broker::Statistics &statistics, char *response, size_t size);

        /**
         * @brief Parse unsigned decimal number, the whole string must be the number
         *
         * @param[in] string Number string
         * @param[out] value Parsed value
         * @return true if number is valid and fits 32 bits, false otherwise
         */
        bool parseDecimal(const char *string, uint32_t &value);
    } // namespace BrokerLink
} // namespace Serials
