/**
 * @file Service.hpp
 * @author Mikhail Kalina (apollo.mk58@gmail.com)
 * @brief Firmware broker instance with persisted configuration
 * @version 0.1
 * @date 2025-06-02
 *
 * @copyright Copyright (c) 2025
 *
 */

#pragma once

#include "Expander/BusDriver.hpp"

#include "Client.hpp"
#include "Config.hpp"
#include "Context.hpp"

namespace Broker
{
    namespace Service
    {
        /**
         * @brief Create broker instance with the stored configuration and restore stored board directions
         *
         * @param bus Bus driver exclusively owned by the broker
         */
        void initialize(Expander::BusDriver &bus);

        /**
         * @brief Start the dispatcher thread on its dedicated core
         *
         * @return true if broker is started, false otherwise
         */
        bool start();

        /**
         * @brief Store the new configuration and restart the broker with it.
         * Queued commands and unread results are discarded
         *
         * @param config New configuration
         * @return true if broker is restarted, false otherwise
         */
        bool reconfigure(const Config &config);

        /**
         * @brief Get the applied configuration
         *
         * @return Configuration copy
         */
        Config config();

        /**
         * @brief Get broker client
         *
         * @return Reference to the client facade
         */
        Client &client();

        /**
         * @brief Get broker statistics
         *
         * @return Statistics snapshot
         */
        Statistics statistics();
    } // namespace Service
} // namespace Broker
