/**
 * @file Context.hpp
 * @author Mikhail Kalina (apollo.mk58@gmail.com)
 * @brief Command broker state and lifecycle
 * @version 0.1
 * @date 2025-06-02
 *
 * @copyright Copyright (c) 2025
 *
 */

#pragma once

#include <array>
#include <atomic>
#include <mutex>
#include <stdint.h>
#include <thread>

#include "Expander/BusDriver.hpp"

#include "CommandStore.hpp"
#include "Config.hpp"
#include "Dispatcher.hpp"
#include "Timing.hpp"

namespace Broker
{
    /**
     * @brief Broker instance: configuration, shared store and the dispatcher thread owning the bus
     */
    class Context
    {
    public:
        Context(Expander::BusDriver &bus, const Config &config, const Timing &timing);
        ~Context();

        Context(const Context &) = delete;
        Context &operator=(const Context &) = delete;

        /**
         * @brief Start the dispatcher thread
         *
         * @return true if dispatcher is started, false if it is already running
         */
        bool start();

        /**
         * @brief Stop the dispatcher thread and wait for it, the command in flight completes.
         * Queued commands and results are discarded.
         */
        void stop();

        bool isRunning() const;

        /**
         * @brief Replace the configuration
         *
         * @param config New configuration, sanitized before it is applied
         * @return true if configuration is applied, false if the broker is running
         */
        bool configure(const Config &config);

        /**
         * @brief Restore persisted directions of a board
         *
         * @param address 7-bit board address
         * @param direction Direction register halves
         * @return true if directions are restored, false if board failed or the broker is running
         */
        bool restoreDirections(uint8_t address, const std::array<uint8_t, Expander::halfCount> &direction);

        /**
         * @brief Set handler of board direction changes, called from the dispatcher thread
         * @warning Must be set before the broker starts
         *
         * @param handler Direction change handler
         */
        void setDirectionHandler(DirectionHandler handler);

        /**
         * @brief Get a copy of the applied configuration, safe while another thread configures
         *
         * @return Configuration snapshot
         */
        Config config() const;

        const Timing &timing() const
        {
            return _timing;
        }

        CommandStore &store()
        {
            return _store;
        }

    private:
        Config _config;                  // Applied configuration
        Timing _timing;                  // Time source
        CommandStore _store;             // Shared command store
        Dispatcher _dispatcher;          // Bus owner

        std::mutex _lifecycleMutex;      // Serializes start, stop and configure
        mutable std::mutex _configMutex; // Guards _config against client snapshots
        std::atomic<bool> _running;      // Dispatcher loop flag
        std::thread _thread;             // Dispatcher thread
    };
} // namespace Broker
