/**
 * @file Dispatcher.hpp
 * @author Mikhail Kalina (apollo.mk58@gmail.com)
 * @brief Single consumer executing broker commands on the expander bus
 * @version 0.1
 * @date 2025-06-02
 *
 * @copyright Copyright (c) 2025
 *
 */

#pragma once

#include <array>
#include <atomic>
#include <functional>
#include <stdint.h>

#include "Expander/BusDriver.hpp"
#include "Expander/Registers.hpp"

#include "Command.hpp"
#include "CommandStore.hpp"
#include "Config.hpp"
#include "Timing.hpp"

namespace Broker
{
    /**
     * @brief Known state of one board
     */
    struct BoardState
    {
        uint8_t address;                                         // 7-bit board address
        bool present;                                            // Board answers on the bus
        std::array<uint8_t, Expander::halfCount> direction;      // Direction register halves
    };

    /**
     * @brief Handler notified when the direction state of a board changes
     */
    using DirectionHandler = std::function<void(const BoardState &)>;

    /**
     * @brief The only component touching the bus.
     * Drains the command store in order and executes one command at a time.
     */
    class Dispatcher
    {
    public:
        Dispatcher(CommandStore &store, Expander::BusDriver &bus, const Config &config, const Timing &timing);

        /**
         * @brief Set handler of direction changes
         *
         * @param handler Handler, may be empty
         */
        void setDirectionHandler(DirectionHandler handler);

        /**
         * @brief Execute the next live command if there is one and publish its result
         *
         * @return true if a command was executed, false if the queue was empty
         */
        bool process();

        /**
         * @brief Dispatch loop, sleeps the idle interval while the queue is empty
         *
         * @param running Loop runs while the flag is set
         */
        void run(const std::atomic<bool> &running);

        /**
         * @brief Execute one command on the bus
         *
         * @param command Command to execute
         * @return Result value, failure value of the verb if command failed
         */
        int16_t execute(const Command &command);

        /**
         * @brief Write direction registers of a board and verify them by reading back
         * @warning Must not be called while the dispatch loop is running
         *
         * @param address 7-bit board address
         * @param direction Direction register halves
         * @return true if board is initialised and holds the directions, false otherwise
         */
        bool restoreDirections(uint8_t address, const std::array<uint8_t, Expander::halfCount> &direction);

        /**
         * @brief Forget initialisation state of all boards
         */
        void reset();

    private:
        /**
         * @brief Cached state of one board
         */
        struct BoardCache
        {
            bool initialized;                                    // IOCON is written
            std::array<uint8_t, Expander::halfCount> direction;  // Last known direction registers
        };

        bool probe(uint8_t address);
        bool readRegister(uint8_t address, Expander::Register reg, uint8_t &value);
        bool writeRegister(uint8_t address, Expander::Register reg, uint8_t value);

        /**
         * @brief Check duration of a finished bus transaction
         *
         * @param startedAt Transaction start time
         * @return true if transaction finished in time, false otherwise
         */
        bool isInTime(uint32_t startedAt);

        /**
         * @brief Initialise the board on its first use
         *
         * @param address 7-bit board address
         * @return true if board is initialised, false otherwise
         */
        bool prepareBoard(uint8_t address);

        /**
         * @brief Mark the board lost after a failed transaction and notify the handler
         *
         * @param address 7-bit board address
         */
        void loseBoard(uint8_t address);

        /**
         * @brief Notify the handler about board state
         *
         * @param address 7-bit board address
         */
        void notify(uint8_t address);

        bool identify(const Command &command);
        bool readBit(const Command &command, Expander::RegisterType type, int16_t &value);
        bool readHalf(const Command &command, Expander::RegisterType type, int16_t &value);
        bool writeDirection(const Command &command, bool input);
        bool isOutput(const Command &command, bool &output);
        bool writeLatch(const Command &command, bool high);
        bool toggle(const Command &command);

        CommandStore &_store;          // Shared command store
        Expander::BusDriver &_bus;     // Exclusively owned bus
        const Config &_config;         // Timing parameters
        const Timing &_timing;         // Time source

        DirectionHandler _directionHandler;                        // Direction change handler
        std::array<BoardCache, Expander::boardCount> _boards = {}; // Per board cache
    };
} // namespace Broker
