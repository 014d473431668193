#pragma once

#include <atomic>
#include <functional>
#include <stdint.h>

#include "Expander/SimulatedBus.hpp"

namespace Tests
{
    /**
     * @brief Simulated bus counting transactions and checking that they never overlap
     */
    class RecordingBus : public Expander::SimulatedBus
    {
    public:
        // Called inside every transaction, e.g. to let the clock run
        std::function<void()> onTransaction;

        virtual bool probe(uint8_t address) override
        {
            Guard guard(*this);
            return SimulatedBus::probe(address);
        }

        virtual bool readRegister(uint8_t address, Expander::Register reg, uint8_t &value) override
        {
            Guard guard(*this);
            reads++;
            return SimulatedBus::readRegister(address, reg, value);
        }

        virtual bool writeRegister(uint8_t address, Expander::Register reg, uint8_t value) override
        {
            Guard guard(*this);
            writes++;
            return SimulatedBus::writeRegister(address, reg, value);
        }

        std::atomic<uint32_t> reads{0};       // Register reads
        std::atomic<uint32_t> writes{0};      // Register writes
        std::atomic<uint32_t> overlaps{0};    // Transactions started while another one was running

    private:
        /**
         * @brief Marks one transaction in flight for its scope
         */
        class Guard
        {
        public:
            explicit Guard(RecordingBus &bus)
                : _bus(bus)
            {
                if (_bus._inFlight.fetch_add(1) != 0)
                {
                    _bus.overlaps++;
                }

                if (_bus.onTransaction)
                {
                    _bus.onTransaction();
                }
            }

            ~Guard()
            {
                _bus._inFlight.fetch_sub(1);
            }

        private:
            RecordingBus &_bus;
        };

        std::atomic<uint32_t> _inFlight{0}; // Transactions in flight
    };
} // namespace Tests
