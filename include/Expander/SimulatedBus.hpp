#pragma once

#include <array>
#include <stdint.h>

#include "BusDriver.hpp"

namespace Expander
{
/**
 * @brief Simulated bus with a bank of MCP23017 chips held in memory
 * Used for bench runs without hardware and by unit tests
 */
class SimulatedBus : public BusDriver
{
    static constexpr size_t registerCount = static_cast<size_t>(Register::Count);

public:
    /**
     * @brief Construct a new Simulated Bus object, no chips are attached
     */
    SimulatedBus()
    {
        _present.fill(false);
        _inputLevels.fill(0);

        for (auto &registers : _registers)
        {
            reset(registers);
        }
    }

    /**
     * @brief Attach or detach a chip at the address
     *
     * @param address 7-bit chip address
     * @param present true - chip answers, false - chip is missing
     */
    void setPresent(uint8_t address, bool present)
    {
        if (isValidBoard(address))
        {
            _present[boardSlot(address)] = present;

            // Power-on state after attaching
            reset(_registers[boardSlot(address)]);
        }
    }

    /**
     * @brief Set external logic levels applied to the pins of a chip
     *
     * @param address 7-bit chip address
     * @param levels Levels of the 16 pins, bit n is pin n
     */
    void setInputLevels(uint8_t address, uint16_t levels)
    {
        if (isValidBoard(address))
        {
            _inputLevels[boardSlot(address)] = levels;
        }
    }

    /**
     * @brief Peek register value without a bus transaction
     *
     * @param address 7-bit chip address
     * @param reg Register to peek
     * @return Register value, 0 for unknown chip
     */
    uint8_t peek(uint8_t address, Register reg) const
    {
        if (isValidBoard(address) == false)
        {
            return 0;
        }

        return _registers[boardSlot(address)][static_cast<size_t>(reg)];
    }

    virtual const char *getInfo() override
    {
        return "MCP23017-SIMULATED";
    }

    // Transactions of the simulated bus never hang
    virtual void setTimeout(uint32_t timeoutMs) override
    {
        (void)timeoutMs;
    }

    virtual bool probe(uint8_t address) override
    {
        return isAttached(address);
    }

    virtual bool readRegister(uint8_t address, Register reg, uint8_t &value) override
    {
        if (isAttached(address) == false || reg >= Register::Count)
        {
            return false;
        }

        auto &registers = _registers[boardSlot(address)];

        if (reg == Register::GpioA || reg == Register::GpioB)
        {
            // Output pins reflect the latch, input pins the external level
            Half half = (reg == Register::GpioA) ? Half::A : Half::B;
            uint8_t direction = registers[static_cast<size_t>(registerOf(RegisterType::Direction, half))];
            uint8_t latch = registers[static_cast<size_t>(registerOf(RegisterType::Latch, half))];
            uint8_t levels = split(_inputLevels[boardSlot(address)], half);

            value = (latch & ~direction) | (levels & direction);
        }
        else
        {
            value = registers[static_cast<size_t>(reg)];
        }

        return true;
    }

    virtual bool writeRegister(uint8_t address, Register reg, uint8_t value) override
    {
        if (isAttached(address) == false || reg >= Register::Count)
        {
            return false;
        }

        auto &registers = _registers[boardSlot(address)];

        // Writing the port modifies the output latch
        if (reg == Register::GpioA)
        {
            reg = Register::OLatA;
        }
        else if (reg == Register::GpioB)
        {
            reg = Register::OLatB;
        }

        registers[static_cast<size_t>(reg)] = value;

        return true;
    }

private:
    bool isAttached(uint8_t address) const
    {
        return isValidBoard(address) && _present[boardSlot(address)];
    }

    static void reset(std::array<uint8_t, registerCount> &registers)
    {
        registers.fill(0);
        registers[static_cast<size_t>(Register::IoDirA)] = directionResetValue;
        registers[static_cast<size_t>(Register::IoDirB)] = directionResetValue;
    }

    std::array<bool, boardCount> _present;                                    // Attached chips
    std::array<uint16_t, boardCount> _inputLevels;                            // External pin levels
    std::array<std::array<uint8_t, registerCount>, boardCount> _registers;    // Register files
};
} // namespace Expander
