#include <gtest/gtest.h>

#include "Expander/Registers.hpp"

using namespace Expander;

// ==================== Addresses ====================

TEST(RegistersTests, BoardAddressRange)
{
    EXPECT_FALSE(isValidBoard(0x1F));
    EXPECT_TRUE(isValidBoard(0x20));
    EXPECT_TRUE(isValidBoard(0x27));
    EXPECT_FALSE(isValidBoard(0x28));

    EXPECT_EQ(boardSlot(0x20), 0u);
    EXPECT_EQ(boardSlot(0x27), 7u);
}

TEST(RegistersTests, PinAndHalfRange)
{
    EXPECT_TRUE(isValidPin(0));
    EXPECT_TRUE(isValidPin(15));
    EXPECT_FALSE(isValidPin(16));

    EXPECT_TRUE(isValidHalf(0));
    EXPECT_TRUE(isValidHalf(1));
    EXPECT_FALSE(isValidHalf(2));
}

// ==================== Pin mapping ====================

TEST(RegistersTests, PinsOfHalfA)
{
    EXPECT_EQ(pinHalf(0), Half::A);
    EXPECT_EQ(pinMask(0), 0x01);
    EXPECT_EQ(pinHalf(7), Half::A);
    EXPECT_EQ(pinMask(7), 0x80);
}

TEST(RegistersTests, PinsOfHalfB)
{
    EXPECT_EQ(pinHalf(8), Half::B);
    EXPECT_EQ(pinMask(8), 0x01);
    EXPECT_EQ(pinHalf(10), Half::B);
    EXPECT_EQ(pinMask(10), 0x04);
    EXPECT_EQ(pinHalf(15), Half::B);
    EXPECT_EQ(pinMask(15), 0x80);
}

TEST(RegistersTests, LogicalRegisters)
{
    EXPECT_EQ(registerOf(RegisterType::Direction, Half::A), Register::IoDirA);
    EXPECT_EQ(registerOf(RegisterType::Direction, Half::B), Register::IoDirB);
    EXPECT_EQ(registerOf(RegisterType::State, Half::A), Register::GpioA);
    EXPECT_EQ(registerOf(RegisterType::State, Half::B), Register::GpioB);
    EXPECT_EQ(registerOf(RegisterType::Latch, Half::A), Register::OLatA);
    EXPECT_EQ(registerOf(RegisterType::Latch, Half::B), Register::OLatB);

    EXPECT_EQ(static_cast<uint8_t>(Register::IoCon), 0x0A);
}

TEST(RegistersTests, CombineAndSplit)
{
    uint16_t value = combine(0x34, 0x12);

    EXPECT_EQ(value, 0x1234);
    EXPECT_EQ(split(value, Half::A), 0x34);
    EXPECT_EQ(split(value, Half::B), 0x12);
}
