#include <gtest/gtest.h>

#include <vector>

#include "Broker/CommandStore.hpp"
#include "Broker/Config.hpp"
#include "Broker/Dispatcher.hpp"

#include "FakeTiming.hpp"
#include "RecordingBus.hpp"

using namespace Broker;
using namespace Expander;

namespace
{
    constexpr uint8_t board = 0x20;
    constexpr uint8_t missingBoard = 0x21;

    class DispatcherTests : public ::testing::Test
    {
    protected:
        DispatcherTests()
            : timing(clock.timing()),
              store(timing.millis),
              dispatcher(store, bus, config, timing)
        {
            clock.set(5000);
            bus.setPresent(board, true);
        }

        /**
         * @brief Queue one command, let the dispatcher execute it and pick up the result
         */
        int16_t run(Verb verb, uint8_t address, uint8_t index = 0)
        {
            Token token;
            EXPECT_EQ(store.enqueue(verb, address, index, config.commandTtlMs, token), EnqueueStatus::Queued);
            EXPECT_TRUE(dispatcher.process());

            PendingResult result = {};
            EXPECT_EQ(store.fetchResult(token, result), FetchStatus::Ready);

            return result.value;
        }

        Tests::FakeClock clock;
        Config config;
        Timing timing;
        Tests::RecordingBus bus;
        CommandStore store;
        Dispatcher dispatcher;
    };
} // namespace

// ==================== Identify ====================

TEST_F(DispatcherTests, IdentifyPresentBoardWritesControlRegister)
{
    EXPECT_EQ(run(Verb::Identify, board), 1);
    EXPECT_EQ(bus.peek(board, Register::IoCon), controlValue);
}

TEST_F(DispatcherTests, IdentifyMissingBoard)
{
    EXPECT_EQ(run(Verb::Identify, missingBoard), 0);
}

TEST_F(DispatcherTests, EmptyQueue)
{
    EXPECT_FALSE(dispatcher.process());
}

// ==================== Pins ====================

TEST_F(DispatcherTests, DriveOutputPinHighAndLow)
{
    EXPECT_EQ(run(Verb::ClearDirBit, board, 3), 1);
    EXPECT_EQ(run(Verb::SetPin, board, 3), 1);
    EXPECT_EQ(bus.peek(board, Register::OLatA), 0x08);
    EXPECT_EQ(run(Verb::GetPin, board, 3), 1);

    EXPECT_EQ(run(Verb::ClearPin, board, 3), 1);
    EXPECT_EQ(bus.peek(board, Register::OLatA), 0x00);
    EXPECT_EQ(run(Verb::GetPin, board, 3), 0);
}

TEST_F(DispatcherTests, ReadInputPinLevel)
{
    bus.setInputLevels(board, 1 << 12);

    EXPECT_EQ(run(Verb::GetPin, board, 12), 1);
    EXPECT_EQ(run(Verb::GetPin, board, 11), 0);
    EXPECT_EQ(run(Verb::GetIoRegister, board, 1), 0x10);
}

TEST_F(DispatcherTests, InputPinIsNotDriven)
{
    EXPECT_EQ(run(Verb::SetPin, board, 5), 0);
    EXPECT_EQ(bus.peek(board, Register::OLatA), 0x00);

    EXPECT_EQ(run(Verb::TogglePin, board, 5), 0);
}

TEST_F(DispatcherTests, DirectionOfPinOnHalfB)
{
    EXPECT_EQ(run(Verb::ClearDirBit, board, 10), 1);
    EXPECT_EQ(run(Verb::GetDirRegister, board, 1), 0xFB);
    EXPECT_EQ(run(Verb::GetDirBit, board, 10), 0);
    EXPECT_EQ(run(Verb::GetDirRegister, board, 0), 0xFF);

    EXPECT_EQ(run(Verb::SetDirBit, board, 10), 1);
    int16_t direction = run(Verb::GetDirRegister, board, 1);
    EXPECT_EQ(direction & 0x04, 0x04);
    EXPECT_EQ(run(Verb::GetDirBit, board, 10), 1);
}

TEST_F(DispatcherTests, TogglePulsesAndRestoresLatch)
{
    ASSERT_EQ(run(Verb::ClearDirBit, board, 4), 1);

    uint32_t writes = bus.writes.load();
    uint32_t startedAt = clock.now();

    EXPECT_EQ(run(Verb::TogglePin, board, 4), 1);

    EXPECT_EQ(bus.writes.load() - writes, 2u);
    EXPECT_GE(clock.now() - startedAt, config.toggleDelayMs);
    EXPECT_EQ(bus.peek(board, Register::OLatA), 0x00);
}

// ==================== Failures ====================

TEST_F(DispatcherTests, InvalidAddressDoesNotTouchTheBus)
{
    EXPECT_EQ(run(Verb::GetPin, 0x30, 1), errorValue);
    EXPECT_EQ(run(Verb::SetPin, board, 16), 0);
    EXPECT_EQ(run(Verb::GetIoRegister, board, 2), errorValue);

    EXPECT_EQ(bus.reads.load(), 0u);
    EXPECT_EQ(bus.writes.load(), 0u);
}

TEST_F(DispatcherTests, ReadFromMissingBoardFails)
{
    EXPECT_EQ(run(Verb::GetPin, missingBoard, 0), errorValue);
    EXPECT_EQ(run(Verb::GetDirRegister, missingBoard, 0), errorValue);
}

TEST_F(DispatcherTests, SlowTransactionFailsTheCommand)
{
    bus.onTransaction = [this]()
    {
        clock.advance(config.busDeadlineMs + 1);
    };

    EXPECT_EQ(run(Verb::GetPin, board, 0), errorValue);
    EXPECT_EQ(run(Verb::Identify, board), 0);
}

TEST_F(DispatcherTests, ReattachedBoardIsInitialisedAgain)
{
    ASSERT_EQ(run(Verb::Identify, board), 1);

    bus.setPresent(board, false);
    EXPECT_EQ(run(Verb::GetPin, board, 0), errorValue);

    bus.setPresent(board, true);
    ASSERT_EQ(bus.peek(board, Register::IoCon), 0x00);

    EXPECT_EQ(run(Verb::Identify, board), 1);
    EXPECT_EQ(bus.peek(board, Register::IoCon), controlValue);
}

// ==================== Expiry ====================

TEST_F(DispatcherTests, ExpiredCommandsAreNotExecuted)
{
    Token tokens[5];
    for (auto &token : tokens)
    {
        ASSERT_EQ(store.enqueue(Verb::ClearPin, board, 0, config.commandTtlMs, token), EnqueueStatus::Queued);
    }

    clock.advance(2000);

    EXPECT_FALSE(dispatcher.process());
    EXPECT_EQ(bus.writes.load(), 0u);
    EXPECT_EQ(bus.reads.load(), 0u);

    PendingResult result;
    for (auto token : tokens)
    {
        EXPECT_EQ(store.fetchResult(token, result), FetchStatus::Expired);
    }

    // Fresh work is served as usual
    EXPECT_EQ(run(Verb::Identify, board), 1);
}

// ==================== Directions ====================

TEST_F(DispatcherTests, DirectionChangesAreReported)
{
    std::vector<BoardState> states;
    dispatcher.setDirectionHandler(
        [&states](const BoardState &state)
        {
            states.push_back(state);
        });

    ASSERT_EQ(run(Verb::ClearDirBit, board, 2), 1);
    ASSERT_EQ(states.size(), 1u);
    EXPECT_EQ(states[0].address, board);
    EXPECT_TRUE(states[0].present);
    EXPECT_EQ(states[0].direction[0], 0xFB);
    EXPECT_EQ(states[0].direction[1], 0xFF);

    // Same direction again, nothing changes
    ASSERT_EQ(run(Verb::ClearDirBit, board, 2), 1);
    EXPECT_EQ(states.size(), 1u);

    bus.setPresent(board, false);
    EXPECT_EQ(run(Verb::GetPin, board, 2), errorValue);
    ASSERT_EQ(states.size(), 2u);
    EXPECT_FALSE(states[1].present);
}

TEST_F(DispatcherTests, RestoreDirections)
{
    EXPECT_TRUE(dispatcher.restoreDirections(board, {0x0F, 0xF0}));
    EXPECT_EQ(bus.peek(board, Register::IoDirA), 0x0F);
    EXPECT_EQ(bus.peek(board, Register::IoDirB), 0xF0);
    EXPECT_EQ(bus.peek(board, Register::IoCon), controlValue);

    EXPECT_EQ(run(Verb::GetDirRegister, board, 1), 0xF0);
    EXPECT_EQ(run(Verb::SetPin, board, 4), 1);

    EXPECT_FALSE(dispatcher.restoreDirections(missingBoard, {0x00, 0x00}));
    EXPECT_FALSE(dispatcher.restoreDirections(0x50, {0x00, 0x00}));
}
