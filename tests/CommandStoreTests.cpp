#include <gtest/gtest.h>

#include <set>

#include "Broker/CommandStore.hpp"

#include "FakeTiming.hpp"

using namespace Broker;

namespace
{
    constexpr uint32_t commandTtl = 1500;
    constexpr uint32_t resultTtl = 3000;
    constexpr size_t capacity = 4;

    class CommandStoreTests : public ::testing::Test
    {
    protected:
        CommandStoreTests()
            : store(clock.timing().millis, capacity)
        {
            clock.set(1000);
        }

        Token submit(Verb verb = Verb::GetPin, uint8_t index = 0)
        {
            Token token = invalidToken;
            EXPECT_EQ(store.enqueue(verb, 0x20, index, commandTtl, token), EnqueueStatus::Queued);
            return token;
        }

        Tests::FakeClock clock;
        CommandStore store;
    };
} // namespace

// ==================== Queue ====================

TEST_F(CommandStoreTests, TokensAreUniqueAndNonZero)
{
    std::set<Token> tokens;

    for (size_t idx = 0; idx < capacity; idx++)
    {
        Token token = submit();
        EXPECT_NE(token, invalidToken);
        tokens.insert(token);
    }

    EXPECT_EQ(tokens.size(), capacity);
}

TEST_F(CommandStoreTests, CommandsAreDeliveredInSubmissionOrder)
{
    Token first = submit(Verb::SetPin, 1);
    Token second = submit(Verb::ClearPin, 2);
    Token third = submit(Verb::GetPin, 3);

    Command command;
    ASSERT_TRUE(store.dequeueNext(command));
    EXPECT_EQ(command.token, first);
    EXPECT_EQ(command.verb, Verb::SetPin);
    EXPECT_EQ(command.index, 1);

    ASSERT_TRUE(store.dequeueNext(command));
    EXPECT_EQ(command.token, second);

    ASSERT_TRUE(store.dequeueNext(command));
    EXPECT_EQ(command.token, third);

    EXPECT_FALSE(store.dequeueNext(command));
}

TEST_F(CommandStoreTests, FullQueueRejects)
{
    for (size_t idx = 0; idx < capacity; idx++)
    {
        submit();
    }

    Token token = invalidToken;
    EXPECT_EQ(store.enqueue(Verb::GetPin, 0x20, 0, commandTtl, token), EnqueueStatus::QueueFull);
    EXPECT_EQ(token, invalidToken);
    EXPECT_EQ(store.pendingCount(), capacity);
    EXPECT_EQ(store.statistics().rejected, 1u);
}

TEST_F(CommandStoreTests, ExpiredCommandsReleaseCapacity)
{
    for (size_t idx = 0; idx < capacity; idx++)
    {
        submit();
    }

    clock.advance(commandTtl);

    Token token = invalidToken;
    EXPECT_EQ(store.enqueue(Verb::GetPin, 0x20, 0, commandTtl, token), EnqueueStatus::Queued);
    EXPECT_EQ(store.pendingCount(), 1u);
    EXPECT_EQ(store.statistics().expired, capacity);
}

TEST_F(CommandStoreTests, ExpiredCommandIsNeverDelivered)
{
    Token stale = submit(Verb::ClearPin);

    clock.advance(commandTtl - 1);
    Token fresh = submit(Verb::SetPin);

    clock.advance(1);

    Command command;
    ASSERT_TRUE(store.dequeueNext(command));
    EXPECT_EQ(command.token, fresh);
    EXPECT_FALSE(store.dequeueNext(command));

    PendingResult result;
    EXPECT_EQ(store.fetchResult(stale, result), FetchStatus::Expired);
}

TEST_F(CommandStoreTests, AllExpiredMeansEmpty)
{
    for (size_t idx = 0; idx < capacity; idx++)
    {
        submit(Verb::ClearPin);
    }

    clock.advance(2000);

    Command command;
    EXPECT_FALSE(store.dequeueNext(command));

    Statistics statistics = store.statistics();
    EXPECT_EQ(statistics.expired, capacity);
    EXPECT_EQ(statistics.delivered, 0u);
}

TEST_F(CommandStoreTests, ExpiryAcrossClockWrap)
{
    clock.set(UINT32_MAX - 100);
    Token token = submit();

    clock.advance(200);

    Command command;
    ASSERT_TRUE(store.dequeueNext(command));
    EXPECT_EQ(command.token, token);
}

// ==================== Results ====================

TEST_F(CommandStoreTests, UnknownTokenIsNotReady)
{
    PendingResult result;

    EXPECT_EQ(store.fetchResult(12345, result), FetchStatus::NotReady);
}

TEST_F(CommandStoreTests, ResultIsRemovedOnPickup)
{
    Token token = submit();

    Command command;
    ASSERT_TRUE(store.dequeueNext(command));

    PendingResult result;
    EXPECT_EQ(store.fetchResult(token, result), FetchStatus::NotReady);

    store.publishResult(token, 0x5A, resultTtl);

    ASSERT_EQ(store.fetchResult(token, result), FetchStatus::Ready);
    EXPECT_EQ(result.token, token);
    EXPECT_EQ(result.value, 0x5A);

    EXPECT_EQ(store.fetchResult(token, result), FetchStatus::NotReady);
}

TEST_F(CommandStoreTests, UnreadResultExpires)
{
    Token token = submit();

    Command command;
    ASSERT_TRUE(store.dequeueNext(command));
    store.publishResult(token, 1, resultTtl);

    clock.advance(resultTtl);

    PendingResult result;
    EXPECT_EQ(store.fetchResult(token, result), FetchStatus::Expired);
    EXPECT_EQ(store.fetchResult(token, result), FetchStatus::Expired);
    EXPECT_EQ(store.statistics().unread, 1u);
}

TEST_F(CommandStoreTests, OldestResultIsEvictedWhenFull)
{
    Token tokens[capacity + 1];

    for (auto &token : tokens)
    {
        token = submit();

        Command command;
        ASSERT_TRUE(store.dequeueNext(command));
        store.publishResult(token, 1, resultTtl);
    }

    PendingResult result;
    EXPECT_EQ(store.fetchResult(tokens[0], result), FetchStatus::Expired);
    EXPECT_EQ(store.fetchResult(tokens[capacity], result), FetchStatus::Ready);
    EXPECT_EQ(store.statistics().unread, 1u);
}

TEST_F(CommandStoreTests, ClearDiscardsEverything)
{
    Token token = submit();
    submit();

    Command command;
    ASSERT_TRUE(store.dequeueNext(command));
    store.publishResult(token, 1, resultTtl);

    store.clear();

    PendingResult result;
    EXPECT_EQ(store.pendingCount(), 0u);
    EXPECT_FALSE(store.dequeueNext(command));
    EXPECT_EQ(store.fetchResult(token, result), FetchStatus::NotReady);
}

TEST(CommandStoreDefaults, CapacityIsQueueCapacity)
{
    Tests::FakeClock clock;
    CommandStore store(clock.timing().millis);

    Token token;
    for (size_t idx = 0; idx < queueCapacity; idx++)
    {
        ASSERT_EQ(store.enqueue(Verb::Identify, 0x20, 0, commandTtl, token), EnqueueStatus::Queued);
    }

    EXPECT_EQ(store.enqueue(Verb::Identify, 0x20, 0, commandTtl, token), EnqueueStatus::QueueFull);
}
