#include <gtest/gtest.h>

#include <stdlib.h>
#include <string>

#include "Broker/Client.hpp"
#include "Broker/Context.hpp"
#include "Expander/SimulatedBus.hpp"
#include "Serial/BrokerLink.hpp"

using namespace Serials;

namespace
{
    constexpr size_t responseSize = 64;

    class BrokerLinkTests : public ::testing::Test
    {
    protected:
        BrokerLinkTests()
            : context(bus, Broker::Config(), Broker::systemTiming()),
              client(context)
        {
            bus.setPresent(0x20, true);
        }

        std::string read(CommandId commandId, const char *args)
        {
            char response[responseSize] = {0};
            EXPECT_TRUE(BrokerLink::readVerb(client, commandId, args, response, sizeof(response)));
            return response;
        }

        Expander::SimulatedBus bus;
        Broker::Context context;
        Broker::Client client;
    };
} // namespace

// ==================== Verbs ====================

TEST_F(BrokerLinkTests, CommandsMapToVerbs)
{
    Broker::Verb verb;

    ASSERT_TRUE(BrokerLink::toVerb(CommandId::TogglePin, verb));
    EXPECT_EQ(verb, Broker::Verb::TogglePin);
    ASSERT_TRUE(BrokerLink::toVerb(CommandId::GetDirRegister, verb));
    EXPECT_EQ(verb, Broker::Verb::GetDirRegister);

    EXPECT_FALSE(BrokerLink::toVerb(CommandId::Result, verb));
    EXPECT_FALSE(BrokerLink::toVerb(CommandId::FwVersion, verb));
}

TEST_F(BrokerLinkTests, ReadVerbWaitsForTheValue)
{
    ASSERT_TRUE(context.start());

    EXPECT_EQ(read(CommandId::Identify, "20"), "0x01");
    EXPECT_EQ(read(CommandId::GetDirRegister, "20,01"), "0xFF");
    EXPECT_EQ(read(CommandId::Identify, "0x25"), "0x00");
    EXPECT_EQ(read(CommandId::GetPin, "25,03"), BrokerLink::errorString);
}

TEST_F(BrokerLinkTests, ReadVerbRejectsMalformedArguments)
{
    char response[responseSize] = {0};

    EXPECT_FALSE(BrokerLink::readVerb(client, CommandId::GetPin, "20", response, sizeof(response)));
    EXPECT_FALSE(BrokerLink::readVerb(client, CommandId::GetPin, "zz,01", response, sizeof(response)));
    EXPECT_FALSE(BrokerLink::readVerb(client, CommandId::Result, "20,01", response, sizeof(response)));
}

TEST_F(BrokerLinkTests, ReadVerbReportsTimeout)
{
    Broker::Config config;
    config.waitTimeoutMs = 20;
    ASSERT_TRUE(context.configure(config));

    EXPECT_EQ(read(CommandId::Identify, "20"), "TIMEOUT");
}

TEST_F(BrokerLinkTests, WriteVerbRepliesTokenAndResultIsFetched)
{
    char response[responseSize] = {0};
    ASSERT_TRUE(BrokerLink::writeVerb(client, CommandId::GetIoRegister, "20,00", response, sizeof(response)));

    std::string token = response;
    EXPECT_NE(strtoul(token.c_str(), nullptr, 10), 0u);

    ASSERT_TRUE(BrokerLink::readResult(client, token.c_str(), response, sizeof(response)));
    EXPECT_STREQ(response, "NOTREADY");

    ASSERT_TRUE(context.start());

    int16_t value;
    ASSERT_EQ(client.submitAndWait(Broker::Verb::Identify, 0x20, 0, 1000, value), Broker::Status::Ok);

    ASSERT_TRUE(BrokerLink::readResult(client, token.c_str(), response, sizeof(response)));
    EXPECT_STREQ(response, "0x00");
}

TEST_F(BrokerLinkTests, ResultTokenMustBeDecimal)
{
    char response[responseSize] = {0};

    EXPECT_FALSE(BrokerLink::readResult(client, "0", response, sizeof(response)));
    EXPECT_FALSE(BrokerLink::readResult(client, "-1", response, sizeof(response)));
    EXPECT_FALSE(BrokerLink::readResult(client, "12a", response, sizeof(response)));
    EXPECT_FALSE(BrokerLink::readResult(client, "", response, sizeof(response)));
}

TEST_F(BrokerLinkTests, WriteVerbReportsFullQueue)
{
    char response[responseSize] = {0};

    for (size_t idx = 0; idx < Broker::queueCapacity; idx++)
    {
        ASSERT_TRUE(BrokerLink::writeVerb(client, CommandId::Identify, "20", response, sizeof(response)));
    }

    ASSERT_TRUE(BrokerLink::writeVerb(client, CommandId::Identify, "20", response, sizeof(response)));
    EXPECT_STREQ(response, "FULL");
}

// ==================== Configuration ====================

TEST_F(BrokerLinkTests, ConfigurationValues)
{
    Broker::Config config;
    char response[responseSize] = {0};

    ASSERT_TRUE(BrokerLink::readConfig(config, CommandId::CommandTtl, response, sizeof(response)));
    EXPECT_STREQ(response, "1500");

    ASSERT_TRUE(BrokerLink::writeConfig(config, CommandId::ToggleDelay, "250"));
    EXPECT_EQ(config.toggleDelayMs, 250u);

    ASSERT_TRUE(BrokerLink::readConfig(config, CommandId::ToggleDelay, response, sizeof(response)));
    EXPECT_STREQ(response, "250");

    EXPECT_FALSE(BrokerLink::readConfig(config, CommandId::LogLevel, response, sizeof(response)));
}

TEST_F(BrokerLinkTests, OutOfRangeConfigurationIsRejected)
{
    Broker::Config config;

    EXPECT_FALSE(BrokerLink::writeConfig(config, CommandId::PollInterval, "0"));
    EXPECT_FALSE(BrokerLink::writeConfig(config, CommandId::CommandTtl, "999999"));
    EXPECT_FALSE(BrokerLink::writeConfig(config, CommandId::CommandTtl, "fast"));
    EXPECT_FALSE(BrokerLink::writeConfig(config, CommandId::FwVersion, "1"));

    EXPECT_EQ(config.pollIntervalMs, 10u);
    EXPECT_EQ(config.commandTtlMs, 1500u);
}

TEST_F(BrokerLinkTests, StatisticsFormat)
{
    Broker::Statistics statistics = {
        .submitted = 7, .rejected = 1, .expired = 2, .delivered = 5, .published = 5, .unread = 0};
    char response[responseSize] = {0};

    BrokerLink::formatStatistics(statistics, response, sizeof(response));

    EXPECT_STREQ(response, "SUB 7 REJ 1 EXP 2 DLV 5 PUB 5 UNR 0");
}

TEST_F(BrokerLinkTests, DecimalNumbersAreRangeChecked)
{
    uint32_t value = 0;

    ASSERT_TRUE(BrokerLink::parseDecimal("259", value));
    EXPECT_EQ(value, 259u);
    ASSERT_TRUE(BrokerLink::parseDecimal("4294967295", value));
    EXPECT_EQ(value, 4294967295u);

    value = 7;
    EXPECT_FALSE(BrokerLink::parseDecimal("4294967296", value));
    EXPECT_FALSE(BrokerLink::parseDecimal("99999999999999999999999", value));
    EXPECT_FALSE(BrokerLink::parseDecimal("-1", value));
    EXPECT_FALSE(BrokerLink::parseDecimal("3x", value));
    EXPECT_FALSE(BrokerLink::parseDecimal("", value));
    EXPECT_FALSE(BrokerLink::parseDecimal(nullptr, value));
    EXPECT_EQ(value, 7u);
}
