#include <gtest/gtest.h>

#include <atomic>
#include <string>
#include <thread>

#include "Serial/MessageParser.hpp"

using namespace Serials;

namespace
{
    constexpr int ownAddress = 5;

    class MessageParserTests : public ::testing::Test
    {
    protected:
        MessageParserTests()
        {
            parser.setSlaveAddress(ownAddress);
        }

        /**
         * @brief Put the string one character per millisecond
         *
         * @return Status of the last character, Failed wins over the later statuses
         */
        MessageParser::Status feed(const std::string &input)
        {
            MessageParser::Status result = MessageParser::Status::Continue;

            for (char inputChar : input)
            {
                MessageParser::Status status = parser.put(inputChar, now++);
                if (result != MessageParser::Status::Failed)
                {
                    result = status;
                }
            }

            return result;
        }

        MessageParser parser;
        uint32_t now = 1000;
    };
} // namespace

// ==================== Complete messages ====================

TEST_F(MessageParserTests, ReadMessageIsComplete)
{
    ASSERT_EQ(feed("!005:GETPIN?20,3\r"), MessageParser::Status::Complete);

    const Message &message = parser.message();
    EXPECT_EQ(message.commandId, CommandId::GetPin);
    EXPECT_EQ(message.accessMask, AccessMask::read);
    EXPECT_FALSE(message.isBroadcast);
    EXPECT_STREQ(message.data, "20,3");
}

TEST_F(MessageParserTests, WriteMessageCarriesData)
{
    ASSERT_EQ(feed("!005:CMDTTL=2000\r"), MessageParser::Status::Complete);

    EXPECT_EQ(parser.message().commandId, CommandId::CommandTtl);
    EXPECT_EQ(parser.message().accessMask, AccessMask::write);
    EXPECT_STREQ(parser.message().data, "2000");
}

TEST_F(MessageParserTests, LongestCommandNameFits)
{
    ASSERT_EQ(feed("!005:GETDIRREG?20,01\r"), MessageParser::Status::Complete);
    EXPECT_EQ(parser.message().commandId, CommandId::GetDirRegister);
}

TEST_F(MessageParserTests, BroadcastIsAccepted)
{
    ASSERT_EQ(feed("!000:ADDR?\r"), MessageParser::Status::Complete);

    EXPECT_TRUE(parser.message().isBroadcast);
    EXPECT_TRUE(parser.isBroadcast());
    EXPECT_EQ(parser.message().commandId, CommandId::SlaveAddress);
    EXPECT_STREQ(parser.message().data, "");
}

TEST_F(MessageParserTests, StartCharacterRestartsMessage)
{
    ASSERT_EQ(feed("!005:GET!005:GETPIN?1\r"), MessageParser::Status::Complete);

    EXPECT_EQ(parser.message().commandId, CommandId::GetPin);
    EXPECT_STREQ(parser.message().data, "1");
}

TEST_F(MessageParserTests, ConsecutiveMessages)
{
    ASSERT_EQ(feed("!005:GETPIN?20,1\r"), MessageParser::Status::Complete);
    ASSERT_EQ(feed("!005:SETPIN=20,2\r"), MessageParser::Status::Complete);

    EXPECT_EQ(parser.message().commandId, CommandId::SetPin);
    EXPECT_STREQ(parser.message().data, "20,2");
}

// ==================== Foreign messages ====================

TEST_F(MessageParserTests, OtherAddressIsIgnored)
{
    EXPECT_EQ(feed("!007:GETPIN?20,3\r"), MessageParser::Status::Continue);
    EXPECT_EQ(feed("!05:GETPIN?20,3\r"), MessageParser::Status::Continue);
    EXPECT_EQ(feed("!0005:GETPIN?20,3\r"), MessageParser::Status::Continue);
    EXPECT_EQ(feed("!0a5:GETPIN?20,3\r"), MessageParser::Status::Continue);
}

TEST_F(MessageParserTests, CharactersOutsideMessageAreIgnored)
{
    EXPECT_EQ(feed("GETPIN?20,3\r\n"), MessageParser::Status::Continue);
    EXPECT_EQ(feed("\n!005:GETPIN?20,3\r"), MessageParser::Status::Complete);
}

TEST_F(MessageParserTests, UnassignedDeviceTakesOnlyBroadcast)
{
    MessageParser unassigned;

    EXPECT_EQ(unassigned.slaveAddress(), MessageParser::invalidAddress);

    MessageParser::Status status = MessageParser::Status::Continue;
    for (char inputChar : std::string("!005:ADDR?\r"))
    {
        status = unassigned.put(inputChar, 0);
        EXPECT_EQ(status, MessageParser::Status::Continue);
    }

    for (char inputChar : std::string("!000:ADDR=12\r"))
    {
        status = unassigned.put(inputChar, 0);
    }
    EXPECT_EQ(status, MessageParser::Status::Complete);
    EXPECT_STREQ(unassigned.message().data, "12");
}

// ==================== Malformed messages ====================

TEST_F(MessageParserTests, UnknownCommandFails)
{
    EXPECT_EQ(feed("!005:BLINK?1\r"), MessageParser::Status::Failed);
}

TEST_F(MessageParserTests, MissingAccessCodeFails)
{
    EXPECT_EQ(feed("!005:GETPIN\r"), MessageParser::Status::Failed);
}

TEST_F(MessageParserTests, DisallowedAccessFails)
{
    EXPECT_EQ(feed("!005:RESULT=1\r"), MessageParser::Status::Failed);
    EXPECT_EQ(feed("!005:FVER=1\r"), MessageParser::Status::Failed);
}

TEST_F(MessageParserTests, TooLongCommandFails)
{
    EXPECT_EQ(feed("!005:GETDIRREGS?1\r"), MessageParser::Status::Failed);
}

TEST_F(MessageParserTests, DataOverflowFails)
{
    std::string data(MessageParser::dataMaxLength, '1');

    ASSERT_EQ(feed("!005:CMDTTL=" + data + "\r"), MessageParser::Status::Complete);
    EXPECT_EQ(feed("!005:CMDTTL=" + data + "1\r"), MessageParser::Status::Failed);
}

TEST_F(MessageParserTests, ParserRecoversAfterFailure)
{
    ASSERT_EQ(feed("!005:BLINK?"), MessageParser::Status::Failed);
    EXPECT_EQ(feed("1\r"), MessageParser::Status::Continue);
    EXPECT_EQ(feed("!005:GETPIN?1\r"), MessageParser::Status::Complete);
}

// ==================== Timeout ====================

TEST_F(MessageParserTests, IncompleteMessageIsDroppedAfterTimeout)
{
    feed("!005:GET");
    now += MessageParser::messageTimeoutMs + 1;

    EXPECT_EQ(feed("PIN?1\r"), MessageParser::Status::Continue);
}

TEST_F(MessageParserTests, SlowMessageWithinTimeoutCompletes)
{
    MessageParser::Status status = MessageParser::Status::Continue;

    for (char inputChar : std::string("!005:GETPIN?1\r"))
    {
        status = parser.put(inputChar, now);
        now += MessageParser::messageTimeoutMs;
    }

    EXPECT_EQ(status, MessageParser::Status::Complete);
}

TEST_F(MessageParserTests, CheckTimeoutDropsIdleMessage)
{
    feed("!005:GETPIN?1");
    parser.checkTimeout(now + MessageParser::messageTimeoutMs + 1);

    EXPECT_EQ(parser.put('\r', now + MessageParser::messageTimeoutMs + 2), MessageParser::Status::Continue);
}

TEST_F(MessageParserTests, TimeoutSurvivesClockWrap)
{
    now = 0xFFFFFFF0;

    EXPECT_EQ(feed("!005:GETPIN?1\r"), MessageParser::Status::Complete);
}

// ==================== Addresses ====================

TEST_F(MessageParserTests, ValidAddresses)
{
    EXPECT_FALSE(MessageParser::isValidAddress(MessageParser::invalidAddress));
    EXPECT_FALSE(MessageParser::isValidAddress(MessageParser::broadcastAddress));
    EXPECT_TRUE(MessageParser::isValidAddress(1));
    EXPECT_TRUE(MessageParser::isValidAddress(MessageParser::maxAddress));
    EXPECT_FALSE(MessageParser::isValidAddress(MessageParser::maxAddress + 1));
}

TEST_F(MessageParserTests, NewAddressAppliesToNextMessage)
{
    parser.setSlaveAddress(123);

    EXPECT_EQ(feed("!005:GETPIN?1\r"), MessageParser::Status::Continue);
    EXPECT_EQ(feed("!123:GETPIN?1\r"), MessageParser::Status::Complete);
}

TEST_F(MessageParserTests, AddressChangesWhileReceiving)
{
    constexpr int changesCount = 2000;

    std::atomic<bool> done(false);
    std::thread changing(
        [this, &done]()
        {
            for (int idx = 0; idx < changesCount; idx++)
            {
                parser.setSlaveAddress((idx % 2) ? 7 : ownAddress);
            }
            done.store(true);
        });

    uint32_t failed = 0;
    while (done.load() == false)
    {
        if (feed("!005:GETPIN?1\r") == MessageParser::Status::Failed)
        {
            failed++;
        }
    }
    changing.join();

    EXPECT_EQ(failed, 0u);

    parser.setSlaveAddress(ownAddress);
    EXPECT_EQ(feed("!005:GETPIN?1\r"), MessageParser::Status::Complete);
}
