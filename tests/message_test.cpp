// tests/message_test.cpp
// Line parsing, serialization and command building.

#include "protocol/CommandBuilder.hpp"
#include "protocol/Message.hpp"
#include "protocol/exceptions/ParseError.h"

#include <gtest/gtest.h>

#include <string>

namespace ircconn::protocol {
namespace {

// ==================== Parsing ====================

TEST(MessageTest, ParsesPrefixedPrivmsg) {
    auto msg = parse(":nick!user@host PRIVMSG #chan :hello world");

    ASSERT_TRUE(msg.prefix.has_value());
    EXPECT_EQ(*msg.prefix, "nick!user@host");
    EXPECT_EQ(msg.command, "PRIVMSG");
    ASSERT_EQ(msg.params.size(), 1u);
    EXPECT_EQ(msg.params[0], "#chan");
    ASSERT_TRUE(msg.trailing.has_value());
    EXPECT_EQ(*msg.trailing, "hello world");
    EXPECT_EQ(msg.nick(), "nick");

    EXPECT_EQ(toLine(msg), ":nick!user@host PRIVMSG #chan :hello world");
    EXPECT_EQ(serialize(msg), ":nick!user@host PRIVMSG #chan :hello world\r\n");
}

TEST(MessageTest, ParsesBareCommand) {
    auto msg = parse("CMD");
    EXPECT_FALSE(msg.prefix.has_value());
    EXPECT_EQ(msg.command, "CMD");
    EXPECT_TRUE(msg.params.empty());
    EXPECT_FALSE(msg.trailing.has_value());
}

TEST(MessageTest, NumericWithMiddleParams) {
    auto msg = parse(":irc.example.net 001 me :Welcome to the network");
    EXPECT_EQ(msg.command, "001");
    ASSERT_EQ(msg.params.size(), 1u);
    EXPECT_EQ(msg.params[0], "me");
    EXPECT_EQ(msg.lastParam(), "Welcome to the network");
    // server prefix carries no '!'
    EXPECT_EQ(msg.nick(), "irc.example.net");
}

TEST(MessageTest, StripsLineTerminator) {
    auto msg = parse("PING :test\r\n");
    EXPECT_EQ(msg.command, "PING");
    ASSERT_TRUE(msg.trailing.has_value());
    EXPECT_EQ(*msg.trailing, "test");
}

TEST(MessageTest, EmptyTrailingIsPreserved) {
    auto msg = parse("PRIVMSG #chan :");
    ASSERT_TRUE(msg.trailing.has_value());
    EXPECT_EQ(*msg.trailing, "");
    EXPECT_EQ(toLine(msg), "PRIVMSG #chan :");
}

TEST(MessageTest, TrailingKeepsColonsAndSpaces) {
    auto msg = parse("PRIVMSG #chan :a : b  c");
    EXPECT_EQ(*msg.trailing, "a : b  c");
}

TEST(MessageTest, RepeatedSpacesBetweenParams) {
    auto msg = parse("MODE  #chan   +o  nick");
    EXPECT_EQ(msg.command, "MODE");
    ASSERT_EQ(msg.params.size(), 3u);
    EXPECT_EQ(msg.params[0], "#chan");
    EXPECT_EQ(msg.params[1], "+o");
    EXPECT_EQ(msg.params[2], "nick");
}

TEST(MessageTest, LastParamWithoutTrailing) {
    auto msg = parse("JOIN #chan");
    EXPECT_EQ(msg.lastParam(), "#chan");
    EXPECT_EQ(parse("QUIT").lastParam(), "");
}

// ==================== Malformed input ====================

TEST(MessageTest, EmptyLineThrows) {
    EXPECT_THROW(parse(""), ircconn::ParseError);
    EXPECT_THROW(parse("\r\n"), ircconn::ParseError);
}

TEST(MessageTest, PrefixWithoutCommandThrows) {
    EXPECT_THROW(parse(":nick!user@host"), ircconn::ParseError);
    EXPECT_THROW(parse(":nick!user@host "), ircconn::ParseError);
}

TEST(MessageTest, TrailingWithoutCommandThrows) {
    EXPECT_THROW(parse(":only.prefix :text"), ircconn::ParseError);
}

TEST(MessageTest, ParseErrorCarriesPrefix) {
    try {
        parse("");
        FAIL() << "expected ParseError";
    } catch (const ircconn::ParseError& e) {
        EXPECT_EQ(std::string(e.what()).rfind("Parse Error: ", 0), 0u);
    }
}

// ==================== CommandBuilder ====================

TEST(CommandBuilderTest, PongEchoesTrailingToken) {
    EXPECT_EQ(CommandBuilder::pong(parse("PING :test")), "PONG :test");
}

TEST(CommandBuilderTest, PongEchoesMiddleToken) {
    EXPECT_EQ(CommandBuilder::pong(parse("PING irc.example.net")), "PONG irc.example.net");
}

TEST(CommandBuilderTest, PongDropsSenderPrefix) {
    EXPECT_EQ(CommandBuilder::pong(parse(":server PING :abc def")), "PONG :abc def");
}

TEST(CommandBuilderTest, RegistrationLines) {
    EXPECT_EQ(CommandBuilder::pass("secret"), "PASS secret");
    EXPECT_EQ(CommandBuilder::nick("me"), "NICK me");
    EXPECT_EQ(CommandBuilder::user("me", "Real Name"), "USER me 0 * :Real Name");
}

TEST(CommandBuilderTest, ChatLines) {
    EXPECT_EQ(CommandBuilder::join("#chan"), "JOIN #chan");
    EXPECT_EQ(CommandBuilder::part("#chan"), "PART #chan");
    EXPECT_EQ(CommandBuilder::privmsg("#chan", "hi there"), "PRIVMSG #chan :hi there");
    EXPECT_EQ(CommandBuilder::notice("nick", "psst"), "NOTICE nick :psst");
}

TEST(CommandBuilderTest, QuitWithAndWithoutMessage) {
    EXPECT_EQ(CommandBuilder::quit(), "QUIT");
    EXPECT_EQ(CommandBuilder::quit("gone fishing"), "QUIT :gone fishing");
}

} // namespace
} // namespace ircconn::protocol
