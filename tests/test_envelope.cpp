// tests/test_envelope.cpp
#include <gtest/gtest.h>
#include <string>

#include "proto/envelope.hpp"

using envelope::Bytes;

static Bytes B(const std::string &s)
{
    return Bytes(s.begin(), s.end());
}

static std::string S(const Bytes &b)
{
    return std::string(b.begin(), b.end());
}

TEST(Envelope, WrapAddsSentinels)
{
    EXPECT_EQ(S(envelope::wrap(B("{\"pills\":[]}"))), "#START#{\"pills\":[]}#END#");
    EXPECT_EQ(S(envelope::wrap(Bytes{})), "#START##END#");
}

TEST(Envelope, TakeMessageWaitsForEnd)
{
    Bytes buf = B("#START#abc");
    EXPECT_FALSE(envelope::take_message(buf).has_value());
    EXPECT_EQ(S(buf), "#START#abc");

    const std::string rest = "def#END#";
    buf.insert(buf.end(), rest.begin(), rest.end());
    auto msg = envelope::take_message(buf);
    ASSERT_TRUE(msg.has_value());
    EXPECT_EQ(S(*msg), "abcdef");
    EXPECT_TRUE(buf.empty());
}

TEST(Envelope, DropsNoiseBeforeStartAndKeepsTrailingBytes)
{
    Bytes buf = B("xx#START#one#END##STA");
    auto  msg = envelope::take_message(buf);
    ASSERT_TRUE(msg.has_value());
    EXPECT_EQ(S(*msg), "one");
    EXPECT_EQ(S(buf), "#STA");

    // a start sentinel split across two writes still matches
    const std::string rest = "RT#two#END#";
    buf.insert(buf.end(), rest.begin(), rest.end());
    msg = envelope::take_message(buf);
    ASSERT_TRUE(msg.has_value());
    EXPECT_EQ(S(*msg), "two");
}

TEST(Envelope, GarbageWithoutStartIsTrimmed)
{
    Bytes buf = B("0123456789");
    EXPECT_FALSE(envelope::take_message(buf).has_value());
    // at most start.size() - 1 bytes survive
    EXPECT_EQ(S(buf), "456789");
}
