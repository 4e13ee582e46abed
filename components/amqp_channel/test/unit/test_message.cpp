// test/unit/test_message.cpp
#include <gtest/gtest.h>
#include "amqp_channel/message.hpp"
#include "utils/test_utils.hpp"

using namespace amqp_channel;
using namespace amqp_channel::test;

class MessageTest : public ::testing::Test {
};

TEST_F(MessageTest, TextDecodesUtf8) {
    Message message = Message::fromText("caf\xC3\xA9 \xE2\x82\xAC \xF0\x9F\x90\x87");

    auto text = message.asText();
    ASSERT_TRUE(text);
    EXPECT_EQ("caf\xC3\xA9 \xE2\x82\xAC \xF0\x9F\x90\x87", text.value);
}

TEST_F(MessageTest, TextRejectsInvalidUtf8) {
    Message message(TestMessages::invalidUtf8());

    auto text = message.asText();
    EXPECT_FALSE(text);
    EXPECT_EQ(ErrorType::DecodeFailed, text.error);
}

TEST_F(MessageTest, Utf8Validation) {
    auto valid = [](const std::string& s) {
        return isValidUtf8(reinterpret_cast<const uint8_t*>(s.data()), s.size());
    };

    EXPECT_TRUE(valid(""));
    EXPECT_TRUE(valid("plain ascii"));
    EXPECT_TRUE(valid("\xC3\xA9"));
    EXPECT_TRUE(valid("\xF4\x8F\xBF\xBF"));      // U+10FFFF

    EXPECT_FALSE(valid("\xC0\xAF"));             // overlong '/'
    EXPECT_FALSE(valid("\xED\xA0\x80"));         // surrogate
    EXPECT_FALSE(valid("\xF4\x90\x80\x80"));     // above U+10FFFF
    EXPECT_FALSE(valid("\xE2\x82"));             // truncated
    EXPECT_FALSE(valid("\xFF"));
}

TEST_F(MessageTest, EmptyPayloadIsEmptyText) {
    Message message;

    auto text = message.asText();
    ASSERT_TRUE(text);
    EXPECT_TRUE(text.value.empty());
    EXPECT_TRUE(message.isEmpty());
}

TEST_F(MessageTest, IntegerDecoding) {
    EXPECT_EQ(42, Message::fromText("42").asInt().value);
    EXPECT_EQ(-17, Message::fromText("-17").asInt().value);
    EXPECT_EQ(7, Message::fromText("  7\n").asInt().value);
    EXPECT_EQ(INT64_MAX, Message::fromText("9223372036854775807").asInt().value);

    EXPECT_FALSE(Message::fromText("").asInt());
    EXPECT_FALSE(Message::fromText("4.2").asInt());
    EXPECT_FALSE(Message::fromText("0x1F").asInt());
    EXPECT_FALSE(Message::fromText("12abc").asInt());

    auto overflow = Message::fromText("9223372036854775808").asInt();
    EXPECT_FALSE(overflow);
    EXPECT_EQ(ErrorType::DecodeFailed, overflow.error);
}

TEST_F(MessageTest, FloatDecoding) {
    EXPECT_DOUBLE_EQ(3.5, Message::fromText("3.5").asFloat().value);
    EXPECT_DOUBLE_EQ(-0.25, Message::fromText(" -0.25 ").asFloat().value);
    EXPECT_DOUBLE_EQ(1500.0, Message::fromText("1.5e3").asFloat().value);
    EXPECT_DOUBLE_EQ(10.0, Message::fromText("10").asFloat().value);

    EXPECT_FALSE(Message::fromText("nan").asFloat());
    EXPECT_FALSE(Message::fromText("inf").asFloat());
    EXPECT_FALSE(Message::fromText("1e").asFloat());
    EXPECT_FALSE(Message::fromText("1.2.3").asFloat());
    EXPECT_FALSE(Message::fromText("1e999").asFloat());
}

TEST_F(MessageTest, JsonDecoding) {
    Message message = Message::fromText(R"({"level":"info","count":3,"tags":["a","b"]})",
                                        TestMessages::jsonProperties());

    auto json = message.asJson();
    ASSERT_TRUE(json);
    EXPECT_EQ("info", json.value["level"]);
    EXPECT_EQ(3, json.value["count"]);
    EXPECT_EQ(2u, json.value["tags"].size());
    EXPECT_EQ("application/json", message.getContentType());

    auto broken = Message::fromText("{\"level\":").asJson();
    EXPECT_FALSE(broken);
    EXPECT_EQ(ErrorType::DecodeFailed, broken.error);
}

TEST_F(MessageTest, XmlDecoding) {
    Message message = Message::fromText("<log level=\"warn\"><source>disk</source><text>almost full</text></log>");

    auto xml = message.asXml();
    ASSERT_TRUE(xml);
    EXPECT_EQ("log", xml.value.rootName());
    EXPECT_EQ("warn", xml.value.attribute("level").value_or(""));
    EXPECT_EQ("disk", xml.value.childText("source").value_or(""));

    EXPECT_FALSE(Message::fromText("<log><unclosed></log>").asXml());
}

TEST_F(MessageTest, BytesAreReturnedUnchanged) {
    Bytes payload = TestHelpers::generateRandomBinary(256);
    Message message(payload);

    EXPECT_EQ(payload, message.asBytes());
    EXPECT_EQ(256u, message.size());
}

TEST_F(MessageTest, DecodingDoesNotMutate) {
    Message message = Message::fromText("123");

    EXPECT_EQ(123, message.asInt().value);
    EXPECT_EQ("123", message.asText().value);
    EXPECT_DOUBLE_EQ(123.0, message.asFloat().value);
    EXPECT_EQ(123, message.asJson().value.get<int>());
    EXPECT_EQ(toBytes("123"), message.asBytes());
}

TEST_F(MessageTest, Properties) {
    Message message = Message::fromText("hi", TestMessages::textProperties());

    EXPECT_TRUE(message.hasProperty(PropertyNames::CONTENT_TYPE));
    EXPECT_EQ("text/plain", message.getContentType());
    EXPECT_EQ("utf-8", message.getProperty(PropertyNames::CONTENT_ENCODING).value_or(""));
    EXPECT_FALSE(message.getProperty(PropertyNames::REPLY_TO).has_value());
}
