// test/unit/test_types.cpp
#include <gtest/gtest.h>
#include "amqp_channel/types.hpp"
#include "utils/test_utils.hpp"

using namespace amqp_channel;
using namespace amqp_channel::test;

class TypesTest : public ::testing::Test {
};

// Test enum conversions
TEST_F(TypesTest, ExchangeTypeConversions) {
    EXPECT_EQ("direct", exchangeTypeToString(ExchangeType::Direct));
    EXPECT_EQ("fanout", exchangeTypeToString(ExchangeType::Fanout));
    EXPECT_EQ("topic", exchangeTypeToString(ExchangeType::Topic));
    EXPECT_EQ("headers", exchangeTypeToString(ExchangeType::Headers));

    EXPECT_EQ(ExchangeType::Direct, stringToExchangeType("direct"));
    EXPECT_EQ(ExchangeType::Fanout, stringToExchangeType("fanout"));
    EXPECT_EQ(ExchangeType::Topic, stringToExchangeType("topic"));
    EXPECT_EQ(ExchangeType::Headers, stringToExchangeType("headers"));

    // Test default for unknown
    EXPECT_EQ(ExchangeType::Direct, stringToExchangeType("unknown"));
}

TEST_F(TypesTest, ChannelStateConversions) {
    EXPECT_EQ("Closed", channelStateToString(ChannelState::Closed));
    EXPECT_EQ("Opening", channelStateToString(ChannelState::Opening));
    EXPECT_EQ("Open", channelStateToString(ChannelState::Open));
    EXPECT_EQ("Closing", channelStateToString(ChannelState::Closing));
    EXPECT_EQ("Failed", channelStateToString(ChannelState::Failed));
}

TEST_F(TypesTest, DeliveryStateConversions) {
    EXPECT_EQ("Unacknowledged", deliveryStateToString(DeliveryState::Unacknowledged));
    EXPECT_EQ("Acknowledged", deliveryStateToString(DeliveryState::Acknowledged));
    EXPECT_EQ("Rejected", deliveryStateToString(DeliveryState::Rejected));
}

TEST_F(TypesTest, ErrorTypeConversions) {
    EXPECT_EQ("None", errorTypeToString(ErrorType::None));
    EXPECT_EQ("ChannelCreationFailed", errorTypeToString(ErrorType::ChannelCreationFailed));
    EXPECT_EQ("QueueDeclarationFailed", errorTypeToString(ErrorType::QueueDeclarationFailed));
    EXPECT_EQ("PublishFailed", errorTypeToString(ErrorType::PublishFailed));
    EXPECT_EQ("AlreadyAcknowledged", errorTypeToString(ErrorType::AlreadyAcknowledged));
    EXPECT_EQ("UninitializedTag", errorTypeToString(ErrorType::UninitializedTag));
    EXPECT_EQ("DecodeFailed", errorTypeToString(ErrorType::DecodeFailed));
}

TEST_F(TypesTest, AmqpErrorConversions) {
    EXPECT_EQ("OK", amqpErrorToString(AMQP_STATUS_OK));
    EXPECT_EQ("Socket error", amqpErrorToString(AMQP_STATUS_SOCKET_ERROR));
    EXPECT_EQ("Timeout", amqpErrorToString(AMQP_STATUS_TIMEOUT));
    EXPECT_EQ("Unknown error (12345)", amqpErrorToString(12345));
}

TEST_F(TypesTest, AmqpErrorCategories) {
    EXPECT_EQ(FailureCategory::Network, amqpErrorToFailureCategory(AMQP_STATUS_SOCKET_ERROR));
    EXPECT_EQ(FailureCategory::Network, amqpErrorToFailureCategory(AMQP_STATUS_HOSTNAME_RESOLUTION_FAILED));
    EXPECT_EQ(FailureCategory::Timeout, amqpErrorToFailureCategory(AMQP_STATUS_TIMEOUT));
    EXPECT_EQ(FailureCategory::Timeout, amqpErrorToFailureCategory(AMQP_STATUS_HEARTBEAT_TIMEOUT));
    EXPECT_EQ(FailureCategory::Closed, amqpErrorToFailureCategory(AMQP_STATUS_CONNECTION_CLOSED));
    EXPECT_EQ(FailureCategory::Resource, amqpErrorToFailureCategory(AMQP_STATUS_NO_MEMORY));
    EXPECT_EQ(FailureCategory::Protocol, amqpErrorToFailureCategory(AMQP_STATUS_BAD_AMQP_DATA));
    EXPECT_EQ("ServerClosed", failureCategoryToString(FailureCategory::ServerClosed));
}

// Test Result template
TEST_F(TypesTest, ResultSuccess) {
    Result<int> result(42);

    EXPECT_TRUE(result);
    EXPECT_TRUE(result.success);
    EXPECT_EQ(42, result.value);
    EXPECT_EQ(42, *result);
    EXPECT_EQ(ErrorType::None, result.error);
}

TEST_F(TypesTest, ResultFailure) {
    Result<std::string> result(ErrorType::PublishFailed, "exchange missing");

    EXPECT_FALSE(result);
    EXPECT_EQ(ErrorType::PublishFailed, result.error);
    EXPECT_EQ("exchange missing", result.message);
}

TEST_F(TypesTest, VoidResult) {
    Result<void> ok;
    EXPECT_TRUE(ok);

    Result<void> failed(ErrorType::BindingFailed, "no queue");
    EXPECT_FALSE(failed);
    EXPECT_EQ(ErrorType::BindingFailed, failed.error);
    EXPECT_EQ("no queue", failed.message);
}

TEST_F(TypesTest, TransportExceptionCarriesCategory) {
    TransportException e("NOT_FOUND - no queue 'q'", FailureCategory::ServerClosed, 404);

    EXPECT_STREQ("NOT_FOUND - no queue 'q'", e.what());
    EXPECT_EQ(FailureCategory::ServerClosed, e.getCategory());
    EXPECT_EQ(404, e.getReplyCode());
}

TEST_F(TypesTest, DeclarationDefaults) {
    QueueSpec queue;
    EXPECT_TRUE(queue.name.empty());
    EXPECT_FALSE(queue.durable);
    EXPECT_FALSE(queue.exclusive);
    EXPECT_FALSE(queue.autoDelete);

    ExchangeSpec exchange;
    EXPECT_EQ("direct", exchange.type);
    EXPECT_FALSE(exchange.durable);

    CloseParams close;
    EXPECT_EQ(200, close.code);
}

TEST_F(TypesTest, TextToBytesKeepsUtf8) {
    Bytes bytes = toBytes("h\xC3\xA9");
    ASSERT_EQ(3u, bytes.size());
    EXPECT_EQ(0xC3, bytes[1]);
    EXPECT_EQ(0xA9, bytes[2]);
}
