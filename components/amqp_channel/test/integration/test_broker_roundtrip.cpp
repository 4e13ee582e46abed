// test/integration/test_broker_roundtrip.cpp
#include <gtest/gtest.h>
#include "amqp_channel/channel.hpp"
#include "amqp_channel/connection.hpp"
#include "utils/test_utils.hpp"

using namespace amqp_channel;
using namespace amqp_channel::test;

class BrokerRoundTripTest : public ::testing::Test {
protected:
    void SetUp() override {
        if (!TestConfig::isBrokerAvailable()) {
            GTEST_SKIP() << "Set AMQP_CHANNEL_TEST_BROKER=1 to run against a live broker";
        }

        connection_ = std::make_shared<AmqpConnection>(TestConfig::getTestConnectionConfig());
        connection_->open();
    }

    void TearDown() override {
        if (connection_) {
            connection_->close();
        }
    }

    std::shared_ptr<Channel> openChannel() {
        auto result = Channel::open(*connection_);
        EXPECT_TRUE(result) << result.message;
        return result.value;
    }

    std::shared_ptr<AmqpConnection> connection_;
};

TEST_F(BrokerRoundTripTest, LogsFanout) {
    auto channel = openChannel();
    ASSERT_TRUE(channel);

    std::string exchange = TestHelpers::uniqueName("logs");
    ExchangeSpec spec;
    spec.name = exchange;
    spec.type = "fanout";
    spec.autoDelete = true;
    ASSERT_TRUE(channel->declareExchange(spec));

    auto queue = channel->declareQueue();
    ASSERT_TRUE(queue) << queue.message;
    EXPECT_EQ(0u, queue.value.rfind("amq.gen-", 0));
    ASSERT_TRUE(channel->bindQueue(queue.value, exchange, ""));

    Properties properties = TestMessages::textProperties();
    properties["x-origin"] = "integration";
    ASSERT_TRUE(channel->publish(exchange, "", std::string("h\xC3\xA9llo"), properties));

    auto tag = channel->consume(queue.value);
    ASSERT_TRUE(tag) << tag.message;

    auto delivery = channel->nextDelivery(std::chrono::seconds(5));
    ASSERT_TRUE(delivery) << delivery.message;
    ASSERT_TRUE(delivery.value.has_value());
    EXPECT_EQ("h\xC3\xA9llo", delivery.value->message().asText().value);
    EXPECT_EQ("text/plain", delivery.value->message().getContentType());
    EXPECT_EQ("integration", delivery.value->message().getProperty("x-origin").value_or(""));
    EXPECT_TRUE(delivery.value->ack());

    EXPECT_TRUE(channel->cancel(tag.value));
    EXPECT_TRUE(channel->close(CloseParams{200, "done"}));
}

TEST_F(BrokerRoundTripTest, InequivalentRedeclareClosesOnlyThatChannel) {
    auto first = openChannel();
    ASSERT_TRUE(first);

    QueueSpec durable;
    durable.name = TestHelpers::uniqueName("tasks");
    durable.durable = true;
    ASSERT_TRUE(first->declareQueue(durable));
    ResourceGuard queueGuard([&] {
        auto cleanup = openChannel();
        if (cleanup) {
            EXPECT_TRUE(cleanup->deleteQueue(durable.name));
        }
    });

    QueueSpec transient = durable;
    transient.durable = false;
    auto result = first->declareQueue(transient);
    EXPECT_FALSE(result);
    EXPECT_EQ(ErrorType::QueueDeclarationFailed, result.error);
    EXPECT_EQ(ChannelState::Failed, first->getState());

    auto second = openChannel();
    ASSERT_TRUE(second);
    EXPECT_TRUE(second->declareQueue(durable));
}

TEST_F(BrokerRoundTripTest, ChannelsDoNotSurviveReconnect) {
    auto stale = openChannel();
    ASSERT_TRUE(stale);

    connection_->close();
    connection_->open();
    ASSERT_TRUE(connection_->isConnected());

    auto declared = stale->declareQueue();
    EXPECT_FALSE(declared);
    EXPECT_EQ(ErrorType::QueueDeclarationFailed, declared.error);
    EXPECT_EQ(ChannelState::Failed, stale->getState());

    auto fresh = openChannel();
    ASSERT_TRUE(fresh);
    auto queue = fresh->declareQueue();
    EXPECT_TRUE(queue) << queue.message;
    EXPECT_TRUE(fresh->close());
}
