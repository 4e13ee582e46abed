#pragma once

#include "amqp_channel/types.hpp"
#include "amqp_channel/config.hpp"
#include "amqp_channel/transport.hpp"
#include <gmock/gmock.h>
#include <gtest/gtest.h>
#include <chrono>
#include <functional>
#include <memory>
#include <string>
#include <vector>

namespace amqp_channel {
namespace test {

// Test configuration helpers
class TestConfig {
public:
    static ConnectionConfig getTestConnectionConfig();

    // Environment variable helpers
    static std::string getEnvVar(const std::string& name, const std::string& defaultValue = "");

    // Broker-backed tests run only when AMQP_CHANNEL_TEST_BROKER=1
    static bool isBrokerAvailable();
};

// Test payload creators
class TestMessages {
public:
    static Properties textProperties();
    static Properties jsonProperties();
    static Bytes invalidUtf8();
};

// Test helpers for generating random data
class TestHelpers {
public:
    static std::string generateRandomString(size_t length);
    static Bytes generateRandomBinary(size_t length);
    static std::string uniqueName(const std::string& prefix);
};

// Resource cleanup helper
class ResourceGuard {
public:
    explicit ResourceGuard(std::function<void()> cleanup);
    ~ResourceGuard();

    ResourceGuard(const ResourceGuard&) = delete;
    ResourceGuard& operator=(const ResourceGuard&) = delete;

    void release();

private:
    std::function<void()> cleanup_;
    bool released_;
};

class MockTransportChannel : public TransportChannel {
public:
    MOCK_METHOD(int, id, (), (const, override));

    MOCK_METHOD(void, close, (), (override));
    MOCK_METHOD(void, close, (int code, const std::string& reason), (override));
    MOCK_METHOD(void, abort, (), (override));
    MOCK_METHOD(void, abort, (int code, const std::string& reason), (override));

    MOCK_METHOD(std::string, queueDeclare, (), (override));
    MOCK_METHOD(std::string, queueDeclare, (const std::string& name, bool durable, bool exclusive,
                                            bool autoDelete, const Arguments& arguments), (override));
    MOCK_METHOD(void, exchangeDeclare, (const std::string& name, const std::string& type, bool durable,
                                        bool autoDelete, bool internal, const Arguments& arguments), (override));
    MOCK_METHOD(void, queueBind, (const std::string& queue, const std::string& exchange,
                                  const std::string& routingKey), (override));
    MOCK_METHOD(void, queueDelete, (const std::string& name), (override));
    MOCK_METHOD(void, exchangeDelete, (const std::string& name), (override));
    MOCK_METHOD(void, queuePurge, (const std::string& name), (override));

    MOCK_METHOD(void, basicPublish, (const std::string& exchange, const std::string& routingKey,
                                     const Properties& properties, const Bytes& body), (override));

    MOCK_METHOD(std::string, basicConsume, (const std::string& queue, const std::string& consumerTag,
                                            bool noAck), (override));
    MOCK_METHOD(void, basicCancel, (const std::string& consumerTag), (override));
    MOCK_METHOD(std::optional<RawDelivery>, consumeMessage, (std::chrono::milliseconds timeout), (override));
    MOCK_METHOD(std::optional<RawDelivery>, basicGet, (const std::string& queue, bool noAck), (override));
    MOCK_METHOD(void, basicQos, (uint16_t prefetchCount), (override));

    MOCK_METHOD(void, basicAck, (uint64_t deliveryTag, bool multiple), (override));
    MOCK_METHOD(void, basicNack, (uint64_t deliveryTag, bool multiple, bool requeue), (override));
};

// Hands out a preconfigured channel
class MockTransport : public Transport {
public:
    MOCK_METHOD(std::shared_ptr<TransportChannel>, createChannel, (), (override));
};

// Mock channel with id() stubbed and the destructor-time close tolerated
std::shared_ptr<::testing::NiceMock<MockTransportChannel>> makeMockChannel(int channelId = 1);

} // namespace test
} // namespace amqp_channel
