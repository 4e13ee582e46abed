#include "test_utils.hpp"
#include <atomic>
#include <cstdlib>
#include <random>

namespace amqp_channel {
namespace test {

ConnectionConfig TestConfig::getTestConnectionConfig() {
    ConnectionConfig config;
    config.host = getEnvVar("RABBITMQ_HOST", "localhost");
    config.port = std::stoi(getEnvVar("RABBITMQ_PORT", "5672"));
    config.username = getEnvVar("RABBITMQ_USER", "guest");
    config.password = getEnvVar("RABBITMQ_PASS", "guest");
    config.vhost = getEnvVar("RABBITMQ_VHOST", "/");
    config.connectionTimeout = std::chrono::seconds(10);
    config.operationTimeout = std::chrono::seconds(5);
    return config;
}

std::string TestConfig::getEnvVar(const std::string& name, const std::string& defaultValue) {
    const char* value = std::getenv(name.c_str());
    return value ? std::string(value) : defaultValue;
}

bool TestConfig::isBrokerAvailable() {
    return getEnvVar("AMQP_CHANNEL_TEST_BROKER") == "1";
}

Properties TestMessages::textProperties() {
    return {{PropertyNames::CONTENT_TYPE, "text/plain"},
            {PropertyNames::CONTENT_ENCODING, "utf-8"}};
}

Properties TestMessages::jsonProperties() {
    return {{PropertyNames::CONTENT_TYPE, "application/json"}};
}

Bytes TestMessages::invalidUtf8() {
    // Lone continuation byte followed by a truncated two-byte sequence
    return Bytes{'o', 'k', 0x80, 0xC3};
}

std::string TestHelpers::generateRandomString(size_t length) {
    static const char chars[] = "abcdefghijklmnopqrstuvwxyz0123456789";
    static std::mt19937 gen(std::random_device{}());
    std::uniform_int_distribution<size_t> dis(0, sizeof(chars) - 2);

    std::string result;
    result.reserve(length);
    for (size_t i = 0; i < length; ++i) {
        result += chars[dis(gen)];
    }
    return result;
}

Bytes TestHelpers::generateRandomBinary(size_t length) {
    static std::mt19937 gen(std::random_device{}());
    std::uniform_int_distribution<int> dis(0, 255);

    Bytes data(length);
    for (auto& byte : data) {
        byte = static_cast<uint8_t>(dis(gen));
    }
    return data;
}

std::string TestHelpers::uniqueName(const std::string& prefix) {
    static std::atomic<int> counter{0};
    return prefix + "." + std::to_string(++counter) + "." + generateRandomString(6);
}

ResourceGuard::ResourceGuard(std::function<void()> cleanup)
    : cleanup_(std::move(cleanup)), released_(false) {
}

ResourceGuard::~ResourceGuard() {
    if (!released_ && cleanup_) {
        cleanup_();
    }
}

void ResourceGuard::release() {
    released_ = true;
}

std::shared_ptr<::testing::NiceMock<MockTransportChannel>> makeMockChannel(int channelId) {
    auto channel = std::make_shared<::testing::NiceMock<MockTransportChannel>>();
    ON_CALL(*channel, id()).WillByDefault(::testing::Return(channelId));
    return channel;
}

} // namespace test
} // namespace amqp_channel
