#pragma once

#include <cstdint>
#include <exception>
#include <map>
#include <string>
#include <utility>
#include <vector>

extern "C" {
#include <amqp.h>
}

namespace amqp_channel {

// Forward declarations
class Channel;
class Delivery;
class Message;

// Channel states
enum class ChannelState {
    Closed,
    Opening,
    Open,
    Closing,
    Failed
};

// Acknowledgement states of a received delivery
enum class DeliveryState {
    Unacknowledged,
    Acknowledged,
    Rejected
};

// Error kinds surfaced by the facade. Each transport-facing operation owns
// exactly one kind so callers can branch on the failing operation.
enum class ErrorType {
    None,
    ChannelCreationFailed,
    ChannelCloseFailed,
    ChannelAbortFailed,
    QueueDeclarationFailed,
    ExchangeDeclarationFailed,
    BindingFailed,
    PublishFailed,
    QueueDeletionFailed,
    ExchangeDeletionFailed,
    QueuePurgeFailed,
    ConsumeFailed,
    QosFailed,
    AcknowledgementFailed,
    AlreadyAcknowledged,
    UninitializedTag,
    DecodeFailed,
    ConfigurationError
};

// Failure categories reported by a transport
enum class FailureCategory {
    Network,
    Timeout,
    Protocol,
    ServerClosed,
    Resource,
    Closed
};


// Result template for operations that can succeed or fail
template<typename T>
class Result {
public:
    // Success constructor
    explicit Result(T value) : success(true), value(std::move(value)), error(ErrorType::None) {}

    // Failure constructor
    explicit Result(ErrorType errorType, const std::string& errorMessage = "")
        : success(false), error(errorType), message(errorMessage) {}

    // Check if result is successful
    operator bool() const { return success; }

    // Access value (only if successful)
    T& operator*() { return value; }
    const T& operator*() const { return value; }

    T* operator->() { return &value; }
    const T* operator->() const { return &value; }

    bool success;
    T value{};
    ErrorType error{ErrorType::None};
    std::string message;
};

// Specialization for void
template<>
class Result<void> {
public:
    // Success constructor
    Result() : success(true), error(ErrorType::None) {}

    // Failure constructor
    explicit Result(ErrorType errorType, const std::string& errorMessage = "")
        : success(false), error(errorType), message(errorMessage) {}

    operator bool() const { return success; }

    bool success;
    ErrorType error{ErrorType::None};
    std::string message;
};

using Bytes = std::vector<uint8_t>;
using Properties = std::map<std::string, std::string>;
using Arguments = std::map<std::string, std::string>;

// Exchange types enum
enum class ExchangeType {
    Direct,
    Topic,
    Fanout,
    Headers
};

// Exchange type string constants
namespace ExchangeTypeStrings {
    constexpr const char* DIRECT = "direct";
    constexpr const char* TOPIC = "topic";
    constexpr const char* FANOUT = "fanout";
    constexpr const char* HEADERS = "headers";
}

// Well-known property keys; they map onto AMQP basic properties. Any other
// key travels as a message header.
namespace PropertyNames {
    constexpr const char* CONTENT_TYPE = "content_type";
    constexpr const char* CONTENT_ENCODING = "content_encoding";
    constexpr const char* DELIVERY_MODE = "delivery_mode";
    constexpr const char* PRIORITY = "priority";
    constexpr const char* CORRELATION_ID = "correlation_id";
    constexpr const char* REPLY_TO = "reply_to";
    constexpr const char* EXPIRATION = "expiration";
    constexpr const char* MESSAGE_ID = "message_id";
    constexpr const char* TIMESTAMP = "timestamp";
    constexpr const char* TYPE = "type";
    constexpr const char* USER_ID = "user_id";
    constexpr const char* APP_ID = "app_id";
}

// The nameless exchange every broker pre-declares; routes by queue name
constexpr const char* DEFAULT_EXCHANGE = "";

// Delivery tag value meaning "never assigned"
constexpr uint64_t UNASSIGNED_DELIVERY_TAG = 0;

// Queue declaration descriptor. An empty name asks the broker to generate one.
struct QueueSpec {
    std::string name;
    bool durable{false};
    bool exclusive{false};
    bool autoDelete{false};
    Arguments arguments;
};

// Exchange declaration descriptor
struct ExchangeSpec {
    std::string name;
    std::string type{ExchangeTypeStrings::DIRECT};
    bool durable{false};
    bool autoDelete{false};
    bool internal{false};
    Arguments arguments;
};

// Reply code and text for the parameterized channel.close / abort form
struct CloseParams {
    int code{AMQP_REPLY_SUCCESS};
    std::string reason;
};

// A message as handed over by the transport, before the facade wraps it
struct RawDelivery {
    uint64_t deliveryTag{UNASSIGNED_DELIVERY_TAG};
    std::string consumerTag;
    std::string exchange;
    std::string routingKey;
    bool redelivered{false};
    Properties properties;
    Bytes body;
};

// Exception classes
class AmqpChannelException : public std::exception {
public:
    explicit AmqpChannelException(const std::string& message);
    const char* what() const noexcept override;

private:
    std::string message_;
};

// Thrown by transports; the facade converts it into a Result
class TransportException : public AmqpChannelException {
public:
    TransportException(const std::string& message, FailureCategory category, int replyCode = 0);
    FailureCategory getCategory() const noexcept;
    int getReplyCode() const noexcept;

private:
    FailureCategory category_;
    int replyCode_;
};

class ConfigurationException : public AmqpChannelException {
public:
    explicit ConfigurationException(const std::string& message);
};

// Utility function declarations
std::string exchangeTypeToString(ExchangeType type);
ExchangeType stringToExchangeType(const std::string& str);
std::string channelStateToString(ChannelState state);
std::string deliveryStateToString(DeliveryState state);
std::string errorTypeToString(ErrorType type);
std::string failureCategoryToString(FailureCategory category);
std::string amqpErrorToString(int amqpStatus);
FailureCategory amqpErrorToFailureCategory(int amqpStatus);

Bytes toBytes(const std::string& text);

} // namespace amqp_channel
