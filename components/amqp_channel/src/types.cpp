// src/types.cpp
#include "amqp_channel/types.hpp"

namespace amqp_channel {

// Utility function implementations
std::string exchangeTypeToString(ExchangeType type) {
    switch (type) {
        case ExchangeType::Direct: return ExchangeTypeStrings::DIRECT;
        case ExchangeType::Fanout: return ExchangeTypeStrings::FANOUT;
        case ExchangeType::Topic: return ExchangeTypeStrings::TOPIC;
        case ExchangeType::Headers: return ExchangeTypeStrings::HEADERS;
        default: return "unknown";
    }
}

ExchangeType stringToExchangeType(const std::string& str) {
    if (str == ExchangeTypeStrings::DIRECT) return ExchangeType::Direct;
    if (str == ExchangeTypeStrings::FANOUT) return ExchangeType::Fanout;
    if (str == ExchangeTypeStrings::TOPIC) return ExchangeType::Topic;
    if (str == ExchangeTypeStrings::HEADERS) return ExchangeType::Headers;
    return ExchangeType::Direct; // Default
}

std::string channelStateToString(ChannelState state) {
    switch (state) {
        case ChannelState::Closed: return "Closed";
        case ChannelState::Opening: return "Opening";
        case ChannelState::Open: return "Open";
        case ChannelState::Closing: return "Closing";
        case ChannelState::Failed: return "Failed";
        default: return "Unknown";
    }
}

std::string deliveryStateToString(DeliveryState state) {
    switch (state) {
        case DeliveryState::Unacknowledged: return "Unacknowledged";
        case DeliveryState::Acknowledged: return "Acknowledged";
        case DeliveryState::Rejected: return "Rejected";
        default: return "Unknown";
    }
}

std::string errorTypeToString(ErrorType error) {
    switch (error) {
        case ErrorType::None: return "None";
        case ErrorType::ChannelCreationFailed: return "ChannelCreationFailed";
        case ErrorType::ChannelCloseFailed: return "ChannelCloseFailed";
        case ErrorType::ChannelAbortFailed: return "ChannelAbortFailed";
        case ErrorType::QueueDeclarationFailed: return "QueueDeclarationFailed";
        case ErrorType::ExchangeDeclarationFailed: return "ExchangeDeclarationFailed";
        case ErrorType::BindingFailed: return "BindingFailed";
        case ErrorType::PublishFailed: return "PublishFailed";
        case ErrorType::QueueDeletionFailed: return "QueueDeletionFailed";
        case ErrorType::ExchangeDeletionFailed: return "ExchangeDeletionFailed";
        case ErrorType::QueuePurgeFailed: return "QueuePurgeFailed";
        case ErrorType::ConsumeFailed: return "ConsumeFailed";
        case ErrorType::QosFailed: return "QosFailed";
        case ErrorType::AcknowledgementFailed: return "AcknowledgementFailed";
        case ErrorType::AlreadyAcknowledged: return "AlreadyAcknowledged";
        case ErrorType::UninitializedTag: return "UninitializedTag";
        case ErrorType::DecodeFailed: return "DecodeFailed";
        case ErrorType::ConfigurationError: return "ConfigurationError";
        default: return "Unknown";
    }
}

std::string failureCategoryToString(FailureCategory category) {
    switch (category) {
        case FailureCategory::Network: return "Network";
        case FailureCategory::Timeout: return "Timeout";
        case FailureCategory::Protocol: return "Protocol";
        case FailureCategory::ServerClosed: return "ServerClosed";
        case FailureCategory::Resource: return "Resource";
        case FailureCategory::Closed: return "Closed";
        default: return "Unknown";
    }
}

std::string amqpErrorToString(int error) {
    switch (error) {
        case AMQP_STATUS_OK: return "OK";
        case AMQP_STATUS_NO_MEMORY: return "No memory";
        case AMQP_STATUS_BAD_AMQP_DATA: return "Bad AMQP data";
        case AMQP_STATUS_UNKNOWN_CLASS: return "Unknown class";
        case AMQP_STATUS_UNKNOWN_METHOD: return "Unknown method";
        case AMQP_STATUS_HOSTNAME_RESOLUTION_FAILED: return "Hostname resolution failed";
        case AMQP_STATUS_INCOMPATIBLE_AMQP_VERSION: return "Incompatible AMQP version";
        case AMQP_STATUS_CONNECTION_CLOSED: return "Connection closed";
        case AMQP_STATUS_BAD_URL: return "Bad URL";
        case AMQP_STATUS_SOCKET_ERROR: return "Socket error";
        case AMQP_STATUS_INVALID_PARAMETER: return "Invalid parameter";
        case AMQP_STATUS_TABLE_TOO_BIG: return "Table too big";
        case AMQP_STATUS_WRONG_METHOD: return "Wrong method";
        case AMQP_STATUS_TIMEOUT: return "Timeout";
        case AMQP_STATUS_TIMER_FAILURE: return "Timer failure";
        case AMQP_STATUS_HEARTBEAT_TIMEOUT: return "Heartbeat timeout";
        case AMQP_STATUS_UNEXPECTED_STATE: return "Unexpected state";
        case AMQP_STATUS_SOCKET_CLOSED: return "Socket closed";
        case AMQP_STATUS_SOCKET_INUSE: return "Socket in use";
        case AMQP_STATUS_BROKER_UNSUPPORTED_SASL_METHOD: return "Broker unsupported SASL method";
        case AMQP_STATUS_UNSUPPORTED: return "Unsupported";
        default:
            return "Unknown error (" + std::to_string(error) + ")";
    }
}

FailureCategory amqpErrorToFailureCategory(int error) {
    switch (error) {
        case AMQP_STATUS_NO_MEMORY:
        case AMQP_STATUS_TABLE_TOO_BIG:
            return FailureCategory::Resource;
        case AMQP_STATUS_HOSTNAME_RESOLUTION_FAILED:
        case AMQP_STATUS_SOCKET_ERROR:
        case AMQP_STATUS_SOCKET_INUSE:
            return FailureCategory::Network;
        case AMQP_STATUS_CONNECTION_CLOSED:
        case AMQP_STATUS_SOCKET_CLOSED:
            return FailureCategory::Closed;
        case AMQP_STATUS_TIMEOUT:
        case AMQP_STATUS_HEARTBEAT_TIMEOUT:
        case AMQP_STATUS_TIMER_FAILURE:
            return FailureCategory::Timeout;
        case AMQP_STATUS_BAD_AMQP_DATA:
        case AMQP_STATUS_UNKNOWN_CLASS:
        case AMQP_STATUS_UNKNOWN_METHOD:
        case AMQP_STATUS_INCOMPATIBLE_AMQP_VERSION:
        case AMQP_STATUS_WRONG_METHOD:
        case AMQP_STATUS_UNEXPECTED_STATE:
        default:
            return FailureCategory::Protocol;
    }
}

Bytes toBytes(const std::string& text) {
    return Bytes(text.begin(), text.end());
}

// Exception implementations
AmqpChannelException::AmqpChannelException(const std::string& message)
    : message_(message) {
}

const char* AmqpChannelException::what() const noexcept {
    return message_.c_str();
}

TransportException::TransportException(const std::string& message, FailureCategory category, int replyCode)
    : AmqpChannelException(message), category_(category), replyCode_(replyCode) {
}

FailureCategory TransportException::getCategory() const noexcept {
    return category_;
}

int TransportException::getReplyCode() const noexcept {
    return replyCode_;
}

ConfigurationException::ConfigurationException(const std::string& message)
    : AmqpChannelException(message) {
}

} // namespace amqp_channel
