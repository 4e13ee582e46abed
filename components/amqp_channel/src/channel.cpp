// src/channel.cpp
#include "amqp_channel/channel.hpp"
#include <spdlog/spdlog.h>
#include <limits>
#include <type_traits>

namespace amqp_channel {

namespace {

const std::string CREATE_CHANNEL_ERROR = "An error occurred while creating the channel: ";
const std::string CLOSE_CHANNEL_ERROR = "An error occurred while closing the channel: ";
const std::string ABORT_CHANNEL_ERROR = "An error occurred while aborting the channel: ";
const std::string AUTO_DECLARE_QUEUE_ERROR = "An error occurred while auto-declaring the queue: ";
const std::string DECLARE_QUEUE_ERROR = "An error occurred while declaring the queue: ";
const std::string DECLARE_EXCHANGE_ERROR = "An error occurred while declaring the exchange: ";
const std::string BIND_QUEUE_ERROR = "An error occurred while binding the queue to an exchange: ";
const std::string PUBLISH_ERROR = "An error occurred while publishing the message to a queue: ";
const std::string DELETE_QUEUE_ERROR = "An error occurred while deleting the queue: ";
const std::string DELETE_EXCHANGE_ERROR = "An error occurred while deleting the exchange: ";
const std::string PURGE_QUEUE_ERROR = "An error occurred while purging the queue: ";
const std::string CONSUME_ERROR = "An error occurred while starting the consumer: ";
const std::string CANCEL_ERROR = "An error occurred while cancelling the consumer: ";
const std::string RECEIVE_ERROR = "An error occurred while receiving a delivery: ";
const std::string GET_ERROR = "An error occurred while fetching a message: ";
const std::string QOS_ERROR = "An error occurred while setting the prefetch count: ";

// Failures after which the channel can no longer be used
bool isFatal(FailureCategory category) {
    switch (category) {
        case FailureCategory::ServerClosed:
        case FailureCategory::Closed:
        case FailureCategory::Network:
            return true;
        default:
            return false;
    }
}

} // namespace

Result<std::shared_ptr<Channel>> Channel::open(Transport& transport) {
    try {
        auto handle = transport.createChannel();
        if (!handle) {
            return Result<std::shared_ptr<Channel>>(ErrorType::ChannelCreationFailed,
                                                    CREATE_CHANNEL_ERROR + "transport returned no channel");
        }

        auto channel = std::make_shared<Channel>(std::move(handle));
        spdlog::info("Channel {} opened", channel->getChannelId());
        return Result<std::shared_ptr<Channel>>(std::move(channel));
    } catch (const TransportException& e) {
        spdlog::error("Failed to open channel: {} [{}]", e.what(), failureCategoryToString(e.getCategory()));
        return Result<std::shared_ptr<Channel>>(ErrorType::ChannelCreationFailed, CREATE_CHANNEL_ERROR + e.what());
    }
}

Channel::Channel(std::shared_ptr<TransportChannel> handle)
    : handle_(std::move(handle))
    , channelId_(handle_->id())
    , state_(ChannelState::Open)
    , ledger_(std::make_shared<AckLedger>()) {
}

Channel::~Channel() {
    if (isOpen()) {
        auto result = close();
        if (!result) {
            spdlog::warn("Channel {} did not close cleanly: {}", channelId_, result.message);
        }
    }
}

Result<void> Channel::close(const std::optional<CloseParams>& params) {
    return shutdown(false, params);
}

Result<void> Channel::abort(const std::optional<CloseParams>& params) {
    return shutdown(true, params);
}

Result<void> Channel::shutdown(bool force, const std::optional<CloseParams>& params) {
    std::lock_guard<std::mutex> lock(mutex_);

    const ErrorType errorType = force ? ErrorType::ChannelAbortFailed : ErrorType::ChannelCloseFailed;
    const std::string& errorPrefix = force ? ABORT_CHANNEL_ERROR : CLOSE_CHANNEL_ERROR;

    if (state_ == ChannelState::Closed) {
        return Result<void>(errorType, errorPrefix + "channel " + std::to_string(channelId_) + " is already closed");
    }

    if (params && (params->code < 0 || params->code > 65535)) {
        return Result<void>(errorType, errorPrefix + "reply code " + std::to_string(params->code) +
                                           " is outside the AMQP reply code range");
    }

    state_ = ChannelState::Closing;

    try {
        if (params) {
            spdlog::debug("{} channel {} with code {} ({})", force ? "Aborting" : "Closing",
                          channelId_, params->code, params->reason);
            if (force) {
                handle_->abort(params->code, params->reason);
            } else {
                handle_->close(params->code, params->reason);
            }
        } else if (force) {
            handle_->abort();
        } else {
            handle_->close();
        }
    } catch (const TransportException& e) {
        state_ = ChannelState::Closed;
        consumerAckModes_.clear();
        stats_.failedOperations++;
        spdlog::error("Channel {}: {}{} [{}]", channelId_, errorPrefix, e.what(),
                      failureCategoryToString(e.getCategory()));
        return Result<void>(errorType, errorPrefix + e.what());
    }

    state_ = ChannelState::Closed;
    consumerAckModes_.clear();
    if (force) {
        spdlog::warn("Channel {} aborted", channelId_);
    } else {
        spdlog::info("Channel {} closed", channelId_);
    }
    return Result<void>();
}

bool Channel::isOpen() const {
    return state_ == ChannelState::Open;
}

ChannelState Channel::getState() const {
    return state_;
}

int Channel::getChannelId() const {
    return channelId_;
}

void Channel::recordFailure(const TransportException& e) {
    stats_.failedOperations++;
    if (isFatal(e.getCategory())) {
        state_ = ChannelState::Failed;
    }
}

template<typename T, typename Operation>
Result<T> Channel::execute(ErrorType errorType, const std::string& errorPrefix, Operation&& operation) {
    std::lock_guard<std::mutex> lock(mutex_);

    if (state_ != ChannelState::Open) {
        std::string message = errorPrefix + "channel " + std::to_string(channelId_) + " is " +
                              channelStateToString(state_);
        spdlog::error("{}", message);
        return Result<T>(errorType, message);
    }

    try {
        if constexpr (std::is_void_v<T>) {
            operation();
            return Result<T>();
        } else {
            return Result<T>(operation());
        }
    } catch (const TransportException& e) {
        recordFailure(e);
        spdlog::error("Channel {}: {}{} [{}]", channelId_, errorPrefix, e.what(),
                      failureCategoryToString(e.getCategory()));
        return Result<T>(errorType, errorPrefix + e.what());
    }
}

Result<std::string> Channel::declareQueue(const std::optional<QueueSpec>& spec) {
    if (!spec) {
        return execute<std::string>(ErrorType::QueueDeclarationFailed, AUTO_DECLARE_QUEUE_ERROR, [&] {
            std::string name = handle_->queueDeclare();
            stats_.queuesDeclared++;
            spdlog::debug("Channel {} declared server-named queue '{}'", channelId_, name);
            return name;
        });
    }

    return execute<std::string>(ErrorType::QueueDeclarationFailed, DECLARE_QUEUE_ERROR, [&] {
        std::string name = handle_->queueDeclare(spec->name, spec->durable, spec->exclusive,
                                                 spec->autoDelete, spec->arguments);
        stats_.queuesDeclared++;
        spdlog::debug("Channel {} declared queue '{}' (durable: {}, exclusive: {}, auto-delete: {})",
                      channelId_, name, spec->durable, spec->exclusive, spec->autoDelete);
        return name;
    });
}

Result<void> Channel::deleteQueue(const std::string& queueName) {
    return execute<void>(ErrorType::QueueDeletionFailed, DELETE_QUEUE_ERROR, [&] {
        handle_->queueDelete(queueName);
        spdlog::debug("Channel {} deleted queue '{}'", channelId_, queueName);
    });
}

Result<void> Channel::purgeQueue(const std::string& queueName) {
    return execute<void>(ErrorType::QueuePurgeFailed, PURGE_QUEUE_ERROR, [&] {
        handle_->queuePurge(queueName);
        spdlog::debug("Channel {} purged queue '{}'", channelId_, queueName);
    });
}

Result<void> Channel::declareExchange(const ExchangeSpec& spec) {
    return execute<void>(ErrorType::ExchangeDeclarationFailed, DECLARE_EXCHANGE_ERROR, [&] {
        handle_->exchangeDeclare(spec.name, spec.type, spec.durable, spec.autoDelete,
                                 spec.internal, spec.arguments);
        stats_.exchangesDeclared++;
        spdlog::debug("Channel {} declared {} exchange '{}'", channelId_, spec.type, spec.name);
    });
}

Result<void> Channel::deleteExchange(const std::string& exchangeName) {
    return execute<void>(ErrorType::ExchangeDeletionFailed, DELETE_EXCHANGE_ERROR, [&] {
        handle_->exchangeDelete(exchangeName);
        spdlog::debug("Channel {} deleted exchange '{}'", channelId_, exchangeName);
    });
}

Result<void> Channel::bindQueue(const std::string& queueName, const std::string& exchangeName,
                                const std::string& bindingKey) {
    return execute<void>(ErrorType::BindingFailed, BIND_QUEUE_ERROR, [&] {
        handle_->queueBind(queueName, exchangeName, bindingKey);
        spdlog::debug("Channel {} bound queue '{}' to exchange '{}' with key '{}'",
                      channelId_, queueName, exchangeName, bindingKey);
    });
}

Result<void> Channel::publish(const std::string& exchangeName, const std::string& routingKey,
                              const Bytes& payload, const Properties& properties) {
    return execute<void>(ErrorType::PublishFailed, PUBLISH_ERROR, [&] {
        handle_->basicPublish(exchangeName, routingKey, properties, payload);
        stats_.messagesPublished++;
        spdlog::trace("Channel {} published {} bytes to exchange '{}' with key '{}'",
                      channelId_, payload.size(), exchangeName, routingKey);
    });
}

Result<void> Channel::publish(const std::string& exchangeName, const std::string& routingKey,
                              const std::string& text, const Properties& properties) {
    return publish(exchangeName, routingKey, toBytes(text), properties);
}

Result<std::string> Channel::consume(const std::string& queueName, bool autoAck,
                                     const std::string& consumerTag) {
    return execute<std::string>(ErrorType::ConsumeFailed, CONSUME_ERROR, [&] {
        std::string tag = handle_->basicConsume(queueName, consumerTag, autoAck);
        consumerAckModes_[tag] = autoAck;
        spdlog::info("Channel {} consuming from queue '{}' as '{}' (auto-ack: {})",
                     channelId_, queueName, tag, autoAck);
        return tag;
    });
}

Result<void> Channel::cancel(const std::string& consumerTag) {
    return execute<void>(ErrorType::ConsumeFailed, CANCEL_ERROR, [&] {
        handle_->basicCancel(consumerTag);
        // Deliveries sent before the cancel can still arrive; they keep the consumer's ack mode
        spdlog::info("Channel {} cancelled consumer '{}'", channelId_, consumerTag);
    });
}

Delivery Channel::wrapDelivery(RawDelivery raw, bool autoAck) {
    stats_.deliveriesReceived++;
    return Delivery(std::move(raw), autoAck, handle_, ledger_);
}

Result<std::optional<Delivery>> Channel::nextDelivery(std::chrono::milliseconds timeout) {
    return execute<std::optional<Delivery>>(ErrorType::ConsumeFailed, RECEIVE_ERROR, [&] {
        std::optional<Delivery> delivery;
        auto raw = handle_->consumeMessage(timeout);
        if (raw) {
            auto mode = consumerAckModes_.find(raw->consumerTag);
            bool autoAck = mode != consumerAckModes_.end() && mode->second;
            delivery.emplace(wrapDelivery(std::move(*raw), autoAck));
        }
        return delivery;
    });
}

Result<std::optional<Delivery>> Channel::get(const std::string& queueName, bool autoAck) {
    return execute<std::optional<Delivery>>(ErrorType::ConsumeFailed, GET_ERROR, [&] {
        std::optional<Delivery> delivery;
        auto raw = handle_->basicGet(queueName, autoAck);
        if (raw) {
            delivery.emplace(wrapDelivery(std::move(*raw), autoAck));
        } else {
            spdlog::trace("Channel {} found queue '{}' empty", channelId_, queueName);
        }
        return delivery;
    });
}

Result<void> Channel::setPrefetch(uint16_t prefetchCount) {
    return execute<void>(ErrorType::QosFailed, QOS_ERROR, [&] {
        handle_->basicQos(prefetchCount);
        spdlog::debug("Channel {} prefetch count set to {}", channelId_, prefetchCount);
    });
}

ChannelStats Channel::getStats() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return stats_;
}

std::optional<CloseParams> closeParamsFrom(const std::optional<int64_t>& code,
                                           const std::optional<std::string>& reason) {
    if (!code || !reason) {
        if (code || reason) {
            spdlog::debug("Incomplete close parameters, using plain close");
        }
        return std::nullopt;
    }

    if (*code < 0 || *code > std::numeric_limits<uint16_t>::max()) {
        spdlog::warn("Close code {} is outside the AMQP reply code range, using plain close", *code);
        return std::nullopt;
    }

    CloseParams params;
    params.code = static_cast<int>(*code);
    params.reason = *reason;
    return params;
}

std::optional<CloseParams> closeParamsFromJson(const nlohmann::json& code, const nlohmann::json& reason) {
    std::optional<int64_t> typedCode;
    std::optional<std::string> typedReason;

    if (code.is_number_integer()) {
        typedCode = code.get<int64_t>();
    }
    if (reason.is_string()) {
        typedReason = reason.get<std::string>();
    }

    return closeParamsFrom(typedCode, typedReason);
}

} // namespace amqp_channel
