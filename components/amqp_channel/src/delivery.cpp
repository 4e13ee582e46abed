#include "amqp_channel/delivery.hpp"
#include <spdlog/spdlog.h>

namespace amqp_channel {

bool AckLedger::isSettled(uint64_t deliveryTag) const {
    std::lock_guard<std::mutex> lock(mutex_);
    return deliveryTag <= settledUpTo_;
}

void AckLedger::settleUpTo(uint64_t deliveryTag) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (deliveryTag > settledUpTo_) {
        settledUpTo_ = deliveryTag;
    }
}

Delivery::Delivery() = default;

Delivery::Delivery(RawDelivery raw, bool autoAck, std::weak_ptr<TransportChannel> channel,
                   std::shared_ptr<AckLedger> ledger)
    : deliveryTag_(raw.deliveryTag),
      consumerTag_(std::move(raw.consumerTag)),
      exchange_(std::move(raw.exchange)),
      routingKey_(std::move(raw.routingKey)),
      redelivered_(raw.redelivered),
      autoAck_(autoAck),
      message_(std::move(raw.body), std::move(raw.properties)),
      channel_(std::move(channel)),
      ledger_(std::move(ledger)) {
}

Delivery::Delivery(Delivery&& other) noexcept
    : deliveryTag_(other.deliveryTag_),
      consumerTag_(std::move(other.consumerTag_)),
      exchange_(std::move(other.exchange_)),
      routingKey_(std::move(other.routingKey_)),
      redelivered_(other.redelivered_),
      autoAck_(other.autoAck_),
      state_(other.state_),
      message_(std::move(other.message_)),
      channel_(std::move(other.channel_)),
      ledger_(std::move(other.ledger_)) {
    other.reset();
}

Delivery& Delivery::operator=(Delivery&& other) noexcept {
    if (this != &other) {
        deliveryTag_ = other.deliveryTag_;
        consumerTag_ = std::move(other.consumerTag_);
        exchange_ = std::move(other.exchange_);
        routingKey_ = std::move(other.routingKey_);
        redelivered_ = other.redelivered_;
        autoAck_ = other.autoAck_;
        state_ = other.state_;
        message_ = std::move(other.message_);
        channel_ = std::move(other.channel_);
        ledger_ = std::move(other.ledger_);
        other.reset();
    }
    return *this;
}

void Delivery::reset() {
    deliveryTag_ = UNASSIGNED_DELIVERY_TAG;
    state_ = DeliveryState::Unacknowledged;
    channel_.reset();
    ledger_.reset();
}

Result<void> Delivery::ack(bool multiple) {
    return settle(DeliveryState::Acknowledged, multiple, false, "acknowledging");
}

Result<void> Delivery::nack(bool multiple, bool requeue) {
    return settle(DeliveryState::Rejected, multiple, requeue, "rejecting");
}

Result<void> Delivery::reject(bool requeue) {
    return nack(false, requeue);
}

Result<void> Delivery::checkSettleable() const {
    if (state_ != DeliveryState::Unacknowledged) {
        return Result<void>(ErrorType::AlreadyAcknowledged,
                            "Delivery " + std::to_string(deliveryTag_) + " is already " +
                            deliveryStateToString(state_));
    }

    if (deliveryTag_ == UNASSIGNED_DELIVERY_TAG) {
        return Result<void>(ErrorType::UninitializedTag, "Delivery tag has not been assigned");
    }

    if (!autoAck_ && ledger_ && ledger_->isSettled(deliveryTag_)) {
        return Result<void>(ErrorType::AlreadyAcknowledged,
                            "Delivery " + std::to_string(deliveryTag_) +
                            " was already settled by a multiple acknowledgement");
    }

    return Result<void>();
}

Result<void> Delivery::settle(DeliveryState target, bool multiple, bool requeue, const char* action) {
    auto check = checkSettleable();
    if (!check) {
        spdlog::warn("Refusing to settle delivery: {}", check.message);
        return check;
    }

    // The broker already considers auto-ack deliveries settled
    if (autoAck_) {
        state_ = target;
        spdlog::debug("Delivery {} marked {} locally (auto-ack)", deliveryTag_, deliveryStateToString(target));
        return Result<void>();
    }

    auto channel = channel_.lock();
    if (!channel) {
        return Result<void>(ErrorType::AcknowledgementFailed,
                            std::string("An error occurred while ") + action +
                            " the message: channel no longer exists");
    }

    try {
        if (target == DeliveryState::Acknowledged) {
            channel->basicAck(deliveryTag_, multiple);
        } else {
            channel->basicNack(deliveryTag_, multiple, requeue);
        }
    } catch (const TransportException& e) {
        spdlog::error("Failed to settle delivery {} on channel {}: {}", deliveryTag_, channel->id(), e.what());
        return Result<void>(ErrorType::AcknowledgementFailed,
                            std::string("An error occurred while ") + action + " the message: " + e.what());
    }

    state_ = target;
    if (multiple && ledger_) {
        ledger_->settleUpTo(deliveryTag_);
    }

    spdlog::debug("Delivery {} on channel {} {} (multiple: {}, requeue: {})",
                  deliveryTag_, channel->id(), deliveryStateToString(target), multiple, requeue);
    return Result<void>();
}

Result<uint64_t> Delivery::getDeliveryTag() const {
    if (deliveryTag_ == UNASSIGNED_DELIVERY_TAG) {
        return Result<uint64_t>(ErrorType::UninitializedTag, "Delivery tag has not been assigned");
    }
    return Result<uint64_t>(deliveryTag_);
}

DeliveryState Delivery::getState() const {
    return state_;
}

bool Delivery::isAutoAck() const {
    return autoAck_;
}

const Message& Delivery::message() const {
    return message_;
}

const std::string& Delivery::getExchange() const {
    return exchange_;
}

const std::string& Delivery::getRoutingKey() const {
    return routingKey_;
}

const std::string& Delivery::getConsumerTag() const {
    return consumerTag_;
}

bool Delivery::isRedelivered() const {
    return redelivered_;
}

} // namespace amqp_channel
