#pragma once

#include "amqp_channel/types.hpp"
#include "amqp_channel/message.hpp"
#include "amqp_channel/transport.hpp"
#include <cstdint>
#include <memory>
#include <mutex>
#include <string>

namespace amqp_channel {

// Tracks "multiple" acknowledgements on one channel so that deliveries
// already settled by a later multiple ack are not settled again.
class AckLedger {
public:
    bool isSettled(uint64_t deliveryTag) const;
    void settleUpTo(uint64_t deliveryTag);

private:
    mutable std::mutex mutex_;
    uint64_t settledUpTo_ = UNASSIGNED_DELIVERY_TAG;
};

// A received message together with the means to settle it. Move-only: the
// right to acknowledge travels with the object, and a moved-from delivery
// reports UninitializedTag.
class Delivery {
public:
    Delivery();
    Delivery(RawDelivery raw, bool autoAck, std::weak_ptr<TransportChannel> channel,
             std::shared_ptr<AckLedger> ledger = nullptr);

    Delivery(Delivery&& other) noexcept;
    Delivery& operator=(Delivery&& other) noexcept;
    Delivery(const Delivery&) = delete;
    Delivery& operator=(const Delivery&) = delete;

    ~Delivery() = default;

    /**
     * @brief Positively acknowledge this delivery
     * @param multiple Also acknowledge every earlier unsettled delivery on the channel
     *
     * Valid only while Unacknowledged. On transport failure the state is left
     * unchanged so the caller may try again.
     */
    Result<void> ack(bool multiple = false);

    /**
     * @brief Negatively acknowledge this delivery
     * @param multiple Also settle every earlier unsettled delivery on the channel
     * @param requeue Ask the broker to requeue instead of discarding
     */
    Result<void> nack(bool multiple = false, bool requeue = true);

    // Single-delivery negative acknowledgement
    Result<void> reject(bool requeue = true);

    Result<uint64_t> getDeliveryTag() const;
    DeliveryState getState() const;
    bool isAutoAck() const;

    const Message& message() const;
    const std::string& getExchange() const;
    const std::string& getRoutingKey() const;
    const std::string& getConsumerTag() const;
    bool isRedelivered() const;

private:
    uint64_t deliveryTag_ = UNASSIGNED_DELIVERY_TAG;
    std::string consumerTag_;
    std::string exchange_;
    std::string routingKey_;
    bool redelivered_ = false;
    bool autoAck_ = false;
    DeliveryState state_ = DeliveryState::Unacknowledged;
    Message message_;
    std::weak_ptr<TransportChannel> channel_;
    std::shared_ptr<AckLedger> ledger_;

    Result<void> checkSettleable() const;
    Result<void> settle(DeliveryState target, bool multiple, bool requeue, const char* action);
    void reset();
};

} // namespace amqp_channel
