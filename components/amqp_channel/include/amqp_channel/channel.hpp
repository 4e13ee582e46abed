// include/amqp_channel/channel.hpp
#pragma once

#include "amqp_channel/types.hpp"
#include "amqp_channel/transport.hpp"
#include "amqp_channel/delivery.hpp"
#include <atomic>
#include <chrono>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <string>
#include <nlohmann/json.hpp>

namespace amqp_channel {

// Channel statistics
struct ChannelStats {
    uint64_t messagesPublished{0};
    uint64_t deliveriesReceived{0};
    uint64_t queuesDeclared{0};
    uint64_t exchangesDeclared{0};
    uint64_t failedOperations{0};
};

// Facade over one transport channel. Every operation reports failure through
// Result and never throws; none of them retry.
class Channel : public std::enable_shared_from_this<Channel> {
public:
    // Opens a new channel on the transport
    static Result<std::shared_ptr<Channel>> open(Transport& transport);

    // Constructor (use Channel::open)
    explicit Channel(std::shared_ptr<TransportChannel> handle);

    // Destructor closes the channel if it is still open
    ~Channel();

    // Non-copyable, non-movable
    Channel(const Channel&) = delete;
    Channel& operator=(const Channel&) = delete;
    Channel(Channel&&) = delete;
    Channel& operator=(Channel&&) = delete;

    // Channel management. Without params the zero-argument transport form is used.
    Result<void> close(const std::optional<CloseParams>& params = std::nullopt);
    Result<void> abort(const std::optional<CloseParams>& params = std::nullopt);
    bool isOpen() const;
    ChannelState getState() const;
    int getChannelId() const;

    // Queue operations. Without a QueueSpec the broker generates the queue name.
    Result<std::string> declareQueue(const std::optional<QueueSpec>& spec = std::nullopt);
    Result<void> deleteQueue(const std::string& queueName);
    Result<void> purgeQueue(const std::string& queueName);

    // Exchange operations
    Result<void> declareExchange(const ExchangeSpec& spec);
    Result<void> deleteExchange(const std::string& exchangeName);

    // Binding operations
    Result<void> bindQueue(const std::string& queueName, const std::string& exchangeName,
                           const std::string& bindingKey);

    // Publishing; text payloads go out as their UTF-8 bytes
    Result<void> publish(const std::string& exchangeName, const std::string& routingKey,
                         const Bytes& payload, const Properties& properties = {});
    Result<void> publish(const std::string& exchangeName, const std::string& routingKey,
                         const std::string& text, const Properties& properties = {});

    // Consuming
    Result<std::string> consume(const std::string& queueName, bool autoAck = false,
                                const std::string& consumerTag = "");
    Result<void> cancel(const std::string& consumerTag);
    Result<std::optional<Delivery>> nextDelivery(std::chrono::milliseconds timeout);
    Result<std::optional<Delivery>> get(const std::string& queueName, bool autoAck = false);

    // Quality of Service
    Result<void> setPrefetch(uint16_t prefetchCount);

    // Statistics
    ChannelStats getStats() const;

private:
    std::shared_ptr<TransportChannel> handle_;
    int channelId_;

    mutable std::mutex mutex_;
    std::atomic<ChannelState> state_;

    // consumer tag -> auto-ack mode, kept after cancel until the channel closes
    std::map<std::string, bool> consumerAckModes_;
    std::shared_ptr<AckLedger> ledger_;

    ChannelStats stats_;

    template<typename T, typename Operation>
    Result<T> execute(ErrorType errorType, const std::string& errorPrefix, Operation&& operation);

    Result<void> shutdown(bool force, const std::optional<CloseParams>& params);
    void recordFailure(const TransportException& e);
    Delivery wrapDelivery(RawDelivery raw, bool autoAck);
};

// Builds close parameters from loosely typed input. Both values must be
// present for the parameterized form; otherwise nullopt selects the
// zero-argument close.
std::optional<CloseParams> closeParamsFrom(const std::optional<int64_t>& code,
                                           const std::optional<std::string>& reason);

// Same rule for JSON values: code must be an integer within the AMQP reply
// code range and reason must be a string.
std::optional<CloseParams> closeParamsFromJson(const nlohmann::json& code, const nlohmann::json& reason);

} // namespace amqp_channel
