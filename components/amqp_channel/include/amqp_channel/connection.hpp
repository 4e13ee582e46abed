#pragma once

#include "amqp_channel/config.hpp"
#include "amqp_channel/transport.hpp"
#include <atomic>
#include <deque>
#include <map>
#include <memory>
#include <mutex>
#include <set>
#include <string>
extern "C" {
#include <amqp.h>
}

namespace amqp_channel {

class AmqpTransportChannel;

// rabbitmq-c backed transport. Must be owned by a std::shared_ptr: every
// channel it creates keeps the connection alive.
class AmqpConnection : public Transport, public std::enable_shared_from_this<AmqpConnection> {
public:
    explicit AmqpConnection(const ConnectionConfig& config);
    ~AmqpConnection() override;

    // Non-copyable, non-movable
    AmqpConnection(const AmqpConnection&) = delete;
    AmqpConnection& operator=(const AmqpConnection&) = delete;
    AmqpConnection(AmqpConnection&&) = delete;
    AmqpConnection& operator=(AmqpConnection&&) = delete;

    // Connection management; open() throws TransportException
    void open();
    void close();
    bool isConnected() const;

    std::shared_ptr<TransportChannel> createChannel() override;

    const ConnectionConfig& getConfig() const;

private:
    friend class AmqpTransportChannel;

    ConnectionConfig config_;

    // Guards connection_ and everything read from the socket; rabbitmq-c
    // state is shared by all channels on the connection.
    mutable std::mutex mutex_;
    amqp_connection_state_t connection_ = nullptr;
    amqp_socket_t* socket_ = nullptr;
    std::atomic<bool> connected_{false};

    std::set<int> usedChannels_;
    std::set<int> closedByBroker_;
    int nextChannelId_ = 1;

    // Bumped whenever the rabbitmq-c state is destroyed; channels from an
    // older generation are dead even after a reconnect
    uint64_t generation_ = 0;

    // Deliveries read off the socket on behalf of another channel
    std::map<int, std::deque<RawDelivery>> pendingDeliveries_;

    // Internal methods, called with mutex_ held
    void teardown();
    int allocateChannelId();
    void releaseChannelId(int channelId);
    void checkReply(amqp_rpc_reply_t reply, int channelId, const std::string& context);
    void checkStatus(int status, const std::string& context);
    void confirmBrokerClose(int channelId);
    void ensureConnected(const std::string& context) const;
};

// One AMQP channel on an AmqpConnection
class AmqpTransportChannel : public TransportChannel {
public:
    AmqpTransportChannel(std::shared_ptr<AmqpConnection> connection, int channelId);
    ~AmqpTransportChannel() override;

    int id() const override;

    void close() override;
    void close(int code, const std::string& reason) override;
    void abort() override;
    void abort(int code, const std::string& reason) override;

    std::string queueDeclare() override;
    std::string queueDeclare(const std::string& name, bool durable, bool exclusive,
                             bool autoDelete, const Arguments& arguments) override;
    void exchangeDeclare(const std::string& name, const std::string& type, bool durable,
                         bool autoDelete, bool internal, const Arguments& arguments) override;
    void queueBind(const std::string& queue, const std::string& exchange,
                   const std::string& routingKey) override;
    void queueDelete(const std::string& name) override;
    void exchangeDelete(const std::string& name) override;
    void queuePurge(const std::string& name) override;

    void basicPublish(const std::string& exchange, const std::string& routingKey,
                      const Properties& properties, const Bytes& body) override;

    std::string basicConsume(const std::string& queue, const std::string& consumerTag,
                             bool noAck) override;
    void basicCancel(const std::string& consumerTag) override;
    std::optional<RawDelivery> consumeMessage(std::chrono::milliseconds timeout) override;
    std::optional<RawDelivery> basicGet(const std::string& queue, bool noAck) override;
    void basicQos(uint16_t prefetchCount) override;

    void basicAck(uint64_t deliveryTag, bool multiple) override;
    void basicNack(uint64_t deliveryTag, bool multiple, bool requeue) override;

private:
    std::shared_ptr<AmqpConnection> connection_;
    int channelId_;
    uint64_t generation_;
    std::atomic<bool> open_{true};

    void sendClose(int code, const std::string& reason);
    void forceClose(int code, const std::string& reason);
    void ensureOpen(const std::string& context) const;
};

// Conversions between facade properties and AMQP basic properties / tables
Properties amqpPropertiesToMap(const amqp_basic_properties_t& props);
std::string amqpFieldToString(const amqp_field_value_t& value);

} // namespace amqp_channel
