#pragma once

#include "amqp_channel/types.hpp"
#include <chrono>
#include <memory>
#include <optional>
#include <string>

namespace amqp_channel {

// One AMQP channel as seen by the transport. Every method either completes
// or throws TransportException; nothing is retried.
class TransportChannel {
public:
    virtual ~TransportChannel() = default;

    virtual int id() const = 0;

    // Lifecycle
    virtual void close() = 0;
    virtual void close(int code, const std::string& reason) = 0;
    virtual void abort() = 0;
    virtual void abort(int code, const std::string& reason) = 0;

    // Queues and exchanges. Both queueDeclare forms return the name the broker reported.
    virtual std::string queueDeclare() = 0;
    virtual std::string queueDeclare(const std::string& name, bool durable, bool exclusive,
                                     bool autoDelete, const Arguments& arguments) = 0;
    virtual void exchangeDeclare(const std::string& name, const std::string& type, bool durable,
                                 bool autoDelete, bool internal, const Arguments& arguments) = 0;
    virtual void queueBind(const std::string& queue, const std::string& exchange,
                           const std::string& routingKey) = 0;
    virtual void queueDelete(const std::string& name) = 0;
    virtual void exchangeDelete(const std::string& name) = 0;
    virtual void queuePurge(const std::string& name) = 0;

    // Publishing
    virtual void basicPublish(const std::string& exchange, const std::string& routingKey,
                              const Properties& properties, const Bytes& body) = 0;

    // Consuming
    virtual std::string basicConsume(const std::string& queue, const std::string& consumerTag,
                                     bool noAck) = 0;
    virtual void basicCancel(const std::string& consumerTag) = 0;
    virtual std::optional<RawDelivery> consumeMessage(std::chrono::milliseconds timeout) = 0;
    virtual std::optional<RawDelivery> basicGet(const std::string& queue, bool noAck) = 0;
    virtual void basicQos(uint16_t prefetchCount) = 0;

    // Acknowledgement
    virtual void basicAck(uint64_t deliveryTag, bool multiple) = 0;
    virtual void basicNack(uint64_t deliveryTag, bool multiple, bool requeue) = 0;
};

// Owner of the physical connection
class Transport {
public:
    virtual ~Transport() = default;

    virtual std::shared_ptr<TransportChannel> createChannel() = 0;
};

} // namespace amqp_channel
