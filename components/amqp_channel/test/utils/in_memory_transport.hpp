#pragma once

#include "amqp_channel/transport.hpp"
#include <condition_variable>
#include <deque>
#include <map>
#include <memory>
#include <mutex>
#include <optional>
#include <set>
#include <string>
#include <vector>

namespace amqp_channel {
namespace test {

// A message held by the fake broker
struct StoredMessage {
    std::string exchange;
    std::string routingKey;
    Properties properties;
    Bytes body;
    bool redelivered = false;
};

struct CloseRecord {
    int channelId = 0;
    bool aborted = false;
    bool withParams = false;
    int code = 0;
    std::string reason;
};

// Broker state shared by every channel of one InMemoryTransport
struct BrokerState {
    struct Queue {
        bool durable = false;
        bool exclusive = false;
        bool autoDelete = false;
        int consumers = 0;
        std::deque<StoredMessage> messages;
    };

    struct Binding {
        std::string queue;
        std::string key;
    };

    struct Exchange {
        std::string type;
        bool durable = false;
        bool autoDelete = false;
        bool internal = false;
        std::vector<Binding> bindings;
    };

    struct InjectedFailure {
        FailureCategory category;
        std::string message;
        int replyCode;
    };

    std::mutex mutex;
    std::condition_variable published;

    std::map<std::string, Queue> queues;
    std::map<std::string, Exchange> exchanges;
    std::map<std::string, std::deque<InjectedFailure>> failures;

    std::vector<std::string> calls;
    std::vector<CloseRecord> closes;
    uint64_t generatedNames = 0;
    int nextChannelId = 1;
};

// In-process AMQP broker for tests: default, direct, fanout, topic and
// headers (routes to every binding) exchanges, server-named queues,
// per-channel delivery tags and one-shot failure injection per operation.
class InMemoryTransport : public Transport {
public:
    InMemoryTransport();

    std::shared_ptr<TransportChannel> createChannel() override;

    // The next call of the named operation ("queue.declare", "basic.ack", ...)
    // throws. ServerClosed failures also close the channel.
    void failNext(const std::string& operation, FailureCategory category,
                  const std::string& message = "injected failure", int replyCode = 0);

    bool hasQueue(const std::string& name) const;
    bool hasExchange(const std::string& name) const;
    size_t messageCount(const std::string& queue) const;
    std::vector<std::string> queueNames() const;

    // Operation names in call order
    std::vector<std::string> calls() const;
    size_t countCalls(const std::string& operation) const;
    std::vector<CloseRecord> closes() const;

private:
    std::shared_ptr<BrokerState> state_;
};

class InMemoryChannel : public TransportChannel {
public:
    InMemoryChannel(std::shared_ptr<BrokerState> state, int channelId);
    ~InMemoryChannel() override;

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
    struct ConsumerEntry {
        std::string queue;
        bool noAck = false;
    };

    struct Unacked {
        std::string queue;
        StoredMessage message;
        bool fromConsumer = false;
    };

    std::shared_ptr<BrokerState> state_;
    int channelId_;
    bool open_ = true;
    uint64_t nextDeliveryTag_ = 1;
    uint16_t prefetch_ = 0;
    std::map<std::string, ConsumerEntry> consumers_;
    std::map<uint64_t, Unacked> unacked_;
    size_t roundRobin_ = 0;

    // All helpers expect state_->mutex to be held
    void begin(const std::string& operation);
    [[noreturn]] void brokerClose(int replyCode, const std::string& text);
    void shutdownLocked();
    void requeueUnacked();
    void cancelLocked(const std::string& consumerTag);
    BrokerState::Queue& requireQueue(const std::string& name);
    std::string generateName(const std::string& prefix);
    size_t consumerUnacked() const;
    RawDelivery deliver(const std::string& queue, const std::string& consumerTag, bool noAck, bool fromConsumer);
    void settle(uint64_t deliveryTag, bool multiple, bool requeue, bool acked);
};

// Topic pattern matching with '*' (one word) and '#' (zero or more words)
bool topicMatches(const std::string& pattern, const std::string& routingKey);

} // namespace test
} // namespace amqp_channel
