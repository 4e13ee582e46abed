#pragma once

#include "amqp_channel/types.hpp"
#include "amqp_channel/channel.hpp"
#include "amqp_channel/delivery.hpp"
#include <atomic>
#include <chrono>
#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <thread>

namespace amqp_channel {

// Consumer configuration
struct ConsumerConfig {
    std::string queueName;
    std::string consumerTag;            // empty: broker generated
    bool autoAck = false;
    uint16_t prefetchCount = 0;         // 0: leave the channel default
    bool requeueOnError = true;         // nack with requeue when the callback throws
    std::chrono::milliseconds pollTimeout{100};
};

// Consumer statistics
struct ConsumerStats {
    uint64_t messagesReceived = 0;
    uint64_t messagesAcknowledged = 0;
    uint64_t messagesRejected = 0;
    uint64_t processingErrors = 0;
    std::chrono::system_clock::time_point consumerStarted;
    std::chrono::system_clock::time_point lastMessageTime;
};

// Callback types. The delivery may be settled inside the callback or moved
// out to settle later.
using DeliveryCallback = std::function<void(Delivery& delivery)>;
using ErrorCallback = std::function<void(ErrorType error, const std::string& message)>;

// Push-style consumer on top of Channel::consume / Channel::nextDelivery
class Consumer {
public:
    Consumer(std::shared_ptr<Channel> channel, const ConsumerConfig& config);
    ~Consumer();

    // Non-copyable
    Consumer(const Consumer&) = delete;
    Consumer& operator=(const Consumer&) = delete;

    // Applies the prefetch count and registers with the broker
    Result<std::string> start(DeliveryCallback callback);

    // Waits for at most one delivery and dispatches it; true if one arrived
    Result<bool> pollOnce();
    Result<bool> pollOnce(std::chrono::milliseconds timeout);

    // Dispatch loop on a background thread until stop()
    Result<void> runInBackground();

    // Stops the loop and cancels the broker-side consumer
    Result<void> stop();

    bool isConsuming() const;
    bool isRunning() const;
    std::string getConsumerTag() const;

    void setErrorCallback(ErrorCallback callback);

    ConsumerStats getStats() const;
    const ConsumerConfig& getConfig() const;

private:
    std::shared_ptr<Channel> channel_;
    ConsumerConfig config_;

    DeliveryCallback callback_;
    ErrorCallback errorCallback_;

    std::atomic<bool> consuming_{false};
    std::atomic<bool> running_{false};
    std::string consumerTag_;
    std::thread worker_;

    mutable std::mutex statsMutex_;
    ConsumerStats stats_;

    void consumerThreadFunc();
    void dispatch(Delivery& delivery);
    void reportError(ErrorType error, const std::string& message);
};

} // namespace amqp_channel
