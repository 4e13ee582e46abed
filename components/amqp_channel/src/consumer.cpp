#include "amqp_channel/consumer.hpp"
#include <spdlog/spdlog.h>

namespace amqp_channel {

Consumer::Consumer(std::shared_ptr<Channel> channel, const ConsumerConfig& config)
    : channel_(std::move(channel)), config_(config) {
    spdlog::debug("Creating Consumer for queue '{}'", config_.queueName);
}

Consumer::~Consumer() {
    if (consuming_ || running_ || worker_.joinable()) {
        auto result = stop();
        if (!result) {
            spdlog::warn("Consumer for queue '{}' did not stop cleanly: {}", config_.queueName, result.message);
        }
    }
}

Result<std::string> Consumer::start(DeliveryCallback callback) {
    if (consuming_) {
        return Result<std::string>(ErrorType::ConsumeFailed,
                                   "Consumer already started as '" + consumerTag_ + "'");
    }
    if (!callback) {
        return Result<std::string>(ErrorType::ConsumeFailed, "Consumer requires a delivery callback");
    }

    if (config_.prefetchCount > 0) {
        auto qos = channel_->setPrefetch(config_.prefetchCount);
        if (!qos) {
            return Result<std::string>(qos.error, qos.message);
        }
    }

    auto tag = channel_->consume(config_.queueName, config_.autoAck, config_.consumerTag);
    if (!tag) {
        return tag;
    }

    callback_ = std::move(callback);
    consumerTag_ = tag.value;
    consuming_ = true;

    {
        std::lock_guard<std::mutex> lock(statsMutex_);
        stats_ = ConsumerStats{};
        stats_.consumerStarted = std::chrono::system_clock::now();
    }

    spdlog::info("Consumer '{}' started on queue '{}'", consumerTag_, config_.queueName);
    return tag;
}

Result<bool> Consumer::pollOnce() {
    return pollOnce(config_.pollTimeout);
}

Result<bool> Consumer::pollOnce(std::chrono::milliseconds timeout) {
    if (!consuming_) {
        return Result<bool>(ErrorType::ConsumeFailed, "Consumer has not been started");
    }

    auto next = channel_->nextDelivery(timeout);
    if (!next) {
        return Result<bool>(next.error, next.message);
    }

    if (!next.value) {
        return Result<bool>(false);
    }

    dispatch(*next.value);
    return Result<bool>(true);
}

void Consumer::dispatch(Delivery& delivery) {
    {
        std::lock_guard<std::mutex> lock(statsMutex_);
        stats_.messagesReceived++;
        stats_.lastMessageTime = std::chrono::system_clock::now();
    }

    bool failed = false;
    try {
        callback_(delivery);
    } catch (const std::exception& e) {
        failed = true;
        spdlog::error("Error processing delivery from queue '{}': {}", config_.queueName, e.what());
        reportError(ErrorType::ConsumeFailed, e.what());
    }

    if (failed && !config_.autoAck && delivery.getState() == DeliveryState::Unacknowledged) {
        auto nacked = delivery.nack(false, config_.requeueOnError);
        if (!nacked) {
            spdlog::error("Failed to reject delivery after processing error: {}", nacked.message);
            reportError(nacked.error, nacked.message);
        }
    }

    std::lock_guard<std::mutex> lock(statsMutex_);
    if (failed) {
        stats_.processingErrors++;
    }
    switch (delivery.getState()) {
        case DeliveryState::Acknowledged:
            stats_.messagesAcknowledged++;
            break;
        case DeliveryState::Rejected:
            stats_.messagesRejected++;
            break;
        default:
            break;
    }
}

Result<void> Consumer::runInBackground() {
    if (!consuming_) {
        return Result<void>(ErrorType::ConsumeFailed, "Consumer has not been started");
    }
    if (running_) {
        return Result<void>(ErrorType::ConsumeFailed, "Consumer is already running");
    }
    // A previous loop that was stopped from its own callback is still joinable
    if (worker_.joinable()) {
        worker_.join();
    }
    running_ = true;

    worker_ = std::thread(&Consumer::consumerThreadFunc, this);
    return Result<void>();
}

void Consumer::consumerThreadFunc() {
    spdlog::debug("Consumer thread started for queue: {}", config_.queueName);

    while (running_) {
        auto result = pollOnce();
        if (!result) {
            reportError(result.error, result.message);
            if (!channel_->isOpen()) {
                spdlog::error("Consumer '{}' stopping: channel {} is {}", consumerTag_,
                              channel_->getChannelId(), channelStateToString(channel_->getState()));
                break;
            }
        }
    }

    running_ = false;
    spdlog::debug("Consumer thread ended for queue: {}", config_.queueName);
}

Result<void> Consumer::stop() {
    running_ = false;
    // From inside the callback the loop exits on its own once the callback returns
    if (worker_.joinable() && worker_.get_id() != std::this_thread::get_id()) {
        worker_.join();
    }

    if (!consuming_.exchange(false)) {
        return Result<void>();
    }

    if (!channel_->isOpen()) {
        spdlog::debug("Consumer '{}' not cancelled: channel is {}", consumerTag_,
                      channelStateToString(channel_->getState()));
        return Result<void>();
    }

    auto cancelled = channel_->cancel(consumerTag_);
    if (cancelled) {
        spdlog::info("Consumer '{}' stopped", consumerTag_);
    }
    return cancelled;
}

bool Consumer::isConsuming() const {
    return consuming_;
}

bool Consumer::isRunning() const {
    return running_;
}

std::string Consumer::getConsumerTag() const {
    return consumerTag_;
}

void Consumer::setErrorCallback(ErrorCallback callback) {
    errorCallback_ = std::move(callback);
}

void Consumer::reportError(ErrorType error, const std::string& message) {
    if (errorCallback_) {
        errorCallback_(error, message);
    }
}

ConsumerStats Consumer::getStats() const {
    std::lock_guard<std::mutex> lock(statsMutex_);
    return stats_;
}

const ConsumerConfig& Consumer::getConfig() const {
    return config_;
}

} // namespace amqp_channel
