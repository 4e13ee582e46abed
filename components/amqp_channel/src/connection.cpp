#include "amqp_channel/connection.hpp"
#include <spdlog/spdlog.h>
extern "C" {
#include <amqp_tcp_socket.h>
}
#include <sys/time.h>
#include <algorithm>
#include <vector>

namespace amqp_channel {

namespace {

amqp_bytes_t toAmqpBytes(const std::string& s) {
    amqp_bytes_t ret;
    ret.len = s.size();
    ret.bytes = const_cast<void*>(static_cast<const void*>(s.data()));
    return ret;
}

std::string fromAmqpBytes(const amqp_bytes_t& b) {
    if (b.len == 0 || b.bytes == nullptr) {
        return std::string();
    }
    return std::string(static_cast<const char*>(b.bytes), b.len);
}

timeval toTimeval(std::chrono::milliseconds duration) {
    if (duration.count() < 0) {
        duration = std::chrono::milliseconds(0);
    }
    timeval tv;
    tv.tv_sec = static_cast<time_t>(duration.count() / 1000);
    tv.tv_usec = static_cast<suseconds_t>((duration.count() % 1000) * 1000);
    return tv;
}

bool parseInteger(const std::string& text, int64_t& out) {
    if (text.empty()) {
        return false;
    }
    try {
        size_t consumed = 0;
        long long value = std::stoll(text, &consumed);
        if (consumed != text.size()) {
            return false;
        }
        out = value;
        return true;
    } catch (const std::exception&) {
        return false;
    }
}

amqp_field_value_t toFieldValue(const std::string& value) {
    amqp_field_value_t field;
    int64_t number = 0;
    if (value == "true" || value == "false") {
        field.kind = AMQP_FIELD_KIND_BOOLEAN;
        field.value.boolean = value == "true";
    } else if (parseInteger(value, number)) {
        // x-message-ttl, x-max-length and friends must be sent as integers
        field.kind = AMQP_FIELD_KIND_I64;
        field.value.i64 = number;
    } else {
        field.kind = AMQP_FIELD_KIND_UTF8;
        field.value.bytes = toAmqpBytes(value);
    }
    return field;
}

// Borrowed view of a string map as an AMQP table. The map must outlive it.
class AmqpTable {
public:
    explicit AmqpTable(const Arguments& arguments) {
        entries_.reserve(arguments.size());
        for (const auto& [key, value] : arguments) {
            amqp_table_entry_t entry;
            entry.key = toAmqpBytes(key);
            entry.value = toFieldValue(value);
            entries_.push_back(entry);
        }
        table_.num_entries = static_cast<int>(entries_.size());
        table_.entries = entries_.empty() ? nullptr : entries_.data();
    }

    AmqpTable(const AmqpTable&) = delete;
    AmqpTable& operator=(const AmqpTable&) = delete;

    const amqp_table_t& get() const { return table_; }

private:
    std::vector<amqp_table_entry_t> entries_;
    amqp_table_t table_{};
};

uint64_t parseNumericProperty(const std::string& key, const std::string& value, uint64_t max) {
    int64_t number = 0;
    if (!parseInteger(value, number) || number < 0 || static_cast<uint64_t>(number) > max) {
        throw TransportException("Invalid value '" + value + "' for property " + key,
                                 FailureCategory::Protocol);
    }
    return static_cast<uint64_t>(number);
}

// AMQP basic properties built from a facade property map
class BasicProperties {
public:
    explicit BasicProperties(const Properties& properties) {
        props_._flags = 0;
        for (const auto& [key, value] : properties) {
            if (key == PropertyNames::CONTENT_TYPE) {
                props_._flags |= AMQP_BASIC_CONTENT_TYPE_FLAG;
                props_.content_type = toAmqpBytes(value);
            } else if (key == PropertyNames::CONTENT_ENCODING) {
                props_._flags |= AMQP_BASIC_CONTENT_ENCODING_FLAG;
                props_.content_encoding = toAmqpBytes(value);
            } else if (key == PropertyNames::DELIVERY_MODE) {
                props_._flags |= AMQP_BASIC_DELIVERY_MODE_FLAG;
                props_.delivery_mode = static_cast<uint8_t>(parseNumericProperty(key, value, 2));
            } else if (key == PropertyNames::PRIORITY) {
                props_._flags |= AMQP_BASIC_PRIORITY_FLAG;
                props_.priority = static_cast<uint8_t>(parseNumericProperty(key, value, 255));
            } else if (key == PropertyNames::CORRELATION_ID) {
                props_._flags |= AMQP_BASIC_CORRELATION_ID_FLAG;
                props_.correlation_id = toAmqpBytes(value);
            } else if (key == PropertyNames::REPLY_TO) {
                props_._flags |= AMQP_BASIC_REPLY_TO_FLAG;
                props_.reply_to = toAmqpBytes(value);
            } else if (key == PropertyNames::EXPIRATION) {
                props_._flags |= AMQP_BASIC_EXPIRATION_FLAG;
                props_.expiration = toAmqpBytes(value);
            } else if (key == PropertyNames::MESSAGE_ID) {
                props_._flags |= AMQP_BASIC_MESSAGE_ID_FLAG;
                props_.message_id = toAmqpBytes(value);
            } else if (key == PropertyNames::TIMESTAMP) {
                props_._flags |= AMQP_BASIC_TIMESTAMP_FLAG;
                props_.timestamp = parseNumericProperty(key, value, UINT64_MAX);
            } else if (key == PropertyNames::TYPE) {
                props_._flags |= AMQP_BASIC_TYPE_FLAG;
                props_.type = toAmqpBytes(value);
            } else if (key == PropertyNames::USER_ID) {
                props_._flags |= AMQP_BASIC_USER_ID_FLAG;
                props_.user_id = toAmqpBytes(value);
            } else if (key == PropertyNames::APP_ID) {
                props_._flags |= AMQP_BASIC_APP_ID_FLAG;
                props_.app_id = toAmqpBytes(value);
            } else {
                headers_[key] = value;
            }
        }

        if (!headers_.empty()) {
            headerTable_ = std::make_unique<AmqpTable>(headers_);
            props_._flags |= AMQP_BASIC_HEADERS_FLAG;
            props_.headers = headerTable_->get();
        }
    }

    BasicProperties(const BasicProperties&) = delete;
    BasicProperties& operator=(const BasicProperties&) = delete;

    const amqp_basic_properties_t* get() const { return &props_; }

private:
    amqp_basic_properties_t props_{};
    Properties headers_;
    std::unique_ptr<AmqpTable> headerTable_;
};

RawDelivery envelopeToDelivery(const amqp_envelope_t& envelope) {
    RawDelivery delivery;
    delivery.deliveryTag = envelope.delivery_tag;
    delivery.consumerTag = fromAmqpBytes(envelope.consumer_tag);
    delivery.exchange = fromAmqpBytes(envelope.exchange);
    delivery.routingKey = fromAmqpBytes(envelope.routing_key);
    delivery.redelivered = envelope.redelivered != 0;
    delivery.properties = amqpPropertiesToMap(envelope.message.properties);

    const auto* data = static_cast<const uint8_t*>(envelope.message.body.bytes);
    if (data != nullptr) {
        delivery.body.assign(data, data + envelope.message.body.len);
    }
    return delivery;
}

} // namespace

std::string amqpFieldToString(const amqp_field_value_t& value) {
    switch (value.kind) {
        case AMQP_FIELD_KIND_UTF8:
        case AMQP_FIELD_KIND_BYTES:
            return fromAmqpBytes(value.value.bytes);
        case AMQP_FIELD_KIND_BOOLEAN:
            return value.value.boolean ? "true" : "false";
        case AMQP_FIELD_KIND_I8:
            return std::to_string(value.value.i8);
        case AMQP_FIELD_KIND_U8:
            return std::to_string(value.value.u8);
        case AMQP_FIELD_KIND_I16:
            return std::to_string(value.value.i16);
        case AMQP_FIELD_KIND_U16:
            return std::to_string(value.value.u16);
        case AMQP_FIELD_KIND_I32:
            return std::to_string(value.value.i32);
        case AMQP_FIELD_KIND_U32:
            return std::to_string(value.value.u32);
        case AMQP_FIELD_KIND_I64:
            return std::to_string(value.value.i64);
        case AMQP_FIELD_KIND_U64:
        case AMQP_FIELD_KIND_TIMESTAMP:
            return std::to_string(value.value.u64);
        case AMQP_FIELD_KIND_F32:
            return std::to_string(value.value.f32);
        case AMQP_FIELD_KIND_F64:
            return std::to_string(value.value.f64);
        default:
            return "";
    }
}

Properties amqpPropertiesToMap(const amqp_basic_properties_t& props) {
    Properties map;

    if (props._flags & AMQP_BASIC_HEADERS_FLAG) {
        for (int i = 0; i < props.headers.num_entries; ++i) {
            const auto& entry = props.headers.entries[i];
            map[fromAmqpBytes(entry.key)] = amqpFieldToString(entry.value);
        }
    }

    if (props._flags & AMQP_BASIC_CONTENT_TYPE_FLAG) {
        map[PropertyNames::CONTENT_TYPE] = fromAmqpBytes(props.content_type);
    }
    if (props._flags & AMQP_BASIC_CONTENT_ENCODING_FLAG) {
        map[PropertyNames::CONTENT_ENCODING] = fromAmqpBytes(props.content_encoding);
    }
    if (props._flags & AMQP_BASIC_DELIVERY_MODE_FLAG) {
        map[PropertyNames::DELIVERY_MODE] = std::to_string(props.delivery_mode);
    }
    if (props._flags & AMQP_BASIC_PRIORITY_FLAG) {
        map[PropertyNames::PRIORITY] = std::to_string(props.priority);
    }
    if (props._flags & AMQP_BASIC_CORRELATION_ID_FLAG) {
        map[PropertyNames::CORRELATION_ID] = fromAmqpBytes(props.correlation_id);
    }
    if (props._flags & AMQP_BASIC_REPLY_TO_FLAG) {
        map[PropertyNames::REPLY_TO] = fromAmqpBytes(props.reply_to);
    }
    if (props._flags & AMQP_BASIC_EXPIRATION_FLAG) {
        map[PropertyNames::EXPIRATION] = fromAmqpBytes(props.expiration);
    }
    if (props._flags & AMQP_BASIC_MESSAGE_ID_FLAG) {
        map[PropertyNames::MESSAGE_ID] = fromAmqpBytes(props.message_id);
    }
    if (props._flags & AMQP_BASIC_TIMESTAMP_FLAG) {
        map[PropertyNames::TIMESTAMP] = std::to_string(props.timestamp);
    }
    if (props._flags & AMQP_BASIC_TYPE_FLAG) {
        map[PropertyNames::TYPE] = fromAmqpBytes(props.type);
    }
    if (props._flags & AMQP_BASIC_USER_ID_FLAG) {
        map[PropertyNames::USER_ID] = fromAmqpBytes(props.user_id);
    }
    if (props._flags & AMQP_BASIC_APP_ID_FLAG) {
        map[PropertyNames::APP_ID] = fromAmqpBytes(props.app_id);
    }

    return map;
}

// ---------------------------------------------------------------------------
// AmqpConnection
// ---------------------------------------------------------------------------

AmqpConnection::AmqpConnection(const ConnectionConfig& config)
    : config_(config) {
    spdlog::debug("Creating connection to {}:{}", config_.host, config_.port);
}

AmqpConnection::~AmqpConnection() {
    spdlog::debug("Destroying connection");
    close();
}

void AmqpConnection::open() {
    std::lock_guard<std::mutex> lock(mutex_);

    if (connected_) {
        return;
    }

    if (connection_) {
        spdlog::warn("Discarding lost connection to {}:{} before reconnecting", config_.host, config_.port);
        teardown();
    }

    spdlog::info("Opening connection to {}:{}", config_.host, config_.port);

    connection_ = amqp_new_connection();
    if (!connection_) {
        throw TransportException("Failed to create AMQP connection", FailureCategory::Resource);
    }

    socket_ = amqp_tcp_socket_new(connection_);
    if (!socket_) {
        teardown();
        throw TransportException("Failed to create TCP socket", FailureCategory::Resource);
    }

    timeval connectTimeout = toTimeval(config_.connectionTimeout);
    int status = amqp_socket_open_noblock(socket_, config_.host.c_str(), config_.port, &connectTimeout);
    if (status != AMQP_STATUS_OK) {
        teardown();
        throw TransportException("Failed to open socket to " + config_.host + ":" +
                                 std::to_string(config_.port) + ": " + amqp_error_string2(status),
                                 amqpErrorToFailureCategory(status));
    }

    timeval rpcTimeout = toTimeval(config_.operationTimeout);
    status = amqp_set_rpc_timeout(connection_, &rpcTimeout);
    if (status != AMQP_STATUS_OK) {
        teardown();
        throw TransportException(std::string("Failed to set RPC timeout: ") + amqp_error_string2(status),
                                 amqpErrorToFailureCategory(status));
    }

    amqp_rpc_reply_t reply = amqp_login(connection_,
                                        config_.vhost.c_str(),
                                        config_.channelMax,
                                        static_cast<int>(config_.frameMax),
                                        static_cast<int>(config_.heartbeat.count()),
                                        AMQP_SASL_METHOD_PLAIN,
                                        config_.username.c_str(),
                                        config_.password.c_str());
    try {
        checkReply(reply, 0, "logging in");
    } catch (const TransportException& e) {
        spdlog::error("Login to {}:{} failed: {}", config_.host, config_.port, e.what());
        teardown();
        throw;
    }

    connected_ = true;
    spdlog::info("Connection established to {}:{}", config_.host, config_.port);
}

void AmqpConnection::close() {
    std::lock_guard<std::mutex> lock(mutex_);

    if (!connection_) {
        return;
    }

    spdlog::info("Closing connection to {}:{}", config_.host, config_.port);
    teardown();
}

bool AmqpConnection::isConnected() const {
    return connected_;
}

const ConnectionConfig& AmqpConnection::getConfig() const {
    return config_;
}

std::shared_ptr<TransportChannel> AmqpConnection::createChannel() {
    std::lock_guard<std::mutex> lock(mutex_);

    ensureConnected("creating a channel");

    int channelId = allocateChannelId();
    amqp_channel_open(connection_, static_cast<amqp_channel_t>(channelId));
    try {
        checkReply(amqp_get_rpc_reply(connection_), channelId, "opening channel");
    } catch (const TransportException&) {
        releaseChannelId(channelId);
        throw;
    }

    spdlog::debug("Opened channel {}", channelId);
    return std::make_shared<AmqpTransportChannel>(shared_from_this(), channelId);
}

void AmqpConnection::teardown() {
    if (connection_) {
        if (connected_) {
            amqp_rpc_reply_t reply = amqp_connection_close(connection_, AMQP_REPLY_SUCCESS);
            if (reply.reply_type != AMQP_RESPONSE_NORMAL) {
                spdlog::warn("Connection close was not acknowledged cleanly by {}:{}", config_.host, config_.port);
            }
        }
        int status = amqp_destroy_connection(connection_);
        if (status != AMQP_STATUS_OK) {
            spdlog::warn("Failed to destroy connection: {}", amqp_error_string2(status));
        }
        connection_ = nullptr;
        generation_++;
    }

    socket_ = nullptr; // Socket is owned by connection
    connected_ = false;
    usedChannels_.clear();
    closedByBroker_.clear();
    pendingDeliveries_.clear();
}

int AmqpConnection::allocateChannelId() {
    int maxChannels = config_.channelMax == 0 ? 65535 : config_.channelMax;
    for (int attempt = 0; attempt < maxChannels; ++attempt) {
        int candidate = nextChannelId_;
        nextChannelId_ = nextChannelId_ >= maxChannels ? 1 : nextChannelId_ + 1;
        if (usedChannels_.insert(candidate).second) {
            return candidate;
        }
    }
    throw TransportException("No free channel ids (channel max " + std::to_string(maxChannels) + ")",
                             FailureCategory::Resource);
}

void AmqpConnection::releaseChannelId(int channelId) {
    usedChannels_.erase(channelId);
    closedByBroker_.erase(channelId);
    pendingDeliveries_.erase(channelId);
}

void AmqpConnection::confirmBrokerClose(int channelId) {
    int status;
    if (channelId == 0) {
        amqp_connection_close_ok_t ok{};
        status = amqp_send_method(connection_, 0, AMQP_CONNECTION_CLOSE_OK_METHOD, &ok);
    } else {
        amqp_channel_close_ok_t ok{};
        status = amqp_send_method(connection_, static_cast<amqp_channel_t>(channelId),
                                  AMQP_CHANNEL_CLOSE_OK_METHOD, &ok);
    }
    if (status != AMQP_STATUS_OK) {
        spdlog::warn("Failed to confirm broker close of channel {}: {}", channelId, amqp_error_string2(status));
    }
}

void AmqpConnection::ensureConnected(const std::string& context) const {
    if (!connected_ || !connection_) {
        throw TransportException("connection is not open while " + context, FailureCategory::Closed);
    }
}

void AmqpConnection::checkStatus(int status, const std::string& context) {
    if (status >= 0) {
        return;
    }

    FailureCategory category = amqpErrorToFailureCategory(status);
    if (category == FailureCategory::Closed || category == FailureCategory::Network) {
        connected_ = false;
    }
    throw TransportException(std::string(amqp_error_string2(status)) + " while " + context, category);
}

void AmqpConnection::checkReply(amqp_rpc_reply_t reply, int channelId, const std::string& context) {
    switch (reply.reply_type) {
        case AMQP_RESPONSE_NORMAL:
            return;

        case AMQP_RESPONSE_NONE:
            throw TransportException("missing RPC reply type while " + context, FailureCategory::Protocol);

        case AMQP_RESPONSE_LIBRARY_EXCEPTION:
            checkStatus(reply.library_error, context);
            throw TransportException("library error while " + context, FailureCategory::Protocol);

        case AMQP_RESPONSE_SERVER_EXCEPTION:
            switch (reply.reply.id) {
                case AMQP_CONNECTION_CLOSE_METHOD: {
                    auto* m = static_cast<amqp_connection_close_t*>(reply.reply.decoded);
                    confirmBrokerClose(0);
                    connected_ = false;
                    throw TransportException(fromAmqpBytes(m->reply_text) + " while " + context,
                                             FailureCategory::ServerClosed, m->reply_code);
                }
                case AMQP_CHANNEL_CLOSE_METHOD: {
                    auto* m = static_cast<amqp_channel_close_t*>(reply.reply.decoded);
                    confirmBrokerClose(channelId);
                    closedByBroker_.insert(channelId);
                    throw TransportException(fromAmqpBytes(m->reply_text) + " while " + context,
                                             FailureCategory::ServerClosed, m->reply_code);
                }
                default:
                    throw TransportException("unknown server error [id " + std::to_string(reply.reply.id) +
                                             "] while " + context, FailureCategory::Protocol);
            }

        default:
            throw TransportException("unknown response type while " + context, FailureCategory::Protocol);
    }
}

// ---------------------------------------------------------------------------
// AmqpTransportChannel
// ---------------------------------------------------------------------------

AmqpTransportChannel::AmqpTransportChannel(std::shared_ptr<AmqpConnection> connection, int channelId)
    : connection_(std::move(connection))
    , channelId_(channelId)
    , generation_(connection_->generation_) {
}

AmqpTransportChannel::~AmqpTransportChannel() {
    if (!open_) {
        return;
    }
    try {
        close();
    } catch (const TransportException& e) {
        spdlog::warn("Failed to close channel {} on destruction: {}", channelId_, e.what());
    }
}

int AmqpTransportChannel::id() const {
    return channelId_;
}

void AmqpTransportChannel::ensureOpen(const std::string& context) const {
    if (!open_) {
        throw TransportException("channel " + std::to_string(channelId_) + " is already closed while " + context,
                                 FailureCategory::Closed);
    }
    if (generation_ != connection_->generation_) {
        throw TransportException("channel " + std::to_string(channelId_) + " belongs to a previous connection while " +
                                 context, FailureCategory::Closed);
    }
    connection_->ensureConnected(context);
    if (connection_->closedByBroker_.count(channelId_) != 0) {
        throw TransportException("channel " + std::to_string(channelId_) + " was closed by the broker while " +
                                 context, FailureCategory::ServerClosed);
    }
}

void AmqpTransportChannel::sendClose(int code, const std::string& reason) {
    std::lock_guard<std::mutex> lock(connection_->mutex_);
    if (!open_) {
        throw TransportException("channel " + std::to_string(channelId_) + " is already closed",
                                 FailureCategory::Closed);
    }

    // Whatever the broker answers, this channel number is finished
    open_ = false;
    if (generation_ != connection_->generation_) {
        // The id may already be reused on the new connection
        throw TransportException("channel " + std::to_string(channelId_) + " belongs to a previous connection",
                                 FailureCategory::Closed);
    }
    auto release = [this]() { connection_->releaseChannelId(channelId_); };

    if (connection_->closedByBroker_.count(channelId_) != 0) {
        release();
        throw TransportException("channel " + std::to_string(channelId_) + " was closed by the broker",
                                 FailureCategory::ServerClosed);
    }
    if (!connection_->connected_) {
        release();
        throw TransportException("connection is not open while closing channel", FailureCategory::Closed);
    }

    try {
        if (reason.empty() && code == AMQP_REPLY_SUCCESS) {
            connection_->checkReply(amqp_channel_close(connection_->connection_,
                                                       static_cast<amqp_channel_t>(channelId_), code),
                                    channelId_, "closing channel");
        } else {
            amqp_channel_close_t request;
            request.reply_code = static_cast<uint16_t>(code);
            request.reply_text = toAmqpBytes(reason);
            request.class_id = 0;
            request.method_id = 0;
            amqp_method_number_t replies[2] = {AMQP_CHANNEL_CLOSE_OK_METHOD, 0};
            connection_->checkReply(amqp_simple_rpc(connection_->connection_,
                                                    static_cast<amqp_channel_t>(channelId_),
                                                    AMQP_CHANNEL_CLOSE_METHOD, replies, &request),
                                    channelId_, "closing channel");
        }
    } catch (const TransportException&) {
        release();
        throw;
    }
    release();
}

void AmqpTransportChannel::forceClose(int code, const std::string& reason) {
    try {
        sendClose(code, reason);
    } catch (const TransportException& e) {
        // The broker or socket already dropped the channel; nothing left to tear down
        if (e.getCategory() == FailureCategory::ServerClosed) {
            spdlog::warn("Ignoring broker reply while aborting channel {}: {}", channelId_, e.what());
            return;
        }
        throw;
    }
}

void AmqpTransportChannel::close() {
    sendClose(AMQP_REPLY_SUCCESS, "");
}

void AmqpTransportChannel::close(int code, const std::string& reason) {
    sendClose(code, reason);
}

void AmqpTransportChannel::abort() {
    forceClose(AMQP_REPLY_SUCCESS, "");
}

void AmqpTransportChannel::abort(int code, const std::string& reason) {
    forceClose(code, reason);
}

std::string AmqpTransportChannel::queueDeclare() {
    return queueDeclare("", false, true, true, Arguments{});
}

std::string AmqpTransportChannel::queueDeclare(const std::string& name, bool durable, bool exclusive,
                                               bool autoDelete, const Arguments& arguments) {
    std::lock_guard<std::mutex> lock(connection_->mutex_);
    ensureOpen("declaring queue");

    AmqpTable table(arguments);
    amqp_queue_declare_ok_t* ok = amqp_queue_declare(connection_->connection_,
                                                     static_cast<amqp_channel_t>(channelId_),
                                                     toAmqpBytes(name), 0, durable, exclusive,
                                                     autoDelete, table.get());
    connection_->checkReply(amqp_get_rpc_reply(connection_->connection_), channelId_, "declaring queue");
    if (!ok) {
        throw TransportException("no queue.declare-ok while declaring queue", FailureCategory::Protocol);
    }
    return fromAmqpBytes(ok->queue);
}

void AmqpTransportChannel::exchangeDeclare(const std::string& name, const std::string& type, bool durable,
                                           bool autoDelete, bool internal, const Arguments& arguments) {
    std::lock_guard<std::mutex> lock(connection_->mutex_);
    ensureOpen("declaring exchange");

    AmqpTable table(arguments);
    amqp_exchange_declare(connection_->connection_, static_cast<amqp_channel_t>(channelId_),
                          toAmqpBytes(name), toAmqpBytes(type), 0, durable, autoDelete, internal,
                          table.get());
    connection_->checkReply(amqp_get_rpc_reply(connection_->connection_), channelId_, "declaring exchange");
}

void AmqpTransportChannel::queueBind(const std::string& queue, const std::string& exchange,
                                     const std::string& routingKey) {
    std::lock_guard<std::mutex> lock(connection_->mutex_);
    ensureOpen("binding queue");

    amqp_queue_bind(connection_->connection_, static_cast<amqp_channel_t>(channelId_),
                    toAmqpBytes(queue), toAmqpBytes(exchange), toAmqpBytes(routingKey), amqp_empty_table);
    connection_->checkReply(amqp_get_rpc_reply(connection_->connection_), channelId_, "binding queue");
}

void AmqpTransportChannel::queueDelete(const std::string& name) {
    std::lock_guard<std::mutex> lock(connection_->mutex_);
    ensureOpen("deleting queue");

    amqp_queue_delete(connection_->connection_, static_cast<amqp_channel_t>(channelId_),
                      toAmqpBytes(name), 0, 0);
    connection_->checkReply(amqp_get_rpc_reply(connection_->connection_), channelId_, "deleting queue");
}

void AmqpTransportChannel::exchangeDelete(const std::string& name) {
    std::lock_guard<std::mutex> lock(connection_->mutex_);
    ensureOpen("deleting exchange");

    amqp_exchange_delete(connection_->connection_, static_cast<amqp_channel_t>(channelId_),
                         toAmqpBytes(name), 0);
    connection_->checkReply(amqp_get_rpc_reply(connection_->connection_), channelId_, "deleting exchange");
}

void AmqpTransportChannel::queuePurge(const std::string& name) {
    std::lock_guard<std::mutex> lock(connection_->mutex_);
    ensureOpen("purging queue");

    amqp_queue_purge(connection_->connection_, static_cast<amqp_channel_t>(channelId_), toAmqpBytes(name));
    connection_->checkReply(amqp_get_rpc_reply(connection_->connection_), channelId_, "purging queue");
}

void AmqpTransportChannel::basicPublish(const std::string& exchange, const std::string& routingKey,
                                        const Properties& properties, const Bytes& body) {
    std::lock_guard<std::mutex> lock(connection_->mutex_);
    ensureOpen("doing a basic.publish");

    BasicProperties props(properties);
    amqp_bytes_t payload;
    payload.len = body.size();
    payload.bytes = const_cast<void*>(static_cast<const void*>(body.data()));

    int status = amqp_basic_publish(connection_->connection_, static_cast<amqp_channel_t>(channelId_),
                                    toAmqpBytes(exchange), toAmqpBytes(routingKey), 0, 0,
                                    props.get(), payload);
    connection_->checkStatus(status, "doing a basic.publish");
}

std::string AmqpTransportChannel::basicConsume(const std::string& queue, const std::string& consumerTag,
                                               bool noAck) {
    std::lock_guard<std::mutex> lock(connection_->mutex_);
    ensureOpen("starting consumer");

    amqp_basic_consume_ok_t* ok = amqp_basic_consume(connection_->connection_,
                                                     static_cast<amqp_channel_t>(channelId_),
                                                     toAmqpBytes(queue), toAmqpBytes(consumerTag),
                                                     0, noAck, 0, amqp_empty_table);
    connection_->checkReply(amqp_get_rpc_reply(connection_->connection_), channelId_, "starting consumer");
    if (!ok) {
        throw TransportException("no basic.consume-ok while starting consumer", FailureCategory::Protocol);
    }
    return fromAmqpBytes(ok->consumer_tag);
}

void AmqpTransportChannel::basicCancel(const std::string& consumerTag) {
    std::lock_guard<std::mutex> lock(connection_->mutex_);
    ensureOpen("cancelling consumer");

    amqp_basic_cancel(connection_->connection_, static_cast<amqp_channel_t>(channelId_),
                      toAmqpBytes(consumerTag));
    connection_->checkReply(amqp_get_rpc_reply(connection_->connection_), channelId_, "cancelling consumer");
}

std::optional<RawDelivery> AmqpTransportChannel::consumeMessage(std::chrono::milliseconds timeout) {
    std::lock_guard<std::mutex> lock(connection_->mutex_);
    ensureOpen("consuming a message");

    auto& parked = connection_->pendingDeliveries_[channelId_];
    if (!parked.empty()) {
        RawDelivery delivery = std::move(parked.front());
        parked.pop_front();
        return delivery;
    }

    amqp_connection_state_t state = connection_->connection_;
    const auto deadline = std::chrono::steady_clock::now() + timeout;

    while (true) {
        auto remaining = std::chrono::duration_cast<std::chrono::milliseconds>(
            deadline - std::chrono::steady_clock::now());
        timeval tv = toTimeval(remaining);

        amqp_maybe_release_buffers(state);
        amqp_envelope_t envelope;
        amqp_rpc_reply_t reply = amqp_consume_message(state, &envelope, &tv, 0);

        if (reply.reply_type == AMQP_RESPONSE_LIBRARY_EXCEPTION) {
            if (reply.library_error == AMQP_STATUS_TIMEOUT) {
                return std::nullopt;
            }
            if (reply.library_error == AMQP_STATUS_UNEXPECTED_STATE) {
                // A method other than basic.deliver is waiting on the socket
                amqp_frame_t frame;
                connection_->checkStatus(amqp_simple_wait_frame(state, &frame), "reading a method frame");
                if (frame.frame_type != AMQP_FRAME_METHOD) {
                    continue;
                }
                switch (frame.payload.method.id) {
                    case AMQP_BASIC_RETURN_METHOD: {
                        amqp_message_t message;
                        connection_->checkReply(amqp_read_message(state, frame.channel, &message, 0),
                                                frame.channel, "reading a returned message");
                        spdlog::warn("Dropping message returned by the broker on channel {}", frame.channel);
                        amqp_destroy_message(&message);
                        break;
                    }
                    case AMQP_CHANNEL_CLOSE_METHOD: {
                        auto* m = static_cast<amqp_channel_close_t*>(frame.payload.method.decoded);
                        std::string text = fromAmqpBytes(m->reply_text);
                        int code = m->reply_code;
                        connection_->confirmBrokerClose(frame.channel);
                        connection_->closedByBroker_.insert(frame.channel);
                        if (frame.channel == channelId_) {
                            throw TransportException(text + " while consuming a message",
                                                     FailureCategory::ServerClosed, code);
                        }
                        spdlog::warn("Broker closed channel {}: {}", frame.channel, text);
                        break;
                    }
                    case AMQP_CONNECTION_CLOSE_METHOD: {
                        auto* m = static_cast<amqp_connection_close_t*>(frame.payload.method.decoded);
                        std::string text = fromAmqpBytes(m->reply_text);
                        int code = m->reply_code;
                        connection_->confirmBrokerClose(0);
                        connection_->connected_ = false;
                        throw TransportException(text + " while consuming a message",
                                                 FailureCategory::ServerClosed, code);
                    }
                    default:
                        spdlog::debug("Dropped {} on the floor", amqp_method_name(frame.payload.method.id));
                        break;
                }
                continue;
            }
        }

        connection_->checkReply(reply, channelId_, "consuming a message");

        int channel = envelope.channel;
        RawDelivery delivery = envelopeToDelivery(envelope);
        amqp_destroy_envelope(&envelope);

        if (channel == channelId_) {
            return delivery;
        }

        connection_->pendingDeliveries_[channel].push_back(std::move(delivery));
        if (std::chrono::steady_clock::now() >= deadline) {
            return std::nullopt;
        }
    }
}

std::optional<RawDelivery> AmqpTransportChannel::basicGet(const std::string& queue, bool noAck) {
    std::lock_guard<std::mutex> lock(connection_->mutex_);
    ensureOpen("doing a basic.get");

    amqp_connection_state_t state = connection_->connection_;
    amqp_maybe_release_buffers(state);

    amqp_rpc_reply_t reply = amqp_basic_get(state, static_cast<amqp_channel_t>(channelId_),
                                            toAmqpBytes(queue), noAck);
    connection_->checkReply(reply, channelId_, "doing a basic.get");

    if (reply.reply.id == AMQP_BASIC_GET_EMPTY_METHOD) {
        return std::nullopt;
    }
    if (reply.reply.id != AMQP_BASIC_GET_OK_METHOD) {
        throw TransportException(std::string("Illegal AMQP response. Expected GET_OK or GET_EMPTY, got: ") +
                                 amqp_method_name(reply.reply.id), FailureCategory::Protocol);
    }

    // Copy before amqp_read_message recycles the decoded method
    auto* ok = static_cast<amqp_basic_get_ok_t*>(reply.reply.decoded);
    RawDelivery delivery;
    delivery.deliveryTag = ok->delivery_tag;
    delivery.redelivered = ok->redelivered != 0;
    delivery.exchange = fromAmqpBytes(ok->exchange);
    delivery.routingKey = fromAmqpBytes(ok->routing_key);

    amqp_message_t message;
    connection_->checkReply(amqp_read_message(state, static_cast<amqp_channel_t>(channelId_), &message, 0),
                            channelId_, "reading message content");
    delivery.properties = amqpPropertiesToMap(message.properties);
    const auto* data = static_cast<const uint8_t*>(message.body.bytes);
    if (data != nullptr) {
        delivery.body.assign(data, data + message.body.len);
    }
    amqp_destroy_message(&message);

    return delivery;
}

void AmqpTransportChannel::basicQos(uint16_t prefetchCount) {
    std::lock_guard<std::mutex> lock(connection_->mutex_);
    ensureOpen("setting basic.qos");

    amqp_basic_qos(connection_->connection_, static_cast<amqp_channel_t>(channelId_), 0, prefetchCount, 0);
    connection_->checkReply(amqp_get_rpc_reply(connection_->connection_), channelId_, "setting basic.qos");
}

void AmqpTransportChannel::basicAck(uint64_t deliveryTag, bool multiple) {
    std::lock_guard<std::mutex> lock(connection_->mutex_);
    ensureOpen("doing a basic.ack");

    int status = amqp_basic_ack(connection_->connection_, static_cast<amqp_channel_t>(channelId_),
                                deliveryTag, multiple);
    connection_->checkStatus(status, "doing a basic.ack");
}

void AmqpTransportChannel::basicNack(uint64_t deliveryTag, bool multiple, bool requeue) {
    std::lock_guard<std::mutex> lock(connection_->mutex_);
    ensureOpen("doing a basic.nack");

    int status = amqp_basic_nack(connection_->connection_, static_cast<amqp_channel_t>(channelId_),
                                 deliveryTag, multiple, requeue);
    connection_->checkStatus(status, "doing a basic.nack");
}

} // namespace amqp_channel
