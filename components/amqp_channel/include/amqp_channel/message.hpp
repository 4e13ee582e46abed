#pragma once

#include "amqp_channel/types.hpp"
#include "amqp_channel/xml_document.hpp"
#include <nlohmann/json.hpp>
#include <cstdint>
#include <optional>
#include <string>

namespace amqp_channel {

// Payload and properties of a received message, with decoders for the
// common content types. Decoding never mutates the message.
class Message {
public:
    Message() = default;
    explicit Message(Bytes payload, Properties properties = {});

    // Static factory method for text payloads
    static Message fromText(const std::string& text, Properties properties = {});

    // Decoders
    Result<std::string> asText() const;
    Result<int64_t> asInt() const;
    Result<double> asFloat() const;
    Result<nlohmann::json> asJson() const;
    Result<XmlDocument> asXml() const;
    const Bytes& asBytes() const;

    // Properties
    const Properties& getProperties() const;
    std::optional<std::string> getProperty(const std::string& name) const;
    bool hasProperty(const std::string& name) const;
    std::string getContentType() const;

    // Size information
    size_t size() const;
    bool isEmpty() const;

private:
    Bytes payload_;
    Properties properties_;

    // Validated text with surrounding ASCII whitespace removed
    Result<std::string> numericText(const char* kind) const;
};

// Strict UTF-8 check: rejects overlong forms, surrogates and code points above U+10FFFF
bool isValidUtf8(const uint8_t* data, size_t length);

} // namespace amqp_channel
