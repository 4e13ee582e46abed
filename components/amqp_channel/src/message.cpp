#include "amqp_channel/message.hpp"
#include <spdlog/spdlog.h>
#include <cmath>
#include <stdexcept>

namespace amqp_channel {

namespace {

bool isAsciiWhitespace(char c) {
    return c == ' ' || c == '\t' || c == '\n' || c == '\r' || c == '\f' || c == '\v';
}

std::string trimmed(const std::string& text) {
    size_t begin = 0;
    size_t end = text.size();
    while (begin < end && isAsciiWhitespace(text[begin])) {
        ++begin;
    }
    while (end > begin && isAsciiWhitespace(text[end - 1])) {
        --end;
    }
    return text.substr(begin, end - begin);
}

// Decimal integer or float notation only: no hex, inf or nan
bool looksLikeDecimal(const std::string& text, bool allowFraction) {
    if (text.empty()) {
        return false;
    }

    size_t pos = 0;
    if (text[pos] == '+' || text[pos] == '-') {
        ++pos;
    }

    bool digits = false;
    bool seenDot = false;
    bool seenExponent = false;
    for (; pos < text.size(); ++pos) {
        char c = text[pos];
        if (c >= '0' && c <= '9') {
            digits = true;
        } else if (allowFraction && c == '.' && !seenDot && !seenExponent) {
            seenDot = true;
        } else if (allowFraction && (c == 'e' || c == 'E') && digits && !seenExponent) {
            seenExponent = true;
            digits = false;
            if (pos + 1 < text.size() && (text[pos + 1] == '+' || text[pos + 1] == '-')) {
                ++pos;
            }
        } else {
            return false;
        }
    }
    return digits;
}

} // namespace

Message::Message(Bytes payload, Properties properties)
    : payload_(std::move(payload)), properties_(std::move(properties)) {}

Message Message::fromText(const std::string& text, Properties properties) {
    return Message(toBytes(text), std::move(properties));
}

Result<std::string> Message::asText() const {
    if (!isValidUtf8(payload_.data(), payload_.size())) {
        return Result<std::string>(ErrorType::DecodeFailed, "Payload is not valid UTF-8 text");
    }
    return Result<std::string>(std::string(payload_.begin(), payload_.end()));
}

Result<std::string> Message::numericText(const char* kind) const {
    auto text = asText();
    if (!text) {
        return text;
    }

    std::string value = trimmed(text.value);
    if (value.empty()) {
        return Result<std::string>(ErrorType::DecodeFailed,
                                   std::string("Payload is empty, expected ") + kind);
    }
    return Result<std::string>(std::move(value));
}

Result<int64_t> Message::asInt() const {
    auto text = numericText("an integer");
    if (!text) {
        return Result<int64_t>(text.error, text.message);
    }

    if (!looksLikeDecimal(text.value, false)) {
        return Result<int64_t>(ErrorType::DecodeFailed, "Payload is not an integer: '" + text.value + "'");
    }

    try {
        size_t consumed = 0;
        long long value = std::stoll(text.value, &consumed, 10);
        if (consumed != text.value.size()) {
            return Result<int64_t>(ErrorType::DecodeFailed, "Payload is not an integer: '" + text.value + "'");
        }
        return Result<int64_t>(static_cast<int64_t>(value));
    } catch (const std::out_of_range&) {
        return Result<int64_t>(ErrorType::DecodeFailed, "Integer out of range: '" + text.value + "'");
    } catch (const std::invalid_argument&) {
        return Result<int64_t>(ErrorType::DecodeFailed, "Payload is not an integer: '" + text.value + "'");
    }
}

Result<double> Message::asFloat() const {
    auto text = numericText("a number");
    if (!text) {
        return Result<double>(text.error, text.message);
    }

    if (!looksLikeDecimal(text.value, true)) {
        return Result<double>(ErrorType::DecodeFailed, "Payload is not a number: '" + text.value + "'");
    }

    try {
        size_t consumed = 0;
        double value = std::stod(text.value, &consumed);
        if (consumed != text.value.size() || !std::isfinite(value)) {
            return Result<double>(ErrorType::DecodeFailed, "Payload is not a number: '" + text.value + "'");
        }
        return Result<double>(value);
    } catch (const std::out_of_range&) {
        return Result<double>(ErrorType::DecodeFailed, "Number out of range: '" + text.value + "'");
    } catch (const std::invalid_argument&) {
        return Result<double>(ErrorType::DecodeFailed, "Payload is not a number: '" + text.value + "'");
    }
}

Result<nlohmann::json> Message::asJson() const {
    auto text = asText();
    if (!text) {
        return Result<nlohmann::json>(text.error, text.message);
    }

    try {
        return Result<nlohmann::json>(nlohmann::json::parse(text.value));
    } catch (const nlohmann::json::parse_error& e) {
        spdlog::debug("JSON decode failed: {}", e.what());
        return Result<nlohmann::json>(ErrorType::DecodeFailed, std::string("Payload is not valid JSON: ") + e.what());
    }
}

Result<XmlDocument> Message::asXml() const {
    auto text = asText();
    if (!text) {
        return Result<XmlDocument>(text.error, text.message);
    }
    return XmlDocument::parse(text.value);
}

const Bytes& Message::asBytes() const {
    return payload_;
}

const Properties& Message::getProperties() const {
    return properties_;
}

std::optional<std::string> Message::getProperty(const std::string& name) const {
    auto it = properties_.find(name);
    if (it == properties_.end()) {
        return std::nullopt;
    }
    return it->second;
}

bool Message::hasProperty(const std::string& name) const {
    return properties_.count(name) > 0;
}

std::string Message::getContentType() const {
    return getProperty(PropertyNames::CONTENT_TYPE).value_or("");
}

size_t Message::size() const {
    return payload_.size();
}

bool Message::isEmpty() const {
    return payload_.empty();
}

bool isValidUtf8(const uint8_t* data, size_t length) {
    size_t i = 0;
    while (i < length) {
        uint8_t lead = data[i];
        if (lead < 0x80) {
            ++i;
            continue;
        }

        size_t extra = 0;
        uint32_t codePoint = 0;
        uint32_t minimum = 0;
        if ((lead & 0xE0) == 0xC0) {
            extra = 1;
            codePoint = lead & 0x1F;
            minimum = 0x80;
        } else if ((lead & 0xF0) == 0xE0) {
            extra = 2;
            codePoint = lead & 0x0F;
            minimum = 0x800;
        } else if ((lead & 0xF8) == 0xF0) {
            extra = 3;
            codePoint = lead & 0x07;
            minimum = 0x10000;
        } else {
            return false;
        }

        if (i + extra >= length) {
            return false;
        }

        for (size_t k = 1; k <= extra; ++k) {
            uint8_t next = data[i + k];
            if ((next & 0xC0) != 0x80) {
                return false;
            }
            codePoint = (codePoint << 6) | (next & 0x3F);
        }

        if (codePoint < minimum || codePoint > 0x10FFFF ||
            (codePoint >= 0xD800 && codePoint <= 0xDFFF)) {
            return false;
        }
        i += extra + 1;
    }
    return true;
}

} // namespace amqp_channel
