/**
 * @file config.cpp
 * @brief Implementation of the configuration utilities
 */

#include "amqp_channel/config.hpp"
#include "amqp_channel/channel.hpp"

#include <fstream>
#include <spdlog/spdlog.h>

namespace amqp_channel {

namespace {

template<typename T>
T readValue(const nlohmann::json& json, const char* key) {
    try {
        return json.at(key).get<T>();
    } catch (const nlohmann::json::exception& e) {
        throw ConfigurationException(std::string("Invalid value for '") + key + "': " + e.what());
    }
}

} // namespace

ConnectionConfig ConfigLoader::loadConnectionConfig(const std::string& filepath) {
    nlohmann::json json = loadJsonFromFile(filepath);
    return parseConnectionConfig(json);
}

ConnectionConfig ConfigLoader::parseConnectionConfig(const nlohmann::json& root) {
    ConnectionConfig config;

    const nlohmann::json& json = root.contains("connection") ? root["connection"] : root;
    if (!json.is_object()) {
        throw ConfigurationException("Connection configuration must be a JSON object");
    }

    if (json.contains("host")) {
        config.host = readValue<std::string>(json, "host");
    }

    if (json.contains("port")) {
        config.port = readValue<int>(json, "port");
        if (config.port <= 0 || config.port > 65535) {
            throw ConfigurationException("Port out of range: " + std::to_string(config.port));
        }
    }

    if (json.contains("vhost")) {
        config.vhost = readValue<std::string>(json, "vhost");
    }

    if (json.contains("username")) {
        config.username = readValue<std::string>(json, "username");
    }

    if (json.contains("password")) {
        config.password = readValue<std::string>(json, "password");
    }

    if (json.contains("heartbeatSeconds")) {
        config.heartbeat = std::chrono::seconds(readValue<int>(json, "heartbeatSeconds"));
    }

    if (json.contains("frameMax")) {
        config.frameMax = readValue<uint32_t>(json, "frameMax");
    }

    if (json.contains("channelMax")) {
        config.channelMax = readValue<uint16_t>(json, "channelMax");
    }

    if (json.contains("connectionTimeoutMs")) {
        config.connectionTimeout = std::chrono::milliseconds(readValue<int64_t>(json, "connectionTimeoutMs"));
    }

    if (json.contains("operationTimeoutMs")) {
        config.operationTimeout = std::chrono::milliseconds(readValue<int64_t>(json, "operationTimeoutMs"));
    }

    return config;
}

std::optional<CloseParams> ConfigLoader::parseCloseParams(const nlohmann::json& json) {
    if (!json.contains("close")) {
        return std::nullopt;
    }

    const auto& close = json["close"];
    if (!close.is_object()) {
        spdlog::warn("Ignoring 'close' section that is not an object");
        return std::nullopt;
    }

    static const nlohmann::json missing;
    return closeParamsFromJson(close.contains("code") ? close["code"] : missing,
                               close.contains("reason") ? close["reason"] : missing);
}

nlohmann::json ConfigLoader::loadJsonFromFile(const std::string& filepath) {
    std::ifstream file(filepath);
    if (!file.is_open()) {
        throw ConfigurationException("Failed to open configuration file: " + filepath);
    }

    try {
        nlohmann::json json;
        file >> json;
        return json;
    } catch (const nlohmann::json::exception& e) {
        throw ConfigurationException("Failed to parse JSON from file: " + filepath + " - " + e.what());
    }
}

} // namespace amqp_channel
