/**
 * @file config.hpp
 * @brief Connection settings and their JSON loader
 */

#pragma once

#include "amqp_channel/types.hpp"

#include <chrono>
#include <optional>
#include <string>
#include <nlohmann/json.hpp>

namespace amqp_channel {

// Connection configuration
struct ConnectionConfig {
    std::string host{"localhost"};
    int port{5672};
    std::string vhost{"/"};
    std::string username{"guest"};
    std::string password{"guest"};

    // Negotiated connection tuning
    std::chrono::seconds heartbeat{60};
    uint32_t frameMax{131072};
    uint16_t channelMax{0};

    // Deadlines enforced by the transport
    std::chrono::milliseconds connectionTimeout{std::chrono::seconds(30)};
    std::chrono::milliseconds operationTimeout{std::chrono::seconds(5)};
};

/**
 * @brief Configuration utilities
 */
class ConfigLoader {
public:
    /**
     * @brief Load connection configuration from a JSON file
     * @param filepath Path to JSON configuration file
     * @return Connection configuration
     * @throws ConfigurationException if the file cannot be opened or parsed
     */
    static ConnectionConfig loadConnectionConfig(const std::string& filepath);

    /**
     * @brief Parse connection configuration from JSON
     *
     * Reads the "connection" object when present, otherwise the document
     * root. Keys that are absent keep their defaults.
     *
     * @param json JSON object
     * @return Connection configuration
     * @throws ConfigurationException if a key has the wrong type
     */
    static ConnectionConfig parseConnectionConfig(const nlohmann::json& json);

    /**
     * @brief Parse the optional "close" section ({"code": int, "reason": string})
     * @param json JSON object
     * @return Close parameters, or nullopt when the section is missing or not well typed
     */
    static std::optional<CloseParams> parseCloseParams(const nlohmann::json& json);

    /**
     * @brief Load a JSON document from file
     * @param filepath Path to JSON file
     * @return Parsed document
     * @throws ConfigurationException if the file cannot be opened or parsed
     */
    static nlohmann::json loadJsonFromFile(const std::string& filepath);
};

} // namespace amqp_channel
