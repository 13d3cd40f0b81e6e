/**
 * @file config.hpp
 * @brief Session configuration and JSON configuration loading
 */

#pragma once

#include "tracker_session/types.hpp"
#include "gt06_protocol/types.hpp"
#include "relay_dispatcher/relay_dispatcher.hpp"

#include <nlohmann/json_fwd.hpp>

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>

namespace tracker_session {

/**
 * @brief Capped exponential backoff between reconnect attempts
 */
struct ReconnectConfig {
    std::chrono::milliseconds initialDelay{5000};
    std::chrono::milliseconds maxDelay{60000};
    double multiplier = 2.0;
};

/**
 * @brief Everything a Session needs to reach and log in to the server
 */
struct SessionConfig {
    std::string serverAddress;
    uint16_t serverPort = 5023;
    IMEI imei;
    std::chrono::seconds heartbeatInterval{30};
    std::chrono::seconds locationInterval{10};
    gt06_protocol::FrameVariant frameVariant = gt06_protocol::FrameVariant::XOR;
    std::chrono::milliseconds connectTimeout{15000};
    ReconnectConfig reconnect;
};

/**
 * @brief Check a session configuration
 *
 * @param config Configuration to check
 * @return INVALID_CONFIG with a reason when the configuration can never work
 */
VoidResult validateSessionConfig(const SessionConfig& config);

/**
 * @brief How the relay controller is attached
 */
struct RelayConfig {
    enum class Type {
        NONE,
        SERIAL,
        TCP
    };

    Type type = Type::NONE;
    std::string device = "/dev/ttyUSB0";
    unsigned int baudRate = 9600;
    std::string host = "127.0.0.1";
    uint16_t port = 8888;
    std::chrono::milliseconds connectTimeout{3000};   ///< TCP bridge only
    relay_dispatcher::RetryPolicy retry;
};

/**
 * @brief Complete configuration of the tracker executable
 */
struct TrackerConfig {
    SessionConfig session;
    RelayConfig relay;
    std::optional<double> latitude;     ///< Fixed position, if any
    std::optional<double> longitude;
    std::string logLevel = "info";
};

/**
 * @brief Configuration loading utilities
 */
class ConfigLoader {
public:
    /**
     * @brief Load tracker configuration from a JSON file
     * @param filepath Path to JSON configuration file
     * @return Tracker configuration, defaults for every missing key
     * @throws ConfigError if the file cannot be opened, parsed, or has wrong types
     */
    static TrackerConfig loadFromFile(const std::string& filepath);

    /**
     * @brief Parse tracker configuration from JSON
     * @param json JSON object
     * @return Tracker configuration
     * @throws ConfigError on wrong value types or out of range values
     */
    static TrackerConfig parse(const nlohmann::json& json);

    /**
     * @brief Parse tracker configuration from JSON text
     * @throws ConfigError on malformed JSON
     */
    static TrackerConfig parseText(const std::string& text);

    /**
     * @brief "xor" or "crc16"
     * @throws ConfigError for any other name
     */
    static gt06_protocol::FrameVariant parseFrameVariant(const std::string& name);

    /**
     * @brief "none", "serial" or "tcp"
     * @throws ConfigError for any other name
     */
    static RelayConfig::Type parseRelayType(const std::string& name);
};

} // namespace tracker_session
