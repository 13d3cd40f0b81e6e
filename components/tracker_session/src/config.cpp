/**
 * @file config.cpp
 * @brief Implementation of the configuration utilities
 */

#include "tracker_session/config.hpp"

#include <nlohmann/json.hpp>

#include <algorithm>
#include <cctype>
#include <fstream>

namespace tracker_session {

namespace {

template<typename T>
T getUnsigned(const nlohmann::json& json, const char* key, uint64_t maxValue) {
    const auto& value = json[key];
    if (!value.is_number_integer()) {
        throw ConfigError(std::string("'") + key + "' must be an integer");
    }
    int64_t number = value.get<int64_t>();
    if (number < 0 || static_cast<uint64_t>(number) > maxValue) {
        throw ConfigError(std::string("'") + key + "' out of range: " + std::to_string(number));
    }
    return static_cast<T>(number);
}

std::string toLower(std::string text) {
    std::transform(text.begin(), text.end(), text.begin(),
                   [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return text;
}

} // anonymous namespace

VoidResult validateSessionConfig(const SessionConfig& config) {
    if (config.serverAddress.empty()) {
        return makeErrorResult(ErrorCode::INVALID_CONFIG, "server address is empty");
    }
    if (config.serverPort == 0) {
        return makeErrorResult(ErrorCode::INVALID_CONFIG, "server port is 0");
    }
    if (config.imei.size() != 15 ||
        !std::all_of(config.imei.begin(), config.imei.end(),
                     [](unsigned char c) { return std::isdigit(c) != 0; })) {
        return makeErrorResult(ErrorCode::INVALID_CONFIG,
                               "IMEI must be 15 digits, got '" + config.imei + "'");
    }
    if (config.heartbeatInterval.count() <= 0 || config.locationInterval.count() <= 0) {
        return makeErrorResult(ErrorCode::INVALID_CONFIG, "intervals must be positive");
    }
    if (config.connectTimeout.count() <= 0) {
        return makeErrorResult(ErrorCode::INVALID_CONFIG, "connect timeout must be positive");
    }
    if (config.reconnect.initialDelay.count() <= 0 ||
        config.reconnect.maxDelay < config.reconnect.initialDelay ||
        config.reconnect.multiplier < 1.0) {
        return makeErrorResult(ErrorCode::INVALID_CONFIG, "reconnect policy is inconsistent");
    }
    return makeSuccessResult();
}

TrackerConfig ConfigLoader::loadFromFile(const std::string& filepath) {
    std::ifstream file(filepath);
    if (!file.is_open()) {
        throw ConfigError("Failed to open configuration file: " + filepath);
    }

    nlohmann::json json;
    try {
        file >> json;
    } catch (const nlohmann::json::parse_error& e) {
        throw ConfigError("Failed to parse " + filepath + ": " + e.what());
    }
    return parse(json);
}

TrackerConfig ConfigLoader::parseText(const std::string& text) {
    nlohmann::json json;
    try {
        json = nlohmann::json::parse(text);
    } catch (const nlohmann::json::parse_error& e) {
        throw ConfigError(std::string("Failed to parse JSON: ") + e.what());
    }
    return parse(json);
}

TrackerConfig ConfigLoader::parse(const nlohmann::json& json) {
    TrackerConfig config;

    if (!json.is_object()) {
        throw ConfigError("top level JSON value must be an object");
    }

    try {
        if (json.contains("server")) {
            const auto& serverJson = json["server"];

            if (serverJson.contains("address")) {
                config.session.serverAddress = serverJson["address"].get<std::string>();
            }

            if (serverJson.contains("port")) {
                config.session.serverPort = getUnsigned<uint16_t>(serverJson, "port", 65535);
            }

            if (serverJson.contains("connectTimeoutMs")) {
                config.session.connectTimeout = std::chrono::milliseconds(
                    getUnsigned<int64_t>(serverJson, "connectTimeoutMs", 600000));
            }
        }

        if (json.contains("device")) {
            const auto& deviceJson = json["device"];

            if (deviceJson.contains("imei")) {
                config.session.imei = deviceJson["imei"].get<std::string>();
            }
        }

        if (json.contains("intervals")) {
            const auto& intervalsJson = json["intervals"];

            if (intervalsJson.contains("heartbeatSeconds")) {
                config.session.heartbeatInterval = std::chrono::seconds(
                    getUnsigned<int64_t>(intervalsJson, "heartbeatSeconds", 86400));
            }

            if (intervalsJson.contains("locationSeconds")) {
                config.session.locationInterval = std::chrono::seconds(
                    getUnsigned<int64_t>(intervalsJson, "locationSeconds", 86400));
            }
        }

        if (json.contains("protocol")) {
            const auto& protocolJson = json["protocol"];

            if (protocolJson.contains("checksum")) {
                config.session.frameVariant = parseFrameVariant(protocolJson["checksum"].get<std::string>());
            }
        }

        if (json.contains("reconnect")) {
            const auto& reconnectJson = json["reconnect"];

            if (reconnectJson.contains("initialDelayMs")) {
                config.session.reconnect.initialDelay = std::chrono::milliseconds(
                    getUnsigned<int64_t>(reconnectJson, "initialDelayMs", 3600000));
            }

            if (reconnectJson.contains("maxDelayMs")) {
                config.session.reconnect.maxDelay = std::chrono::milliseconds(
                    getUnsigned<int64_t>(reconnectJson, "maxDelayMs", 3600000));
            }

            if (reconnectJson.contains("multiplier")) {
                config.session.reconnect.multiplier = reconnectJson["multiplier"].get<double>();
            }
        }

        if (json.contains("relay")) {
            const auto& relayJson = json["relay"];

            if (relayJson.contains("type")) {
                config.relay.type = parseRelayType(relayJson["type"].get<std::string>());
            }

            if (relayJson.contains("device")) {
                config.relay.device = relayJson["device"].get<std::string>();
            }

            if (relayJson.contains("baudRate")) {
                config.relay.baudRate = getUnsigned<unsigned int>(relayJson, "baudRate", 4000000);
            }

            if (relayJson.contains("host")) {
                config.relay.host = relayJson["host"].get<std::string>();
            }

            if (relayJson.contains("port")) {
                config.relay.port = getUnsigned<uint16_t>(relayJson, "port", 65535);
            }

            if (relayJson.contains("connectTimeoutMs")) {
                config.relay.connectTimeout = std::chrono::milliseconds(
                    getUnsigned<int64_t>(relayJson, "connectTimeoutMs", 600000));
            }

            if (relayJson.contains("maxAttempts")) {
                config.relay.retry.maxAttempts = getUnsigned<uint32_t>(relayJson, "maxAttempts", 100);
            }

            if (relayJson.contains("backoffMs")) {
                config.relay.retry.backoff = std::chrono::milliseconds(
                    getUnsigned<int64_t>(relayJson, "backoffMs", 600000));
            }

            if (relayJson.contains("settleDelayMs")) {
                config.relay.retry.settleDelay = std::chrono::milliseconds(
                    getUnsigned<int64_t>(relayJson, "settleDelayMs", 600000));
            }
        }

        if (json.contains("position")) {
            const auto& positionJson = json["position"];

            if (positionJson.contains("latitude")) {
                config.latitude = positionJson["latitude"].get<double>();
            }

            if (positionJson.contains("longitude")) {
                config.longitude = positionJson["longitude"].get<double>();
            }
        }

        if (json.contains("logging")) {
            const auto& loggingJson = json["logging"];

            if (loggingJson.contains("level")) {
                config.logLevel = loggingJson["level"].get<std::string>();
            }
        }
    } catch (const nlohmann::json::exception& e) {
        throw ConfigError(e.what());
    }

    return config;
}

gt06_protocol::FrameVariant ConfigLoader::parseFrameVariant(const std::string& name) {
    const std::string lower = toLower(name);
    if (lower == "xor") {
        return gt06_protocol::FrameVariant::XOR;
    }
    if (lower == "crc16" || lower == "crc16x25" || lower == "crc") {
        return gt06_protocol::FrameVariant::CRC16_X25;
    }
    throw ConfigError("unknown checksum variant '" + name + "'");
}

RelayConfig::Type ConfigLoader::parseRelayType(const std::string& name) {
    const std::string lower = toLower(name);
    if (lower == "none" || lower.empty()) {
        return RelayConfig::Type::NONE;
    }
    if (lower == "serial") {
        return RelayConfig::Type::SERIAL;
    }
    if (lower == "tcp") {
        return RelayConfig::Type::TCP;
    }
    throw ConfigError("unknown relay type '" + name + "'");
}

} // namespace tracker_session
