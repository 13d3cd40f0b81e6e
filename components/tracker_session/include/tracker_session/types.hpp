#pragma once

#include <cstdint>
#include <chrono>
#include <optional>
#include <stdexcept>
#include <string>

namespace tracker_session {

// IMEI type for device identification
using IMEI = std::string;

// Connection state of a tracker session
enum class SessionState {
    DISCONNECTED,
    CONNECTING,
    CONNECTED,
    LOGGING_IN,
    ONLINE,
    ERROR
};

inline std::string sessionStateToString(SessionState state) {
    switch (state) {
        case SessionState::DISCONNECTED: return "DISCONNECTED";
        case SessionState::CONNECTING:   return "CONNECTING";
        case SessionState::CONNECTED:    return "CONNECTED";
        case SessionState::LOGGING_IN:   return "LOGGING_IN";
        case SessionState::ONLINE:       return "ONLINE";
        case SessionState::ERROR:        return "ERROR";
        default:                         return "UNKNOWN";
    }
}

// Counters for one connect() .. disconnect() lifetime
struct SessionStats {
    uint64_t packetsSent = 0;
    uint64_t packetsReceived = 0;
    uint64_t heartbeatsSent = 0;     // acknowledged by the server
    uint64_t locationsSent = 0;      // acknowledged by the server
    uint64_t commandsReceived = 0;
    uint64_t reconnectAttempts = 0;
    std::optional<std::chrono::system_clock::time_point> connectedSince;
    std::optional<std::chrono::system_clock::time_point> lastActivity;
};

// Kinds of events published to session listeners
enum class SessionEventType {
    STATE_CHANGED,
    PACKET_SENT,
    PACKET_RECEIVED,
    LOGIN_ACCEPTED,
    HEARTBEAT_ACK,
    LOCATION_ACK,
    COMMAND_RECEIVED,
    CHECKSUM_MISMATCH,
    MALFORMED_FRAME,
    CONNECTION_ERROR,
    RELAY_DISPATCH_FAILURE
};

inline std::string sessionEventTypeToString(SessionEventType type) {
    switch (type) {
        case SessionEventType::STATE_CHANGED:          return "STATE_CHANGED";
        case SessionEventType::PACKET_SENT:            return "PACKET_SENT";
        case SessionEventType::PACKET_RECEIVED:        return "PACKET_RECEIVED";
        case SessionEventType::LOGIN_ACCEPTED:         return "LOGIN_ACCEPTED";
        case SessionEventType::HEARTBEAT_ACK:          return "HEARTBEAT_ACK";
        case SessionEventType::LOCATION_ACK:           return "LOCATION_ACK";
        case SessionEventType::COMMAND_RECEIVED:       return "COMMAND_RECEIVED";
        case SessionEventType::CHECKSUM_MISMATCH:      return "CHECKSUM_MISMATCH";
        case SessionEventType::MALFORMED_FRAME:        return "MALFORMED_FRAME";
        case SessionEventType::CONNECTION_ERROR:       return "CONNECTION_ERROR";
        case SessionEventType::RELAY_DISPATCH_FAILURE: return "RELAY_DISPATCH_FAILURE";
        default:                                       return "UNKNOWN";
    }
}

// Structure representing a published session event
struct SessionEvent {
    SessionEventType type = SessionEventType::STATE_CHANGED;
    std::string message;
    std::chrono::system_clock::time_point timestamp = std::chrono::system_clock::now();
};

// Error codes
enum class ErrorCode {
    SUCCESS = 0,
    INVALID_CONFIG = 1,
    CONNECTION_ERROR = 2,
    NOT_ONLINE = 3,
    NO_FIX = 4,
    RELAY_DISPATCH_FAILURE = 5,
    INTERNAL_ERROR = 6
};

// Convert ErrorCode to string
inline std::string errorCodeToString(ErrorCode code) {
    switch (code) {
        case ErrorCode::SUCCESS:                return "SUCCESS";
        case ErrorCode::INVALID_CONFIG:         return "INVALID_CONFIG";
        case ErrorCode::CONNECTION_ERROR:       return "CONNECTION_ERROR";
        case ErrorCode::NOT_ONLINE:             return "NOT_ONLINE";
        case ErrorCode::NO_FIX:                 return "NO_FIX";
        case ErrorCode::RELAY_DISPATCH_FAILURE: return "RELAY_DISPATCH_FAILURE";
        case ErrorCode::INTERNAL_ERROR:         return "INTERNAL_ERROR";
        default:                                return "UNKNOWN_ERROR";
    }
}

// Result structure for operations
template<typename T>
struct Result {
    bool success = false;
    ErrorCode errorCode = ErrorCode::SUCCESS;
    std::string errorMessage;
    T value;

    static Result<T> ok(const T& value) {
        Result<T> result;
        result.success = true;
        result.value = value;
        return result;
    }

    static Result<T> error(ErrorCode code, const std::string& message) {
        Result<T> result;
        result.success = false;
        result.errorCode = code;
        result.errorMessage = message;
        return result;
    }

    explicit operator bool() const {
        return success;
    }
};

// Void result for operations without return value
using VoidResult = Result<bool>;

inline VoidResult makeSuccessResult() {
    return Result<bool>::ok(true);
}

inline VoidResult makeErrorResult(ErrorCode code, const std::string& message) {
    return Result<bool>::error(code, message);
}

/**
 * @brief Thrown by Session::connect() for a configuration that can never work
 */
class InvalidConfigError : public std::runtime_error {
public:
    explicit InvalidConfigError(const std::string& message)
        : std::runtime_error("Invalid session configuration: " + message) {}
};

/**
 * @brief Thrown when a configuration file cannot be read or has wrong types
 */
class ConfigError : public std::runtime_error {
public:
    explicit ConfigError(const std::string& message)
        : std::runtime_error("Configuration error: " + message) {}
};

} // namespace tracker_session
