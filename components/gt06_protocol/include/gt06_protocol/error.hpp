#pragma once

#include <cstddef>
#include <stdexcept>
#include <string>

namespace gt06_protocol {

/**
 * @brief Base exception class for all GT06 protocol errors
 */
class ProtocolError : public std::exception {
public:
    explicit ProtocolError(const std::string& message) : message_(message) {}
    const char* what() const noexcept override { return message_.c_str(); }

protected:
    std::string message_;
};

/**
 * @brief Exception thrown when an IMEI is not 15 decimal digits
 */
class InvalidImeiError : public ProtocolError {
public:
    explicit InvalidImeiError(const std::string& message) : ProtocolError("Invalid IMEI: " + message) {}
};

/**
 * @brief Exception thrown when a frame cannot be built or decoded
 */
class FrameError : public ProtocolError {
public:
    explicit FrameError(const std::string& message) : ProtocolError("Frame error: " + message) {}
};

/**
 * @brief Kinds of non-fatal problems found while scanning a byte stream
 */
enum class ParseIssueType {
    CHECKSUM_MISMATCH,  ///< Frame surfaced, checksum did not verify
    MALFORMED_FRAME,    ///< Start marker found but the frame did not close properly
    DISCARDED_BYTES     ///< Bytes dropped while looking for a start marker
};

/**
 * @brief Non-exception record of a stream parsing problem
 */
struct ParseIssue {
    ParseIssueType type;
    std::string message;
    size_t offset;          ///< Offset of the problem in the scanned buffer

    ParseIssue(ParseIssueType t, const std::string& msg, size_t off = 0)
        : type(t), message(msg), offset(off) {}
};

inline std::string parseIssueTypeToString(ParseIssueType type) {
    switch (type) {
        case ParseIssueType::CHECKSUM_MISMATCH: return "CHECKSUM_MISMATCH";
        case ParseIssueType::MALFORMED_FRAME: return "MALFORMED_FRAME";
        case ParseIssueType::DISCARDED_BYTES: return "DISCARDED_BYTES";
        default: return "UNKNOWN";
    }
}

} // namespace gt06_protocol
