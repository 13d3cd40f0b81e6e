#include "gt06_protocol/parser.hpp"
#include "gt06_protocol/codec.hpp"
#include "gt06_protocol/protocol.hpp"

#include <cstddef>
#include <string>

namespace gt06_protocol {

namespace {

constexpr size_t NOT_FOUND = static_cast<size_t>(-1);

// Start marker + length byte
constexpr size_t FRAME_HEADER_SIZE = protocol::START_MARKER_SIZE + protocol::LENGTH_FIELD_SIZE;

// Smallest legal value of the length field: protocol number + serial
constexpr size_t MIN_LENGTH_FIELD = protocol::PROTOCOL_FIELD_SIZE + protocol::SERIAL_FIELD_SIZE;

} // anonymous namespace

Parser::Parser(const Config& config) : config_(config) {
}

std::vector<ServerPacket> Parser::extract(std::vector<uint8_t>& buffer) {
    std::vector<ParseIssue> issues;
    return extract(buffer, issues);
}

std::vector<ServerPacket> Parser::extract(std::vector<uint8_t>& buffer, std::vector<ParseIssue>& issues) {
    std::vector<ServerPacket> packets;
    size_t position = 0;

    while (position < buffer.size()) {
        size_t start = findStartMarker(buffer, position);

        if (start == NOT_FOUND) {
            size_t remaining = buffer.size() - position;
            if (remaining > config_.maxResyncBytes) {
                // Keep the last byte, it may be the first half of a split marker
                issues.emplace_back(ParseIssueType::DISCARDED_BYTES,
                                    "no start marker in " + std::to_string(remaining) + " bytes",
                                    position);
                position += remaining - 1;
            }
            break;
        }

        if (start > position) {
            issues.emplace_back(ParseIssueType::DISCARDED_BYTES,
                                std::to_string(start - position) + " bytes before start marker",
                                position);
            position = start;
        }

        size_t frameSize = 0;
        FrameStatus status = decodeAt(buffer, start, frameSize, packets, issues);

        if (status == FrameStatus::INCOMPLETE) {
            break;
        }
        if (status == FrameStatus::MALFORMED) {
            position = start + 1;
            continue;
        }
        position = start + frameSize;
    }

    buffer.erase(buffer.begin(), buffer.begin() + static_cast<std::ptrdiff_t>(position));
    return packets;
}

Parser::FrameStatus Parser::decodeAt(const std::vector<uint8_t>& buffer, size_t start,
                                     size_t& frameSize, std::vector<ServerPacket>& packets,
                                     std::vector<ParseIssue>& issues) const {
    const size_t available = buffer.size() - start;
    if (available < FRAME_HEADER_SIZE) {
        return FrameStatus::INCOMPLETE;
    }

    const uint8_t* frame = buffer.data() + start;
    const size_t length = frame[protocol::START_MARKER_SIZE];
    if (length < MIN_LENGTH_FIELD) {
        issues.emplace_back(ParseIssueType::MALFORMED_FRAME,
                            "length field " + std::to_string(length) + " is too small", start);
        return FrameStatus::MALFORMED;
    }

    const size_t checksumSize = checksumWidth(config_.variant);
    frameSize = FRAME_HEADER_SIZE + length + checksumSize + protocol::STOP_MARKER_SIZE;
    if (available < frameSize) {
        return FrameStatus::INCOMPLETE;
    }

    const size_t stopOffset = frameSize - protocol::STOP_MARKER_SIZE;
    if (frame[stopOffset] != protocol::STOP_MARKER[0] || frame[stopOffset + 1] != protocol::STOP_MARKER[1]) {
        issues.emplace_back(ParseIssueType::MALFORMED_FRAME,
                            "missing stop marker at offset " + std::to_string(start + stopOffset), start);
        return FrameStatus::MALFORMED;
    }

    const size_t bodyOffset = FRAME_HEADER_SIZE;
    const size_t serialOffset = bodyOffset + length - protocol::SERIAL_FIELD_SIZE;
    const size_t checksumOffset = bodyOffset + length;

    uint8_t protocolNumber = frame[bodyOffset];
    Bytes payload(frame + bodyOffset + protocol::PROTOCOL_FIELD_SIZE, frame + serialOffset);
    uint16_t serialNumber = codec::readUint16(frame + serialOffset);

    // Checksum covers length..serial
    uint16_t expected = codec::frameChecksum(config_.variant, frame + protocol::START_MARKER_SIZE,
                                             protocol::LENGTH_FIELD_SIZE + length);
    uint16_t received = (checksumSize == 2) ? codec::readUint16(frame + checksumOffset)
                                            : frame[checksumOffset];
    bool checksumValid = (expected == received);

    if (!checksumValid) {
        issues.emplace_back(ParseIssueType::CHECKSUM_MISMATCH,
                            protocolName(protocolNumber) + " serial " + std::to_string(serialNumber) +
                            ": checksum expected " + std::to_string(expected) +
                            " got " + std::to_string(received),
                            start);
    }

    packets.emplace_back(protocolNumber, std::move(payload), serialNumber, checksumValid,
                         Bytes(frame, frame + frameSize));
    return FrameStatus::COMPLETE;
}

size_t Parser::findStartMarker(const std::vector<uint8_t>& buffer, size_t from) {
    for (size_t i = from; i + 1 < buffer.size(); ++i) {
        if (buffer[i] == protocol::START_MARKER[0] && buffer[i + 1] == protocol::START_MARKER[1]) {
            return i;
        }
    }
    return NOT_FOUND;
}

} // namespace gt06_protocol
