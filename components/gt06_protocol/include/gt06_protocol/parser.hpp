#pragma once

#include "gt06_protocol/types.hpp"
#include "gt06_protocol/error.hpp"
#include <vector>
#include <cstdint>

namespace gt06_protocol {

/**
 * @brief Incremental parser for the server to tracker byte stream
 *
 * The parser keeps no bytes of its own. The caller owns the receive buffer,
 * appends whatever the socket delivered, and calls extract(); complete frames
 * are removed from the front of the buffer and an incomplete tail is left in
 * place for the next call.
 */
class Parser {
public:
    /**
     * @brief Parser configuration options
     */
    struct Config {
        FrameVariant variant;       ///< Checksum variant expected on every frame
        size_t maxResyncBytes;      ///< Marker-less bytes tolerated before they are dropped

        Config()
            : variant(FrameVariant::XOR)
            , maxResyncBytes(1024)
        {}

        explicit Config(FrameVariant v)
            : variant(v)
            , maxResyncBytes(1024)
        {}
    };

    /**
     * @brief Constructor with configuration
     * @param config Parser configuration options
     */
    explicit Parser(const Config& config = Config{});

    /**
     * @brief Extract every complete frame from the front of a buffer
     *
     * Bytes before a start marker are discarded. A frame whose stop marker
     * does not match is skipped by advancing one byte past its start marker.
     * A frame whose checksum does not verify is still returned.
     *
     * @param buffer Receive buffer, consumed bytes are erased
     * @param issues Problems found while scanning are appended here
     * @return Packets in stream order
     */
    std::vector<ServerPacket> extract(std::vector<uint8_t>& buffer, std::vector<ParseIssue>& issues);

    /**
     * @brief Extract frames, discarding issue details
     */
    std::vector<ServerPacket> extract(std::vector<uint8_t>& buffer);

    FrameVariant getVariant() const { return config_.variant; }

private:
    enum class FrameStatus {
        COMPLETE,
        INCOMPLETE,
        MALFORMED
    };

    FrameStatus decodeAt(const std::vector<uint8_t>& buffer, size_t start,
                         size_t& frameSize, std::vector<ServerPacket>& packets,
                         std::vector<ParseIssue>& issues) const;

    static size_t findStartMarker(const std::vector<uint8_t>& buffer, size_t from);

    Config config_;
};

} // namespace gt06_protocol
