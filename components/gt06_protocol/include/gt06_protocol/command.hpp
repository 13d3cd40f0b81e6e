#pragma once

#include "gt06_protocol/types.hpp"
#include <cstdint>
#include <string>
#include <utility>

namespace gt06_protocol {

/**
 * @brief Relay action requested by a server command
 */
enum class CommandKind : uint8_t {
    ENGINE_STOP,
    ENGINE_RESUME,
    UNKNOWN
};

inline std::string commandKindToString(CommandKind kind) {
    switch (kind) {
        case CommandKind::ENGINE_STOP: return "ENGINE_STOP";
        case CommandKind::ENGINE_RESUME: return "ENGINE_RESUME";
        case CommandKind::UNKNOWN: return "UNKNOWN";
        default: return "UNKNOWN";
    }
}

/**
 * @brief A server command decoded from a 0x80 packet
 */
class Command {
public:
    Command(std::string rawText, CommandKind kind, uint16_t serialNumber)
        : rawText_(std::move(rawText))
        , kind_(kind)
        , serialNumber_(serialNumber)
    {}

    /**
     * @brief Command text with zero bytes removed and whitespace trimmed
     */
    const std::string& getRawText() const { return rawText_; }
    CommandKind getKind() const { return kind_; }

    /**
     * @brief Serial number of the server frame, echoed by the ACK
     */
    uint16_t getSerialNumber() const { return serialNumber_; }

    /**
     * @brief Line handed to the relay controller
     *
     * ENGINE_STOP / ENGINE_RESUME for recognised commands, the raw text
     * unchanged otherwise.
     */
    std::string relayCommand() const;

private:
    std::string rawText_;
    CommandKind kind_;
    uint16_t serialNumber_;
};

/**
 * @brief Classifies free-form server command text
 *
 * Vendor command formats are not controlled, so matching is by substring
 * on the upper-cased text, first match wins:
 *   1. RELAY with ",1" or "1#"          -> ENGINE_STOP
 *   2. RELAY with ",0" or "0#"          -> ENGINE_RESUME
 *   3. STOP, DESLIGAR or BLOQUEAR       -> ENGINE_STOP
 *   4. START, LIGAR or DESBLOQUEAR      -> ENGINE_RESUME
 *   5. anything else                    -> UNKNOWN
 */
class CommandInterpreter {
public:
    /**
     * @brief Interpret a command packet
     * @param packet Packet with protocol number 0x80
     * @return Decoded command
     * @throws FrameError if the packet is not a command packet
     */
    static Command interpret(const ServerPacket& packet);

    /**
     * @brief Interpret a raw command payload
     * @param payload Zero padded command text
     * @param serialNumber Serial number of the carrying frame
     * @return Decoded command
     */
    static Command interpret(const Bytes& payload, uint16_t serialNumber);

    /**
     * @brief Apply the precedence rules to already decoded text
     */
    static CommandKind classify(const std::string& text);
};

} // namespace gt06_protocol
