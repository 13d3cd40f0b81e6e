#include "gt06_protocol/command.hpp"
#include "gt06_protocol/error.hpp"
#include "gt06_protocol/protocol.hpp"

#include <algorithm>
#include <cctype>
#include <initializer_list>

namespace gt06_protocol {

namespace {

std::string trim(const std::string& text) {
    auto notSpace = [](unsigned char c) { return std::isspace(c) == 0; };
    auto begin = std::find_if(text.begin(), text.end(), notSpace);
    auto end = std::find_if(text.rbegin(), text.rend(), notSpace).base();
    return (begin < end) ? std::string(begin, end) : std::string();
}

std::string toUpper(std::string text) {
    std::transform(text.begin(), text.end(), text.begin(),
                   [](unsigned char c) { return static_cast<char>(std::toupper(c)); });
    return text;
}

bool containsAny(const std::string& text, std::initializer_list<const char*> needles) {
    return std::any_of(needles.begin(), needles.end(),
                       [&text](const char* needle) { return text.find(needle) != std::string::npos; });
}

} // anonymous namespace

std::string Command::relayCommand() const {
    switch (kind_) {
        case CommandKind::ENGINE_STOP:
        case CommandKind::ENGINE_RESUME:
            return commandKindToString(kind_);
        default:
            return rawText_;
    }
}

Command CommandInterpreter::interpret(const ServerPacket& packet) {
    if (packet.getProtocolNumber() != protocol::protocol_number::COMMAND) {
        throw FrameError("expected a COMMAND packet, got " + protocolName(packet.getProtocolNumber()));
    }
    return interpret(packet.getPayload(), packet.getSerialNumber());
}

Command CommandInterpreter::interpret(const Bytes& payload, uint16_t serialNumber) {
    std::string text;
    text.reserve(payload.size());
    for (uint8_t byte : payload) {
        if (byte != 0x00) {
            text += static_cast<char>(byte);
        }
    }

    std::string rawText = trim(text);
    CommandKind kind = classify(rawText);
    return Command(std::move(rawText), kind, serialNumber);
}

CommandKind CommandInterpreter::classify(const std::string& text) {
    const std::string upper = toUpper(trim(text));

    if (upper.find("RELAY") != std::string::npos) {
        if (containsAny(upper, {",1", "1#"})) {
            return CommandKind::ENGINE_STOP;
        }
        if (containsAny(upper, {",0", "0#"})) {
            return CommandKind::ENGINE_RESUME;
        }
    }

    if (containsAny(upper, {"STOP", "DESLIGAR", "BLOQUEAR"})) {
        return CommandKind::ENGINE_STOP;
    }
    if (containsAny(upper, {"START", "LIGAR", "DESBLOQUEAR"})) {
        return CommandKind::ENGINE_RESUME;
    }
    return CommandKind::UNKNOWN;
}

} // namespace gt06_protocol
