#include <cctype>
#include <iostream>
#include <stdexcept>
#include <string>
#include <vector>

#include "gt06_protocol/builder.hpp"
#include "gt06_protocol/codec.hpp"
#include "gt06_protocol/command.hpp"
#include "gt06_protocol/error.hpp"
#include "gt06_protocol/parser.hpp"
#include "gt06_protocol/protocol.hpp"

using namespace gt06_protocol;

void printPacket(const ServerPacket& packet) {
    std::cout << "=== Packet Details ===" << std::endl;
    std::cout << "Protocol: " << protocolName(packet.getProtocolNumber()) << std::endl;
    std::cout << "Serial: " << packet.getSerialNumber() << std::endl;
    std::cout << "Checksum valid: " << (packet.isChecksumValid() ? "Yes" : "No") << std::endl;
    std::cout << "Payload: " << codec::toHex(packet.getPayload()) << std::endl;

    if (packet.getProtocolNumber() == protocol::protocol_number::COMMAND) {
        Command command = CommandInterpreter::interpret(packet);
        std::cout << "Command text: \"" << command.getRawText() << "\"" << std::endl;
        std::cout << "Relay line: " << command.relayCommand() << std::endl;
    }
    std::cout << std::endl;
}

std::vector<uint8_t> parseHexArgument(const std::string& text) {
    std::vector<uint8_t> bytes;
    std::string digits;
    for (char c : text) {
        if (std::isxdigit(static_cast<unsigned char>(c))) {
            digits += c;
        }
    }
    if (digits.size() % 2 != 0) {
        throw std::invalid_argument("odd number of hex digits");
    }
    for (size_t i = 0; i < digits.size(); i += 2) {
        bytes.push_back(static_cast<uint8_t>(std::stoul(digits.substr(i, 2), nullptr, 16)));
    }
    return bytes;
}

int main(int argc, char* argv[]) {
    std::cout << "GT06 Frame Dump Example" << std::endl;
    std::cout << "=======================" << std::endl;

    try {
        Parser parser;
        std::vector<uint8_t> buffer;

        if (argc > 1) {
            // Decode hex captured from a server, e.g. "78 78 03 80 00 07 ..."
            for (int i = 1; i < argc; ++i) {
                std::vector<uint8_t> chunk = parseHexArgument(argv[i]);
                buffer.insert(buffer.end(), chunk.begin(), chunk.end());
            }
        } else {
            std::cout << "\n1. Building tracker frames..." << std::endl;
            PacketBuilder builder;
            std::string imei = codec::generateImei();
            Frame login = builder.buildLogin(imei);
            std::cout << "Login (" << imei << "): " << codec::toHex(login) << std::endl;

            LocationReport report;
            report.latitude = -23.5505;
            report.longitude = -46.6333;
            report.speedKmh = 42.0;
            report.courseDeg = 180.0;
            Frame location = builder.buildLocation(report);
            std::cout << "Location: " << codec::toHex(location) << std::endl;

            std::cout << "\n2. Parsing them back..." << std::endl;
            buffer.insert(buffer.end(), login.begin(), login.end());
            buffer.insert(buffer.end(), location.begin(), location.end());
        }

        std::vector<ParseIssue> issues;
        for (const auto& packet : parser.extract(buffer, issues)) {
            printPacket(packet);
        }
        for (const auto& issue : issues) {
            std::cout << parseIssueTypeToString(issue.type) << " at " << issue.offset
                      << ": " << issue.message << std::endl;
        }
        if (!buffer.empty()) {
            std::cout << buffer.size() << " trailing bytes wait for more data" << std::endl;
        }

        return 0;
    } catch (const ProtocolError& e) {
        std::cerr << "Protocol error: " << e.what() << std::endl;
        return 1;
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << std::endl;
        return 1;
    }
}
