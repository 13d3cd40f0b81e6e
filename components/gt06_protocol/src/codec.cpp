#include "gt06_protocol/codec.hpp"
#include "gt06_protocol/error.hpp"
#include "gt06_protocol/protocol.hpp"

#include <algorithm>
#include <cctype>
#include <cmath>
#include <iomanip>
#include <random>
#include <sstream>

namespace gt06_protocol {
namespace codec {

namespace {

bool allDigits(const std::string& value) {
    return std::all_of(value.begin(), value.end(),
                       [](unsigned char c) { return std::isdigit(c) != 0; });
}

} // anonymous namespace

Bytes imeiToBcd(const std::string& imei) {
    if (imei.size() != protocol::IMEI_DIGITS) {
        throw InvalidImeiError("expected " + std::to_string(protocol::IMEI_DIGITS) +
                               " digits, got " + std::to_string(imei.size()));
    }
    if (!allDigits(imei)) {
        throw InvalidImeiError("'" + imei + "' contains non-digit characters");
    }

    std::string padded = "0" + imei;

    Bytes result;
    result.reserve(protocol::IMEI_BCD_SIZE);
    for (size_t i = 0; i < padded.size(); i += 2) {
        uint8_t high = static_cast<uint8_t>(padded[i] - '0');
        uint8_t low = static_cast<uint8_t>(padded[i + 1] - '0');
        result.push_back(static_cast<uint8_t>((high << 4) | low));
    }
    return result;
}

std::string bcdToImei(const uint8_t* data, size_t length) {
    std::string digits;
    digits.reserve(length * 2);
    for (size_t i = 0; i < length; ++i) {
        uint8_t high = (data[i] >> 4) & 0x0F;
        uint8_t low = data[i] & 0x0F;
        if (high > 9 || low > 9) {
            throw InvalidImeiError("BCD byte 0x" + toHex(&data[i], 1) + " is not decimal");
        }
        digits += static_cast<char>('0' + high);
        digits += static_cast<char>('0' + low);
    }

    if (digits.size() == protocol::IMEI_DIGITS + 1 && digits.front() == '0') {
        digits.erase(0, 1);
    }
    return digits;
}

std::string bcdToImei(const Bytes& data) {
    return bcdToImei(data.data(), data.size());
}

uint8_t xorChecksum(const uint8_t* data, size_t length) {
    uint8_t checksum = 0;
    for (size_t i = 0; i < length; ++i) {
        checksum ^= data[i];
    }
    return checksum;
}

uint8_t xorChecksum(const Bytes& data) {
    return xorChecksum(data.data(), data.size());
}

uint16_t crc16X25(const uint8_t* data, size_t length) {
    uint16_t crc = 0xFFFF;
    for (size_t i = 0; i < length; ++i) {
        crc ^= data[i];
        for (int bit = 0; bit < 8; ++bit) {
            if (crc & 0x0001) {
                crc = static_cast<uint16_t>((crc >> 1) ^ 0x8408);
            } else {
                crc = static_cast<uint16_t>(crc >> 1);
            }
        }
    }
    return static_cast<uint16_t>(~crc);
}

uint16_t crc16X25(const Bytes& data) {
    return crc16X25(data.data(), data.size());
}

uint16_t frameChecksum(FrameVariant variant, const uint8_t* data, size_t length) {
    if (variant == FrameVariant::CRC16_X25) {
        return crc16X25(data, length);
    }
    return xorChecksum(data, length);
}

uint32_t coordinateToFixedPoint(double degrees) {
    return static_cast<uint32_t>(std::llround(std::fabs(degrees) * protocol::COORDINATE_SCALE));
}

double fixedPointToCoordinate(uint32_t value) {
    return static_cast<double>(value) / protocol::COORDINATE_SCALE;
}

void appendUint16(Bytes& out, uint16_t value) {
    out.push_back(static_cast<uint8_t>((value >> 8) & 0xFF));
    out.push_back(static_cast<uint8_t>(value & 0xFF));
}

void appendUint32(Bytes& out, uint32_t value) {
    out.push_back(static_cast<uint8_t>((value >> 24) & 0xFF));
    out.push_back(static_cast<uint8_t>((value >> 16) & 0xFF));
    out.push_back(static_cast<uint8_t>((value >> 8) & 0xFF));
    out.push_back(static_cast<uint8_t>(value & 0xFF));
}

uint16_t readUint16(const uint8_t* data) {
    return static_cast<uint16_t>((data[0] << 8) | data[1]);
}

uint32_t readUint32(const uint8_t* data) {
    return (static_cast<uint32_t>(data[0]) << 24) |
           (static_cast<uint32_t>(data[1]) << 16) |
           (static_cast<uint32_t>(data[2]) << 8) |
           static_cast<uint32_t>(data[3]);
}

char luhnCheckDigit(const std::string& body) {
    if (!allDigits(body)) {
        throw InvalidImeiError("'" + body + "' contains non-digit characters");
    }

    // Double every second digit counting from the right of the body
    int sum = 0;
    bool doubleIt = true;
    for (auto it = body.rbegin(); it != body.rend(); ++it) {
        int digit = *it - '0';
        if (doubleIt) {
            digit *= 2;
            if (digit > 9) {
                digit -= 9;
            }
        }
        sum += digit;
        doubleIt = !doubleIt;
    }
    return static_cast<char>('0' + (10 - (sum % 10)) % 10);
}

bool isValidImei(const std::string& imei) {
    if (imei.size() != protocol::IMEI_DIGITS || !allDigits(imei)) {
        return false;
    }
    return luhnCheckDigit(imei.substr(0, protocol::IMEI_DIGITS - 1)) == imei.back();
}

std::string generateImei(const std::string& typeAllocationCode) {
    if (typeAllocationCode.size() >= protocol::IMEI_DIGITS - 1 || !allDigits(typeAllocationCode)) {
        throw InvalidImeiError("bad type allocation code '" + typeAllocationCode + "'");
    }

    static thread_local std::mt19937 generator{std::random_device{}()};
    std::uniform_int_distribution<int> digit(0, 9);

    std::string body = typeAllocationCode;
    while (body.size() < protocol::IMEI_DIGITS - 1) {
        body += static_cast<char>('0' + digit(generator));
    }
    return body + luhnCheckDigit(body);
}

std::string toHex(const uint8_t* data, size_t length) {
    std::ostringstream oss;
    oss << std::uppercase << std::hex << std::setfill('0');
    for (size_t i = 0; i < length; ++i) {
        if (i > 0) {
            oss << ' ';
        }
        oss << std::setw(2) << static_cast<int>(data[i]);
    }
    return oss.str();
}

std::string toHex(const Bytes& data) {
    return toHex(data.data(), data.size());
}

} // namespace codec

std::string protocolName(uint8_t protocolNumber) {
    switch (protocolNumber) {
        case protocol::protocol_number::LOGIN: return "LOGIN_ACK";
        case protocol::protocol_number::LOCATION:
        case protocol::protocol_number::LOCATION_EXT: return "LOCATION_ACK";
        case protocol::protocol_number::HEARTBEAT: return "HEARTBEAT_ACK";
        case protocol::protocol_number::ALARM: return "ALARM_ACK";
        case protocol::protocol_number::COMMAND: return "COMMAND";
        case protocol::protocol_number::COMMAND_RESPONSE: return "CMD_RESPONSE";
        case protocol::protocol_number::TIME_REQUEST: return "TIME_REQUEST";
        case protocol::protocol_number::INFO: return "INFO";
        case protocol::protocol_number::STRING: return "STRING";
        default: {
            std::ostringstream oss;
            oss << "UNKNOWN(0x" << std::uppercase << std::hex << std::setw(2)
                << std::setfill('0') << static_cast<int>(protocolNumber) << ")";
            return oss.str();
        }
    }
}

} // namespace gt06_protocol
