#pragma once

#include <chrono>
#include <cstdint>
#include <optional>
#include <string>
#include <utility>
#include <vector>

namespace gt06_protocol {

/**
 * @brief Raw byte buffer
 */
using Bytes = std::vector<uint8_t>;

/**
 * @brief Complete, ready-to-send GT06 frame
 */
using Frame = std::vector<uint8_t>;

/**
 * @brief Checksum variant carried by a frame
 *
 * Both variants share the same layout; only the checksum width differs.
 */
enum class FrameVariant : uint8_t {
    XOR = 1,        ///< One byte XOR of length..serial
    CRC16_X25 = 2   ///< Two byte CRC16/X25, big-endian
};

/**
 * @brief Width in bytes of the checksum field for a variant
 */
inline size_t checksumWidth(FrameVariant variant) {
    return variant == FrameVariant::CRC16_X25 ? 2 : 1;
}

inline std::string frameVariantToString(FrameVariant variant) {
    switch (variant) {
        case FrameVariant::XOR: return "xor";
        case FrameVariant::CRC16_X25: return "crc16";
        default: return "unknown";
    }
}

/**
 * @brief Alarm codes carried in heartbeat and alarm frames
 */
enum class AlarmType : uint8_t {
    NORMAL = 0x00,
    SOS = 0x01,
    POWER_CUT = 0x02,
    VIBRATION = 0x03,
    GEOFENCE_ENTER = 0x04,
    GEOFENCE_EXIT = 0x05,
    OVERSPEED = 0x06,
    ACC_ON = 0x09,
    ACC_OFF = 0x0A,
    LOW_BATTERY = 0x0E
};

inline std::string alarmTypeToString(AlarmType alarm) {
    switch (alarm) {
        case AlarmType::NORMAL: return "NORMAL";
        case AlarmType::SOS: return "SOS";
        case AlarmType::POWER_CUT: return "POWER_CUT";
        case AlarmType::VIBRATION: return "VIBRATION";
        case AlarmType::GEOFENCE_ENTER: return "GEOFENCE_ENTER";
        case AlarmType::GEOFENCE_EXIT: return "GEOFENCE_EXIT";
        case AlarmType::OVERSPEED: return "OVERSPEED";
        case AlarmType::ACC_ON: return "ACC_ON";
        case AlarmType::ACC_OFF: return "ACC_OFF";
        case AlarmType::LOW_BATTERY: return "LOW_BATTERY";
        default: return "UNKNOWN";
    }
}

/**
 * @brief Device status reported by a heartbeat
 */
struct HeartbeatStatus {
    bool accOn = true;
    bool gpsPositioned = true;
    uint8_t voltageLevel = 4;   ///< 0-6, clamped when encoded
    uint8_t gsmSignal = 4;      ///< 0-4, clamped when encoded
    AlarmType alarm = AlarmType::NORMAL;
};

/**
 * @brief One position report, as encoded into location and alarm frames
 */
struct LocationReport {
    double latitude = 0.0;      ///< Degrees, positive north
    double longitude = 0.0;     ///< Degrees, positive east
    double speedKmh = 0.0;
    double courseDeg = 0.0;
    std::chrono::system_clock::time_point timestamp = std::chrono::system_clock::now();
    uint8_t satellites = 8;
    bool gpsValid = true;
    std::optional<bool> ignition;   ///< Reported only when set
};

/**
 * @brief A frame received from the server
 *
 * Immutable once constructed. A packet whose checksum did not verify is
 * still surfaced with checksumValid() == false.
 */
class ServerPacket {
public:
    ServerPacket(uint8_t protocolNumber, Bytes payload, uint16_t serialNumber,
                 bool checksumValid, Bytes rawFrame)
        : protocolNumber_(protocolNumber)
        , payload_(std::move(payload))
        , serialNumber_(serialNumber)
        , checksumValid_(checksumValid)
        , rawFrame_(std::move(rawFrame))
    {}

    uint8_t getProtocolNumber() const { return protocolNumber_; }
    const Bytes& getPayload() const { return payload_; }
    uint16_t getSerialNumber() const { return serialNumber_; }
    bool isChecksumValid() const { return checksumValid_; }
    const Bytes& getRawFrame() const { return rawFrame_; }

private:
    uint8_t protocolNumber_;
    Bytes payload_;
    uint16_t serialNumber_;
    bool checksumValid_;
    Bytes rawFrame_;
};

/**
 * @brief Human readable name of a protocol number, for logs
 */
std::string protocolName(uint8_t protocolNumber);

} // namespace gt06_protocol
