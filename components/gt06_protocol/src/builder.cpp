#include "gt06_protocol/builder.hpp"
#include "gt06_protocol/codec.hpp"
#include "gt06_protocol/error.hpp"
#include "gt06_protocol/protocol.hpp"

#include <algorithm>
#include <cmath>
#include <ctime>

namespace gt06_protocol {

namespace {

// Reserved bytes between speed and course/status in an alarm frame
constexpr size_t ALARM_RESERVED_BYTES = 4;

// Command response payload header: server flag, type, 2-byte text length
constexpr uint8_t RESPONSE_SERVER_FLAG = 0x00;
constexpr uint8_t RESPONSE_TYPE_TEXT = 0x01;
constexpr size_t RESPONSE_HEADER_SIZE = 4;

} // anonymous namespace

PacketBuilder::PacketBuilder(FrameVariant variant)
    : variant_(variant)
{
}

Frame PacketBuilder::buildLogin(const std::string& imei) {
    Bytes payload = codec::imeiToBcd(imei);
    return finishFrame(protocol::protocol_number::LOGIN, payload, serial_.next());
}

Frame PacketBuilder::buildHeartbeat(const HeartbeatStatus& status) {
    uint8_t terminalInfo = protocol::terminal_info::TRACKING_ON;
    if (status.accOn) {
        terminalInfo |= protocol::terminal_info::ACC_ON;
    }
    if (status.gpsPositioned) {
        terminalInfo |= protocol::terminal_info::GPS_POSITIONED;
    }

    Bytes payload;
    payload.reserve(5);
    payload.push_back(terminalInfo);
    payload.push_back(std::min(status.voltageLevel, protocol::MAX_VOLTAGE_LEVEL));
    payload.push_back(std::min(status.gsmSignal, protocol::MAX_GSM_SIGNAL));
    payload.push_back(static_cast<uint8_t>(status.alarm));
    payload.push_back(0x00);

    return finishFrame(protocol::protocol_number::HEARTBEAT, payload, serial_.next());
}

Frame PacketBuilder::buildLocation(const LocationReport& report) {
    Bytes payload;
    payload.reserve(18);
    appendDateTime(payload, report.timestamp);
    payload.push_back(satelliteByte(report.satellites));
    appendPosition(payload, report, false);

    return finishFrame(protocol::protocol_number::LOCATION, payload, serial_.next());
}

Frame PacketBuilder::buildAlarm(AlarmType alarm, const LocationReport& report) {
    Bytes payload;
    payload.reserve(23);
    appendDateTime(payload, report.timestamp);
    payload.push_back(static_cast<uint8_t>(alarm));
    payload.push_back(satelliteByte(report.satellites));
    appendPosition(payload, report, true);

    return finishFrame(protocol::protocol_number::ALARM, payload, serial_.next());
}

Frame PacketBuilder::buildCommandAck(uint16_t serverSerial) const {
    return finishFrame(protocol::protocol_number::COMMAND, Bytes{}, serverSerial);
}

Frame PacketBuilder::buildCommandResponse(const std::string& text) {
    const size_t overhead = protocol::PROTOCOL_FIELD_SIZE + RESPONSE_HEADER_SIZE +
                            protocol::SERIAL_FIELD_SIZE;
    if (text.size() + overhead > protocol::MAX_LENGTH_FIELD) {
        throw FrameError("command response of " + std::to_string(text.size()) +
                         " bytes exceeds " + std::to_string(protocol::MAX_LENGTH_FIELD - overhead));
    }

    Bytes payload;
    payload.reserve(RESPONSE_HEADER_SIZE + text.size());
    payload.push_back(RESPONSE_SERVER_FLAG);
    payload.push_back(RESPONSE_TYPE_TEXT);
    codec::appendUint16(payload, static_cast<uint16_t>(text.size()));
    payload.insert(payload.end(), text.begin(), text.end());

    return finishFrame(protocol::protocol_number::COMMAND_RESPONSE, payload, serial_.next());
}

Frame PacketBuilder::finishFrame(uint8_t protocolNumber, const Bytes& payload, uint16_t serial) const {
    const size_t length = protocol::PROTOCOL_FIELD_SIZE + payload.size() + protocol::SERIAL_FIELD_SIZE;
    if (length > protocol::MAX_LENGTH_FIELD) {
        throw FrameError("payload of " + std::to_string(payload.size()) + " bytes does not fit a short frame");
    }

    Frame frame;
    frame.reserve(protocol::START_MARKER_SIZE + protocol::LENGTH_FIELD_SIZE + length +
                  checksumWidth(variant_) + protocol::STOP_MARKER_SIZE);

    frame.insert(frame.end(), protocol::START_MARKER.begin(), protocol::START_MARKER.end());
    frame.push_back(static_cast<uint8_t>(length));
    frame.push_back(protocolNumber);
    frame.insert(frame.end(), payload.begin(), payload.end());
    codec::appendUint16(frame, serial);

    // Checksum covers length..serial
    const uint8_t* covered = frame.data() + protocol::START_MARKER_SIZE;
    const size_t coveredLength = frame.size() - protocol::START_MARKER_SIZE;
    uint16_t checksum = codec::frameChecksum(variant_, covered, coveredLength);
    if (variant_ == FrameVariant::CRC16_X25) {
        codec::appendUint16(frame, checksum);
    } else {
        frame.push_back(static_cast<uint8_t>(checksum & 0xFF));
    }

    frame.insert(frame.end(), protocol::STOP_MARKER.begin(), protocol::STOP_MARKER.end());
    return frame;
}

void PacketBuilder::appendPosition(Bytes& out, const LocationReport& report, bool withLbsPadding) const {
    codec::appendUint32(out, codec::coordinateToFixedPoint(report.latitude));
    codec::appendUint32(out, codec::coordinateToFixedPoint(report.longitude));
    out.push_back(speedByte(report.speedKmh));
    if (withLbsPadding) {
        out.insert(out.end(), ALARM_RESERVED_BYTES, 0x00);
    }
    codec::appendUint16(out, courseStatus(report));
}

void PacketBuilder::appendDateTime(Bytes& out, std::chrono::system_clock::time_point timestamp) {
    std::time_t seconds = std::chrono::system_clock::to_time_t(timestamp);
    std::tm utc{};
    gmtime_r(&seconds, &utc);

    int year = std::clamp(utc.tm_year + 1900 - 2000, 0, 255);
    out.push_back(static_cast<uint8_t>(year));
    out.push_back(static_cast<uint8_t>(utc.tm_mon + 1));
    out.push_back(static_cast<uint8_t>(utc.tm_mday));
    out.push_back(static_cast<uint8_t>(utc.tm_hour));
    out.push_back(static_cast<uint8_t>(utc.tm_min));
    out.push_back(static_cast<uint8_t>(utc.tm_sec));
}

uint8_t PacketBuilder::satelliteByte(uint8_t satellites) {
    return static_cast<uint8_t>(protocol::SATELLITE_LENGTH_BITS |
                                std::min(satellites, protocol::MAX_SATELLITES));
}

uint8_t PacketBuilder::speedByte(double speedKmh) {
    if (!std::isfinite(speedKmh)) {
        return 0;
    }
    return static_cast<uint8_t>(std::lround(std::clamp(speedKmh, 0.0, 255.0)));
}

uint16_t PacketBuilder::courseStatus(const LocationReport& report) {
    long course = std::isfinite(report.courseDeg) ? std::lround(report.courseDeg) % 360 : 0;
    if (course < 0) {
        course += 360;
    }

    uint16_t word = static_cast<uint16_t>(course) & protocol::course_status::COURSE_MASK;
    if (report.latitude >= 0.0) {
        word |= protocol::course_status::LATITUDE_NORTH;
    }
    if (report.longitude < 0.0) {
        word |= protocol::course_status::LONGITUDE_WEST;
    }
    if (report.gpsValid) {
        word |= protocol::course_status::GPS_POSITIONED;
    }
    if (report.ignition.has_value()) {
        word |= protocol::course_status::IGNITION_PRESENT;
        if (*report.ignition) {
            word |= protocol::course_status::IGNITION_ON;
        }
    }
    return word;
}

} // namespace gt06_protocol
