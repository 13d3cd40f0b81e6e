#pragma once

#include "gt06_protocol/types.hpp"
#include <cstdint>
#include <string>

namespace gt06_protocol {

/**
 * @brief Outgoing frame serial number
 *
 * Starts at 1 and wraps from 0xFFFF back to 1, never producing 0.
 */
class SerialCounter {
public:
    /**
     * @brief Return the current value and advance the counter
     */
    uint16_t next() {
        uint16_t current = value_;
        value_ = (value_ == 0xFFFF) ? 1 : static_cast<uint16_t>(value_ + 1);
        return current;
    }

    /**
     * @brief Value the next frame will carry
     */
    uint16_t peek() const { return value_; }

    void reset() { value_ = 1; }

private:
    uint16_t value_ = 1;
};

/**
 * @brief Builder for the frames a tracker sends to the server
 *
 * Every build call except buildCommandAck() consumes exactly one serial
 * number. Frames are returned complete, including markers and checksum.
 */
class PacketBuilder {
public:
    /**
     * @brief Construct a builder for a checksum variant
     * @param variant Checksum variant stamped on every frame
     */
    explicit PacketBuilder(FrameVariant variant = FrameVariant::XOR);

    /**
     * @brief Build a login frame (0x01) carrying the BCD IMEI
     * @param imei 15 decimal digits
     * @return Complete frame
     * @throws InvalidImeiError if the IMEI is malformed
     */
    Frame buildLogin(const std::string& imei);

    /**
     * @brief Build a heartbeat / status frame (0x13)
     * @param status Device status, voltage and GSM levels are clamped
     * @return Complete frame
     */
    Frame buildHeartbeat(const HeartbeatStatus& status);

    /**
     * @brief Build a GPS location frame (0x12)
     * @param report Position to encode
     * @return Complete frame
     */
    Frame buildLocation(const LocationReport& report);

    /**
     * @brief Build an alarm frame (0x16)
     * @param alarm Alarm code
     * @param report Position at the time of the alarm
     * @return Complete frame
     */
    Frame buildAlarm(AlarmType alarm, const LocationReport& report);

    /**
     * @brief Build the acknowledgement for a server command (0x80)
     *
     * Echoes the server's serial number and does not touch the counter.
     *
     * @param serverSerial Serial number of the command being acknowledged
     * @return Complete frame with an empty payload
     */
    Frame buildCommandAck(uint16_t serverSerial) const;

    /**
     * @brief Build a textual reply to a server command (0x21)
     * @param text ASCII reply
     * @return Complete frame
     * @throws FrameError if the text does not fit in one frame
     */
    Frame buildCommandResponse(const std::string& text);

    /**
     * @brief Restart the serial numbering at 1
     */
    void resetSerial() { serial_.reset(); }

    const SerialCounter& getSerialCounter() const { return serial_; }
    FrameVariant getVariant() const { return variant_; }

private:
    Frame finishFrame(uint8_t protocolNumber, const Bytes& payload, uint16_t serial) const;
    void appendPosition(Bytes& out, const LocationReport& report, bool withLbsPadding) const;

    static void appendDateTime(Bytes& out, std::chrono::system_clock::time_point timestamp);
    static uint8_t satelliteByte(uint8_t satellites);
    static uint8_t speedByte(double speedKmh);
    static uint16_t courseStatus(const LocationReport& report);

    FrameVariant variant_;
    SerialCounter serial_;
};

} // namespace gt06_protocol
