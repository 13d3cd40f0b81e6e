/**
 * @file protocol.hpp
 * @brief GT06 (Concox) wire format constants
 *
 * This file defines the framing and protocol numbers used between a GT06
 * tracker and a Traccar-compatible server.
 */

#pragma once

#include <cstdint>
#include <cstddef>
#include <array>

namespace gt06_protocol {

/**
 * @brief Protocol constants
 */
namespace protocol {

/**
 * @brief Start marker opening every short frame (0x78, 0x78)
 */
constexpr std::array<uint8_t, 2> START_MARKER = {0x78, 0x78};

/**
 * @brief Stop marker closing every frame (0x0D, 0x0A)
 */
constexpr std::array<uint8_t, 2> STOP_MARKER = {0x0D, 0x0A};

constexpr size_t START_MARKER_SIZE = 2;
constexpr size_t LENGTH_FIELD_SIZE = 1;
constexpr size_t PROTOCOL_FIELD_SIZE = 1;
constexpr size_t SERIAL_FIELD_SIZE = 2;
constexpr size_t STOP_MARKER_SIZE = 2;

/**
 * @brief Size of the BCD encoded IMEI in the login payload
 */
constexpr size_t IMEI_BCD_SIZE = 8;

/**
 * @brief Number of decimal digits in an IMEI
 */
constexpr size_t IMEI_DIGITS = 15;

/**
 * @brief Largest value the one byte length field can carry
 */
constexpr size_t MAX_LENGTH_FIELD = 0xFF;

/**
 * @brief Coordinates are sent as minutes * 30000
 */
constexpr double COORDINATE_SCALE = 60.0 * 30000.0;

/**
 * @brief Protocol numbers
 */
namespace protocol_number {
    constexpr uint8_t LOGIN            = 0x01;
    constexpr uint8_t LOCATION         = 0x12;
    constexpr uint8_t HEARTBEAT        = 0x13;
    constexpr uint8_t STRING           = 0x15;
    constexpr uint8_t ALARM            = 0x16;
    constexpr uint8_t COMMAND_RESPONSE = 0x21;
    constexpr uint8_t LOCATION_EXT     = 0x22;
    constexpr uint8_t TIME_REQUEST     = 0x32;
    constexpr uint8_t COMMAND          = 0x80;
    constexpr uint8_t INFO             = 0x98;
}

/**
 * @brief Bit layout of the 16-bit course/status word
 */
namespace course_status {
    constexpr uint16_t COURSE_MASK       = 0x03FF;  ///< bits 0-9, course in degrees
    constexpr uint16_t LATITUDE_NORTH    = 0x0400;  ///< bit 10
    constexpr uint16_t LONGITUDE_WEST    = 0x0800;  ///< bit 11
    constexpr uint16_t GPS_POSITIONED    = 0x1000;  ///< bit 12
    constexpr uint16_t IGNITION_PRESENT  = 0x4000;  ///< bit 14
    constexpr uint16_t IGNITION_ON       = 0x8000;  ///< bit 15
}

/**
 * @brief Bit layout of the heartbeat terminal information byte
 */
namespace terminal_info {
    constexpr uint8_t ACC_ON         = 0x01;
    constexpr uint8_t GPS_POSITIONED = 0x02;
    constexpr uint8_t TRACKING_ON    = 0x40;  ///< always set by this client
}

/**
 * @brief Upper bounds of the heartbeat status levels
 */
constexpr uint8_t MAX_VOLTAGE_LEVEL = 6;
constexpr uint8_t MAX_GSM_SIGNAL = 4;

/**
 * @brief High bits of the satellite byte (GPS information length nibble)
 */
constexpr uint8_t SATELLITE_LENGTH_BITS = 0xC0;
constexpr uint8_t MAX_SATELLITES = 15;

/**
 * @brief GT06 short frame format
 *
 * +--------+--------+----------+-------------+--------+-----------+--------+
 * | Start  | Length | Protocol | Payload     | Serial | Checksum  | Stop   |
 * | 78 78  | (1B)   | (1B)     | (variable)  | (2B)   | (1B / 2B) | 0D 0A  |
 * +--------+--------+----------+-------------+--------+-----------+--------+
 *
 * Length counts protocol + payload + serial. The checksum covers every byte
 * from the length field through the serial number and is either a one byte
 * XOR or a big-endian CRC16/X25, depending on the negotiated variant.
 */

} // namespace protocol

} // namespace gt06_protocol
