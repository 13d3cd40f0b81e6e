#pragma once

#include "gt06_protocol/types.hpp"
#include <cstdint>
#include <string>

namespace gt06_protocol {

/**
 * @brief Low level encoding helpers shared by the builder and the parser
 */
namespace codec {

/**
 * @brief Pack an IMEI into 8 BCD bytes
 *
 * A single '0' is prepended and the 16 digits are packed two per byte,
 * high nibble first.
 *
 * @param imei Exactly 15 decimal digits
 * @return 8 byte BCD representation
 * @throws InvalidImeiError if the length is not 15 or a character is not a digit
 */
Bytes imeiToBcd(const std::string& imei);

/**
 * @brief Unpack BCD bytes into a digit string
 *
 * A single leading pad zero is removed when 16 digits decode to a
 * 15 digit IMEI.
 *
 * @param data Pointer to BCD bytes
 * @param length Number of bytes
 * @return Decoded digits
 * @throws InvalidImeiError if a nibble is not a decimal digit
 */
std::string bcdToImei(const uint8_t* data, size_t length);
std::string bcdToImei(const Bytes& data);

/**
 * @brief One byte XOR of a byte range
 */
uint8_t xorChecksum(const uint8_t* data, size_t length);
uint8_t xorChecksum(const Bytes& data);

/**
 * @brief CRC16/X25 (reflected 0x1021, init 0xFFFF, final XOR 0xFFFF)
 */
uint16_t crc16X25(const uint8_t* data, size_t length);
uint16_t crc16X25(const Bytes& data);

/**
 * @brief Frame checksum of a byte range for the given variant
 *
 * The XOR variant returns its single byte in the low 8 bits.
 */
uint16_t frameChecksum(FrameVariant variant, const uint8_t* data, size_t length);

/**
 * @brief Encode degrees as the unsigned 32-bit fixed point GT06 value
 *
 * round(|degrees| * 60 * 30000). The hemisphere travels in the
 * course/status word.
 */
uint32_t coordinateToFixedPoint(double degrees);

/**
 * @brief Inverse of coordinateToFixedPoint (magnitude only)
 */
double fixedPointToCoordinate(uint32_t value);

void appendUint16(Bytes& out, uint16_t value);
void appendUint32(Bytes& out, uint32_t value);
uint16_t readUint16(const uint8_t* data);
uint32_t readUint32(const uint8_t* data);

/**
 * @brief Check an IMEI candidate: 15 digits with a valid Luhn check digit
 */
bool isValidImei(const std::string& imei);

/**
 * @brief Luhn check digit for a 14 digit body
 * @throws InvalidImeiError if the body is not all digits
 */
char luhnCheckDigit(const std::string& body);

/**
 * @brief Generate a random, Luhn-valid 15 digit IMEI
 *
 * @param typeAllocationCode 8 digit TAC prefix
 */
std::string generateImei(const std::string& typeAllocationCode = "35963208");

/**
 * @brief Upper case hex dump, bytes separated by spaces
 */
std::string toHex(const uint8_t* data, size_t length);
std::string toHex(const Bytes& data);

} // namespace codec

} // namespace gt06_protocol
