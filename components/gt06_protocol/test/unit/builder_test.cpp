#include <gtest/gtest.h>

#include "gt06_protocol/builder.hpp"
#include "gt06_protocol/codec.hpp"
#include "gt06_protocol/error.hpp"
#include "gt06_protocol/protocol.hpp"

#include <chrono>

using namespace gt06_protocol;

namespace {

// 2024-03-15 12:34:56 UTC
std::chrono::system_clock::time_point fixedTime() {
    return std::chrono::system_clock::time_point(std::chrono::seconds(1710506096));
}

LocationReport shenzhenReport() {
    LocationReport report;
    report.latitude = 22.546;
    report.longitude = 114.079;
    report.speedKmh = 60.0;
    report.courseDeg = 90.0;
    report.timestamp = fixedTime();
    report.satellites = 8;
    report.gpsValid = true;
    return report;
}

uint16_t courseStatusOf(const Frame& frame, size_t payloadOffset) {
    return codec::readUint16(frame.data() + payloadOffset);
}

} // anonymous namespace

class PacketBuilderTest : public ::testing::Test {
protected:
    PacketBuilder builder_;
};

TEST_F(PacketBuilderTest, LoginFrameLayout) {
    Frame frame = builder_.buildLogin("123456789012345");
    Frame expected = {0x78, 0x78, 0x0B, 0x01,
                      0x01, 0x23, 0x45, 0x67, 0x89, 0x01, 0x23, 0x45,
                      0x00, 0x01, 0xE5, 0x0D, 0x0A};
    EXPECT_EQ(frame, expected) << codec::toHex(frame);
}

TEST_F(PacketBuilderTest, LoginFrameCrcVariant) {
    PacketBuilder crcBuilder(FrameVariant::CRC16_X25);
    Frame frame = crcBuilder.buildLogin("123456789012345");
    Frame expected = {0x78, 0x78, 0x0B, 0x01,
                      0x01, 0x23, 0x45, 0x67, 0x89, 0x01, 0x23, 0x45,
                      0x00, 0x01, 0x8B, 0x10, 0x0D, 0x0A};
    EXPECT_EQ(frame, expected) << codec::toHex(frame);
}

TEST_F(PacketBuilderTest, LoginRejectsBadImei) {
    EXPECT_THROW(builder_.buildLogin("not-an-imei"), InvalidImeiError);
    EXPECT_THROW(builder_.buildLogin("1234567890123456"), InvalidImeiError);
    EXPECT_THROW(builder_.buildLogin("12345678901234"), InvalidImeiError);
    EXPECT_EQ(builder_.getSerialCounter().peek(), 1);
}

TEST_F(PacketBuilderTest, HeartbeatFrameLayout) {
    builder_.buildLogin("123456789012345");

    HeartbeatStatus status;
    Frame frame = builder_.buildHeartbeat(status);
    Frame expected = {0x78, 0x78, 0x08, 0x13, 0x43, 0x04, 0x04, 0x00, 0x00,
                      0x00, 0x02, 0x5A, 0x0D, 0x0A};
    EXPECT_EQ(frame, expected) << codec::toHex(frame);
}

TEST_F(PacketBuilderTest, HeartbeatClampsLevels) {
    HeartbeatStatus status;
    status.accOn = false;
    status.gpsPositioned = false;
    status.voltageLevel = 200;
    status.gsmSignal = 9;
    status.alarm = AlarmType::SOS;

    Frame frame = builder_.buildHeartbeat(status);
    ASSERT_EQ(frame.size(), 14u);
    EXPECT_EQ(frame[4], protocol::terminal_info::TRACKING_ON);
    EXPECT_EQ(frame[5], protocol::MAX_VOLTAGE_LEVEL);
    EXPECT_EQ(frame[6], protocol::MAX_GSM_SIGNAL);
    EXPECT_EQ(frame[7], 0x01);
    EXPECT_EQ(frame[8], 0x00);
}

TEST_F(PacketBuilderTest, LocationFrameLayout) {
    builder_.buildLogin("123456789012345");
    builder_.buildHeartbeat(HeartbeatStatus{});

    Frame frame = builder_.buildLocation(shenzhenReport());
    Frame expected = {0x78, 0x78, 0x15, 0x12,
                      0x18, 0x03, 0x0F, 0x0C, 0x22, 0x38,
                      0xC8,
                      0x02, 0x6B, 0x3E, 0x90,
                      0x0C, 0x3D, 0x45, 0xF8,
                      0x3C,
                      0x14, 0x5A,
                      0x00, 0x03, 0xF7, 0x0D, 0x0A};
    EXPECT_EQ(frame, expected) << codec::toHex(frame);
}

TEST_F(PacketBuilderTest, LocationHemisphereAndFlags) {
    LocationReport report = shenzhenReport();
    report.latitude = -23.5505;
    report.longitude = -46.6333;
    report.courseDeg = -90.0;
    report.gpsValid = false;
    report.ignition = true;
    report.satellites = 40;

    Frame frame = builder_.buildLocation(report);
    const size_t payload = 4;

    EXPECT_EQ(frame[payload + 6], 0xCF);

    uint16_t word = courseStatusOf(frame, payload + 16);
    EXPECT_EQ(word & protocol::course_status::COURSE_MASK, 270);
    EXPECT_FALSE(word & protocol::course_status::LATITUDE_NORTH);
    EXPECT_TRUE(word & protocol::course_status::LONGITUDE_WEST);
    EXPECT_FALSE(word & protocol::course_status::GPS_POSITIONED);
    EXPECT_TRUE(word & protocol::course_status::IGNITION_PRESENT);
    EXPECT_TRUE(word & protocol::course_status::IGNITION_ON);

    uint32_t latitude = codec::readUint32(frame.data() + payload + 7);
    EXPECT_EQ(latitude, codec::coordinateToFixedPoint(23.5505));
}

TEST_F(PacketBuilderTest, LocationClampsSpeedAndWrapsCourse) {
    LocationReport report = shenzhenReport();
    report.speedKmh = 400.0;
    report.courseDeg = 725.0;

    Frame frame = builder_.buildLocation(report);
    EXPECT_EQ(frame[4 + 15], 255);
    EXPECT_EQ(courseStatusOf(frame, 4 + 16) & protocol::course_status::COURSE_MASK, 5);

    report.speedKmh = -3.0;
    frame = builder_.buildLocation(report);
    EXPECT_EQ(frame[4 + 15], 0);
}

TEST_F(PacketBuilderTest, AlarmFrameLayout) {
    Frame frame = builder_.buildAlarm(AlarmType::SOS, shenzhenReport());

    // protocol + 6 datetime + alarm + satellites + 8 coords + speed + 4 reserved + 2 course + 2 serial
    ASSERT_EQ(frame[2], 0x1A);
    ASSERT_EQ(frame.size(), 2u + 1u + 0x1Au + 1u + 2u);
    EXPECT_EQ(frame[3], protocol::protocol_number::ALARM);
    EXPECT_EQ(frame[4 + 6], 0x01);
    EXPECT_EQ(frame[4 + 7], 0xC8);
    EXPECT_EQ(codec::readUint32(frame.data() + 4 + 8), 40582800u);
    EXPECT_EQ(frame[4 + 16], 60);
    for (size_t i = 17; i < 21; ++i) {
        EXPECT_EQ(frame[4 + i], 0x00) << "reserved byte " << i;
    }
    EXPECT_EQ(courseStatusOf(frame, 4 + 21), 0x145A);

    // Checksum covers length..serial
    size_t checksumOffset = frame.size() - 3;
    EXPECT_EQ(frame[checksumOffset], codec::xorChecksum(frame.data() + 2, checksumOffset - 2));
}

TEST_F(PacketBuilderTest, CommandAckEchoesServerSerial) {
    builder_.buildLogin("123456789012345");

    Frame ack = builder_.buildCommandAck(0x1234);
    Frame expected = {0x78, 0x78, 0x03, 0x80, 0x12, 0x34, 0xA5, 0x0D, 0x0A};
    EXPECT_EQ(ack, expected) << codec::toHex(ack);

    // The ACK does not consume a serial number
    EXPECT_EQ(builder_.getSerialCounter().peek(), 2);
}

TEST_F(PacketBuilderTest, CommandResponseLayout) {
    Frame frame = builder_.buildCommandResponse("OK");
    ASSERT_EQ(frame[2], 1u + 4u + 2u + 2u);
    EXPECT_EQ(frame[3], protocol::protocol_number::COMMAND_RESPONSE);
    EXPECT_EQ(frame[4], 0x00);
    EXPECT_EQ(frame[5], 0x01);
    EXPECT_EQ(codec::readUint16(frame.data() + 6), 2);
    EXPECT_EQ(frame[8], 'O');
    EXPECT_EQ(frame[9], 'K');
    EXPECT_EQ(codec::readUint16(frame.data() + 10), 1);

    EXPECT_THROW(builder_.buildCommandResponse(std::string(300, 'x')), FrameError);
}

TEST_F(PacketBuilderTest, SerialAdvancesOncePerFrame) {
    EXPECT_EQ(codec::readUint16(builder_.buildLogin("123456789012345").data() + 12), 1);
    Frame heartbeat = builder_.buildHeartbeat(HeartbeatStatus{});
    EXPECT_EQ(codec::readUint16(heartbeat.data() + 9), 2);
    Frame location = builder_.buildLocation(shenzhenReport());
    EXPECT_EQ(codec::readUint16(location.data() + 22), 3);
    EXPECT_EQ(builder_.getSerialCounter().peek(), 4);

    builder_.resetSerial();
    EXPECT_EQ(codec::readUint16(builder_.buildLogin("123456789012345").data() + 12), 1);
}

TEST(SerialCounterTest, WrapsSkippingZero) {
    SerialCounter counter;
    EXPECT_EQ(counter.next(), 1);

    for (uint32_t i = 2; i < 0xFFFF; ++i) {
        counter.next();
    }
    EXPECT_EQ(counter.next(), 0xFFFF);
    EXPECT_EQ(counter.next(), 1);
    EXPECT_EQ(counter.next(), 2);

    counter.reset();
    EXPECT_EQ(counter.peek(), 1);
}
