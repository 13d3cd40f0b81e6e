#include "tracker_session/session.hpp"
#include "gt06_protocol/codec.hpp"
#include "gt06_protocol/parser.hpp"
#include "gt06_protocol/protocol.hpp"
#include <gtest/gtest.h>
#include <gmock/gmock.h>
#include <boost/asio.hpp>

#include <algorithm>
#include <array>
#include <atomic>
#include <chrono>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

using namespace tracker_session;
using namespace testing;
using boost::asio::ip::tcp;

namespace pn = gt06_protocol::protocol::protocol_number;

namespace {

const std::string TEST_IMEI = "357152040915004";

class MockRelayDispatcher : public relay_dispatcher::IRelayDispatcher {
public:
    MOCK_METHOD(bool, send, (const std::string& command), (override));
    MOCK_METHOD(bool, isConnected, (), (const, override));
};

// Server-side frame with an XOR checksum
gt06_protocol::Frame serverFrame(uint8_t protocolNumber, const gt06_protocol::Bytes& payload, uint16_t serial) {
    gt06_protocol::Frame frame = {0x78, 0x78, static_cast<uint8_t>(1 + payload.size() + 2), protocolNumber};
    frame.insert(frame.end(), payload.begin(), payload.end());
    gt06_protocol::codec::appendUint16(frame, serial);
    frame.push_back(gt06_protocol::codec::xorChecksum(frame.data() + 2, frame.size() - 2));
    frame.push_back(0x0D);
    frame.push_back(0x0A);
    return frame;
}

/**
 * In-process GT06 server: accepts connections, decodes every client frame
 * and lets the test push frames back to the latest client.
 */
class FakeServer {
public:
    explicit FakeServer(boost::asio::io_context& ioContext)
        : ioContext_(ioContext)
        , acceptor_(ioContext, tcp::endpoint(boost::asio::ip::address_v4::loopback(), 0))
    {
        doAccept();
    }

    uint16_t port() const { return acceptor_.local_endpoint().port(); }

    void send(const gt06_protocol::Frame& frame) {
        ASSERT_TRUE(client_ && client_->is_open());
        boost::asio::write(*client_, boost::asio::buffer(frame));
    }

    void closeClient() {
        if (client_) {
            boost::system::error_code ignored;
            client_->shutdown(tcp::socket::shutdown_both, ignored);
            client_->close(ignored);
        }
    }

    size_t count(uint8_t protocolNumber) const {
        return std::count_if(packets_.begin(), packets_.end(),
                             [protocolNumber](const gt06_protocol::ServerPacket& packet) {
                                 return packet.getProtocolNumber() == protocolNumber;
                             });
    }

    const gt06_protocol::ServerPacket* last(uint8_t protocolNumber) const {
        for (auto it = packets_.rbegin(); it != packets_.rend(); ++it) {
            if (it->getProtocolNumber() == protocolNumber) {
                return &*it;
            }
        }
        return nullptr;
    }

    int connections() const { return connections_; }
    bool clientClosed() const { return clientClosed_; }

private:
    void doAccept() {
        auto socket = std::make_shared<tcp::socket>(ioContext_);
        acceptor_.async_accept(*socket, [this, socket](const boost::system::error_code& error) {
            if (error) {
                return;
            }
            client_ = socket;
            buffer_.clear();
            clientClosed_ = false;
            connections_++;
            doRead(socket);
            doAccept();
        });
    }

    void doRead(std::shared_ptr<tcp::socket> socket) {
        socket->async_read_some(boost::asio::buffer(readBuffer_),
            [this, socket](const boost::system::error_code& error, std::size_t bytesRead) {
                if (error) {
                    if (socket == client_) {
                        clientClosed_ = true;
                    }
                    return;
                }
                buffer_.insert(buffer_.end(), readBuffer_.begin(), readBuffer_.begin() + bytesRead);
                auto packets = parser_.extract(buffer_);
                packets_.insert(packets_.end(), packets.begin(), packets.end());
                doRead(socket);
            });
    }

    boost::asio::io_context& ioContext_;
    tcp::acceptor acceptor_;
    std::shared_ptr<tcp::socket> client_;
    std::array<uint8_t, 512> readBuffer_;
    std::vector<uint8_t> buffer_;
    gt06_protocol::Parser parser_;
    std::vector<gt06_protocol::ServerPacket> packets_;
    int connections_ = 0;
    bool clientClosed_ = false;
};

} // anonymous namespace

class SessionTest : public ::testing::Test {
protected:
    void SetUp() override {
        server_ = std::make_unique<FakeServer>(ioContext_);
        locationSource_ = std::make_shared<StaticLocationSource>(22.546, 114.079);
        relay_ = std::make_shared<NiceMock<MockRelayDispatcher>>();
        ON_CALL(*relay_, isConnected()).WillByDefault(Return(true));

        config_.serverAddress = "127.0.0.1";
        config_.serverPort = server_->port();
        config_.imei = TEST_IMEI;
        config_.heartbeatInterval = std::chrono::seconds(1);
        config_.locationInterval = std::chrono::seconds(1);
        config_.connectTimeout = std::chrono::milliseconds(2000);
        config_.reconnect.initialDelay = std::chrono::milliseconds(100);
        config_.reconnect.maxDelay = std::chrono::milliseconds(400);

        session_ = std::make_shared<Session>(ioContext_, locationSource_, relay_);
        session_->addListener([this](const SessionEvent& event) {
            std::lock_guard<std::mutex> lock(eventsMutex_);
            events_.push_back(event);
        });
    }

    void TearDown() override {
        session_->disconnect();
        runUntil([this] { return session_->getState() == SessionState::DISCONNECTED; });
        ioContext_.poll();
    }

    template<typename Predicate>
    bool runUntil(Predicate predicate, std::chrono::milliseconds timeout = std::chrono::milliseconds(5000)) {
        auto deadline = std::chrono::steady_clock::now() + timeout;
        while (!predicate()) {
            if (std::chrono::steady_clock::now() > deadline) {
                return false;
            }
            if (ioContext_.stopped()) {
                ioContext_.restart();
            }
            ioContext_.run_one_for(std::chrono::milliseconds(20));
        }
        return true;
    }

    void runFor(std::chrono::milliseconds duration) {
        runUntil([] { return false; }, duration);
    }

    void goOnline() {
        session_->connect(config_);
        ASSERT_TRUE(runUntil([this] { return server_->count(pn::LOGIN) >= 1; }));
        server_->send(serverFrame(pn::LOGIN, {}, server_->last(pn::LOGIN)->getSerialNumber()));
        ASSERT_TRUE(runUntil([this] { return session_->getState() == SessionState::ONLINE; }));
    }

    size_t eventCount(SessionEventType type) {
        std::lock_guard<std::mutex> lock(eventsMutex_);
        return std::count_if(events_.begin(), events_.end(),
                             [type](const SessionEvent& event) { return event.type == type; });
    }

    boost::asio::io_context ioContext_;
    std::unique_ptr<FakeServer> server_;
    std::shared_ptr<StaticLocationSource> locationSource_;
    std::shared_ptr<NiceMock<MockRelayDispatcher>> relay_;
    SessionConfig config_;
    std::shared_ptr<Session> session_;

    std::mutex eventsMutex_;
    std::vector<SessionEvent> events_;
};

TEST_F(SessionTest, InitialState) {
    EXPECT_EQ(session_->getState(), SessionState::DISCONNECTED);

    SessionStats stats = session_->getStats();
    EXPECT_EQ(stats.packetsSent, 0u);
    EXPECT_FALSE(stats.connectedSince.has_value());
}

TEST_F(SessionTest, RequiresLocationSource) {
    EXPECT_THROW(std::make_shared<Session>(ioContext_, nullptr, relay_), std::invalid_argument);
}

TEST_F(SessionTest, InvalidConfigThrowsBeforeAnyIo) {
    SessionConfig config = config_;
    config.imei = "12345";
    EXPECT_THROW(session_->connect(config), InvalidConfigError);

    config = config_;
    config.serverAddress.clear();
    EXPECT_THROW(session_->connect(config), InvalidConfigError);

    runFor(std::chrono::milliseconds(200));
    EXPECT_EQ(session_->getState(), SessionState::DISCONNECTED);
    EXPECT_EQ(server_->connections(), 0);
}

TEST_F(SessionTest, LoginCarriesBcdImeiAndFirstSerial) {
    session_->connect(config_);
    ASSERT_TRUE(runUntil([this] { return server_->count(pn::LOGIN) == 1; }));

    const auto* login = server_->last(pn::LOGIN);
    EXPECT_EQ(login->getSerialNumber(), 1);
    EXPECT_TRUE(login->isChecksumValid());
    EXPECT_EQ(login->getPayload(),
              (gt06_protocol::Bytes{0x03, 0x57, 0x15, 0x20, 0x40, 0x91, 0x50, 0x04}));
    EXPECT_EQ(session_->getState(), SessionState::LOGGING_IN);
}

TEST_F(SessionTest, LoginAckGoesOnlineAndReportsLocation) {
    goOnline();
    EXPECT_EQ(eventCount(SessionEventType::LOGIN_ACCEPTED), 1u);

    // Immediate report on login, then one per location tick
    ASSERT_TRUE(runUntil([this] { return server_->count(pn::LOCATION) >= 1; }));
    ASSERT_TRUE(runUntil([this] { return server_->count(pn::LOCATION) >= 2; },
                         std::chrono::milliseconds(3000)));

    const auto* location = server_->last(pn::LOCATION);
    EXPECT_TRUE(location->isChecksumValid());
    ASSERT_GE(location->getPayload().size(), 15u);
    EXPECT_EQ(gt06_protocol::codec::readUint32(location->getPayload().data() + 7), 40582800u);
    EXPECT_EQ(gt06_protocol::codec::readUint32(location->getPayload().data() + 11), 205342200u);

    server_->send(serverFrame(pn::LOCATION, {}, location->getSerialNumber()));
    ASSERT_TRUE(runUntil([this] { return session_->getStats().locationsSent == 1; }));

    SessionStats stats = session_->getStats();
    EXPECT_TRUE(stats.connectedSince.has_value());
    EXPECT_TRUE(stats.lastActivity.has_value());
    EXPECT_GE(stats.packetsSent, 3u);
}

TEST_F(SessionTest, HeartbeatsFollowTheInterval) {
    goOnline();

    ASSERT_TRUE(runUntil([this] { return server_->count(pn::HEARTBEAT) >= 1; },
                         std::chrono::milliseconds(3000)));

    const auto* heartbeat = server_->last(pn::HEARTBEAT);
    server_->send(serverFrame(pn::HEARTBEAT, {}, heartbeat->getSerialNumber()));
    ASSERT_TRUE(runUntil([this] { return session_->getStats().heartbeatsSent == 1; }));
    EXPECT_EQ(eventCount(SessionEventType::HEARTBEAT_ACK), 1u);
}

TEST_F(SessionTest, NoLocationWithoutFix) {
    locationSource_->clear();
    goOnline();

    runFor(std::chrono::milliseconds(1500));
    EXPECT_EQ(server_->count(pn::LOCATION), 0u);
    EXPECT_GE(server_->count(pn::HEARTBEAT), 1u);
}

TEST_F(SessionTest, RelayStopCommandIsForwardedAndAcknowledged) {
    std::atomic<int> delivered{0};
    EXPECT_CALL(*relay_, send("ENGINE_STOP"))
        .WillOnce(InvokeWithoutArgs([&delivered] { delivered++; return true; }));

    goOnline();

    const gt06_protocol::Bytes payload = {
        0x0C, 0x00, 0x00, 0x00, 0x00,
        'R', 'e', 'l', 'a', 'y', ',', '1', '#', 0x00, 0x02};
    server_->send(serverFrame(pn::COMMAND, payload, 0x0007));

    ASSERT_TRUE(runUntil([this] { return server_->count(pn::COMMAND) == 1; }));
    ASSERT_TRUE(runUntil([&delivered] { return delivered.load() == 1; }));

    // ACK echoes the server serial, not the session counter
    const auto* ack = server_->last(pn::COMMAND);
    EXPECT_EQ(ack->getSerialNumber(), 0x0007);
    EXPECT_TRUE(ack->getPayload().empty());
    EXPECT_TRUE(ack->isChecksumValid());

    EXPECT_EQ(session_->getStats().commandsReceived, 1u);
    EXPECT_EQ(eventCount(SessionEventType::COMMAND_RECEIVED), 1u);
}

TEST_F(SessionTest, UnknownCommandPassesThroughAndIsAcknowledged) {
    std::atomic<int> delivered{0};
    EXPECT_CALL(*relay_, send("STATUS#"))
        .WillOnce(InvokeWithoutArgs([&delivered] { delivered++; return true; }));

    goOnline();

    server_->send(serverFrame(pn::COMMAND, {'S', 'T', 'A', 'T', 'U', 'S', '#'}, 0x1234));

    ASSERT_TRUE(runUntil([this] { return server_->count(pn::COMMAND) == 1; }));
    ASSERT_TRUE(runUntil([&delivered] { return delivered.load() == 1; }));
    EXPECT_EQ(server_->last(pn::COMMAND)->getSerialNumber(), 0x1234);
}

TEST_F(SessionTest, RelayFailureIsReportedWithoutDisconnecting) {
    std::atomic<int> attempted{0};
    EXPECT_CALL(*relay_, send("ENGINE_RESUME"))
        .WillOnce(InvokeWithoutArgs([&attempted] { attempted++; return false; }));

    goOnline();

    server_->send(serverFrame(pn::COMMAND, {'R', 'E', 'L', 'A', 'Y', ',', '0', '#'}, 0x0042));

    ASSERT_TRUE(runUntil([this] { return eventCount(SessionEventType::RELAY_DISPATCH_FAILURE) == 1; }));
    EXPECT_EQ(attempted.load(), 1);
    EXPECT_EQ(session_->getState(), SessionState::ONLINE);
    EXPECT_EQ(server_->count(pn::COMMAND), 1u);
}

TEST_F(SessionTest, ManualRelayCommand) {
    std::atomic<int> delivered{0};
    EXPECT_CALL(*relay_, send("ENGINE_STOP"))
        .WillOnce(InvokeWithoutArgs([&delivered] { delivered++; return true; }));

    session_->sendManualRelayCommand("ENGINE_STOP");
    ASSERT_TRUE(runUntil([&delivered] { return delivered.load() == 1; }));
}

TEST_F(SessionTest, ChecksumMismatchIsReportedButDelivered) {
    session_->connect(config_);
    ASSERT_TRUE(runUntil([this] { return server_->count(pn::LOGIN) == 1; }));

    gt06_protocol::Frame ack = serverFrame(pn::LOGIN, {}, 1);
    ack[ack.size() - 3] ^= 0xFF;
    server_->send(ack);

    ASSERT_TRUE(runUntil([this] { return session_->getState() == SessionState::ONLINE; }));
    EXPECT_EQ(eventCount(SessionEventType::CHECKSUM_MISMATCH), 1u);
}

TEST_F(SessionTest, SendAlarmNeedsOnlineSessionAndFix) {
    auto result = session_->sendAlarm(gt06_protocol::AlarmType::SOS);
    EXPECT_FALSE(result);
    EXPECT_EQ(result.errorCode, ErrorCode::NOT_ONLINE);

    goOnline();

    locationSource_->clear();
    result = session_->sendAlarm(gt06_protocol::AlarmType::SOS);
    EXPECT_EQ(result.errorCode, ErrorCode::NO_FIX);

    locationSource_->setCoordinates(-23.5505, -46.6333);
    result = session_->sendAlarm(gt06_protocol::AlarmType::SOS);
    EXPECT_TRUE(result);

    ASSERT_TRUE(runUntil([this] { return server_->count(pn::ALARM) == 1; }));
    const auto* alarm = server_->last(pn::ALARM);
    ASSERT_GE(alarm->getPayload().size(), 7u);
    EXPECT_EQ(alarm->getPayload()[6], static_cast<uint8_t>(gt06_protocol::AlarmType::SOS));
}

TEST_F(SessionTest, SendCommandResponse) {
    EXPECT_EQ(session_->sendCommandResponse("OK").errorCode, ErrorCode::NOT_ONLINE);

    goOnline();
    EXPECT_TRUE(session_->sendCommandResponse("Relay OK"));

    ASSERT_TRUE(runUntil([this] { return server_->count(pn::COMMAND_RESPONSE) == 1; }));
    const auto& payload = server_->last(pn::COMMAND_RESPONSE)->getPayload();
    ASSERT_EQ(payload.size(), 4u + 8u);
    EXPECT_EQ(std::string(payload.begin() + 4, payload.end()), "Relay OK");
}

TEST_F(SessionTest, ConnectWhileOnlineIsIgnored) {
    goOnline();

    session_->connect(config_);
    runFor(std::chrono::milliseconds(200));

    EXPECT_EQ(session_->getState(), SessionState::ONLINE);
    EXPECT_EQ(server_->connections(), 1);
    EXPECT_EQ(server_->count(pn::LOGIN), 1u);
}

TEST_F(SessionTest, DisconnectCancelsHeartbeats) {
    goOnline();
    ASSERT_TRUE(runUntil([this] { return server_->count(pn::HEARTBEAT) >= 1; },
                         std::chrono::milliseconds(3000)));

    session_->disconnect();
    ASSERT_TRUE(runUntil([this] { return session_->getState() == SessionState::DISCONNECTED; }));
    ASSERT_TRUE(runUntil([this] { return server_->clientClosed(); }));

    const size_t heartbeats = server_->count(pn::HEARTBEAT);
    runFor(std::chrono::milliseconds(1500));

    EXPECT_EQ(server_->count(pn::HEARTBEAT), heartbeats);
    EXPECT_EQ(server_->connections(), 1);
    EXPECT_EQ(session_->getState(), SessionState::DISCONNECTED);

    SessionStats stats = session_->getStats();
    EXPECT_EQ(stats.packetsSent, 0u);
    EXPECT_EQ(stats.packetsReceived, 0u);
}

TEST_F(SessionTest, ServerCloseTriggersReconnectWithoutSerialReset) {
    goOnline();

    server_->closeClient();
    ASSERT_TRUE(runUntil([this] { return server_->connections() == 2 && server_->count(pn::LOGIN) == 2; }));

    // Reconnects continue the serial sequence of the same connect() call
    EXPECT_GT(server_->last(pn::LOGIN)->getSerialNumber(), 1);
    EXPECT_GE(session_->getStats().reconnectAttempts, 1u);
}

TEST_F(SessionTest, FreshConnectResetsSerial) {
    goOnline();
    session_->disconnect();
    ASSERT_TRUE(runUntil([this] { return session_->getState() == SessionState::DISCONNECTED; }));

    session_->connect(config_);
    ASSERT_TRUE(runUntil([this] { return server_->count(pn::LOGIN) == 2; }));
    EXPECT_EQ(server_->last(pn::LOGIN)->getSerialNumber(), 1);
}

TEST_F(SessionTest, ConnectRightAfterDisconnectRestarts) {
    goOnline();

    // Both calls are queued before the disconnect has run
    session_->disconnect();
    session_->connect(config_);

    ASSERT_TRUE(runUntil([this] { return server_->connections() == 2 && server_->count(pn::LOGIN) == 2; }));
    EXPECT_EQ(server_->last(pn::LOGIN)->getSerialNumber(), 1);

    server_->send(serverFrame(pn::LOGIN, {}, 1));
    ASSERT_TRUE(runUntil([this] { return session_->getState() == SessionState::ONLINE; }));
}

TEST_F(SessionTest, ConnectWhileLoggingInRestartsAfterDisconnect) {
    session_->connect(config_);
    ASSERT_TRUE(runUntil([this] { return server_->count(pn::LOGIN) >= 1; }));
    ASSERT_EQ(session_->getState(), SessionState::LOGGING_IN);

    session_->disconnect();
    session_->connect(config_);

    ASSERT_TRUE(runUntil([this] { return server_->count(pn::LOGIN) == 2; }));
    EXPECT_EQ(session_->getState(), SessionState::LOGGING_IN);
}

TEST_F(SessionTest, ConnectFailureGoesToErrorAndRetries) {
    uint16_t closedPort = 0;
    {
        tcp::acceptor released(ioContext_, tcp::endpoint(boost::asio::ip::address_v4::loopback(), 0));
        closedPort = released.local_endpoint().port();
    }

    SessionConfig config = config_;
    config.serverPort = closedPort;
    session_->connect(config);

    ASSERT_TRUE(runUntil([this] { return eventCount(SessionEventType::CONNECTION_ERROR) >= 2; }));
    EXPECT_GE(session_->getStats().reconnectAttempts, 2u);
    EXPECT_NE(session_->getState(), SessionState::ONLINE);
}
