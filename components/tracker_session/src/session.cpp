#include "tracker_session/session.hpp"

#include "gt06_protocol/codec.hpp"
#include "gt06_protocol/command.hpp"
#include "gt06_protocol/protocol.hpp"

#include <spdlog/spdlog.h>

#include <stdexcept>
#include <utility>

namespace tracker_session {

namespace {

gt06_protocol::LocationReport toLocationReport(const Position& position) {
    gt06_protocol::LocationReport report;
    report.latitude = position.latitude;
    report.longitude = position.longitude;
    report.speedKmh = position.speedKmh;
    report.courseDeg = position.headingDeg;
    report.timestamp = position.timestamp;
    report.satellites = position.satellites;
    report.gpsValid = position.isValid;
    return report;
}

bool isActiveState(SessionState state) {
    return state == SessionState::CONNECTING ||
           state == SessionState::CONNECTED ||
           state == SessionState::LOGGING_IN ||
           state == SessionState::ONLINE;
}

} // anonymous namespace

Session::Session(
    boost::asio::io_context& ioContext,
    std::shared_ptr<ILocationSource> locationSource,
    std::shared_ptr<relay_dispatcher::IRelayDispatcher> relayDispatcher
)
    : strand_(boost::asio::make_strand(ioContext))
    , socket_(strand_)
    , resolver_(strand_)
    , connectTimer_(strand_)
    , heartbeatTimer_(strand_)
    , locationTimer_(strand_)
    , reconnectTimer_(strand_)
    , locationSource_(std::move(locationSource))
    , relayDispatcher_(std::move(relayDispatcher))
    , relayPool_(1)
{
    if (!locationSource_) {
        throw std::invalid_argument("Session requires a location source");
    }
}

Session::~Session() {
    relayPool_.join();
}

void Session::connect(const SessionConfig& config) {
    auto validation = validateSessionConfig(config);
    if (!validation) {
        throw InvalidConfigError(validation.errorMessage);
    }

    if (!gt06_protocol::codec::isValidImei(config.imei)) {
        spdlog::warn("IMEI {} fails the Luhn check; the server may reject it", config.imei);
    }

    // State is checked on the strand, after any disconnect() posted earlier
    boost::asio::post(strand_, [self = shared_from_this(), config]() {
        self->startSession(config);
    });
}

void Session::disconnect() {
    boost::asio::post(strand_, [self = shared_from_this()]() {
        self->userDisconnected_ = true;
        self->reconnectTimer_.cancel();
        self->teardownConnection();
        self->setState(SessionState::DISCONNECTED);
        self->resetStats();
        spdlog::info("Session disconnected by user");
    });
}

VoidResult Session::sendAlarm(gt06_protocol::AlarmType alarm) {
    if (state_.load() != SessionState::ONLINE) {
        spdlog::warn("Alarm {} not sent, session is not online", gt06_protocol::alarmTypeToString(alarm));
        return makeErrorResult(ErrorCode::NOT_ONLINE, "session is not online");
    }

    auto position = locationSource_->currentPosition();
    if (!position || !position->isFix()) {
        spdlog::warn("Alarm {} not sent, no valid fix", gt06_protocol::alarmTypeToString(alarm));
        return makeErrorResult(ErrorCode::NO_FIX, "no valid position fix");
    }

    gt06_protocol::LocationReport report = toLocationReport(*position);
    boost::asio::post(strand_, [self = shared_from_this(), alarm, report]() {
        if (self->state_.load() != SessionState::ONLINE) {
            return;
        }
        spdlog::info("Sending alarm {}", gt06_protocol::alarmTypeToString(alarm));
        self->queueFrame(self->builder_.buildAlarm(alarm, report));
    });

    return makeSuccessResult();
}

VoidResult Session::sendCommandResponse(const std::string& text) {
    if (state_.load() != SessionState::ONLINE) {
        return makeErrorResult(ErrorCode::NOT_ONLINE, "session is not online");
    }

    boost::asio::post(strand_, [self = shared_from_this(), text]() {
        if (self->state_.load() != SessionState::ONLINE) {
            return;
        }
        try {
            self->queueFrame(self->builder_.buildCommandResponse(text));
        } catch (const gt06_protocol::FrameError& e) {
            spdlog::error("Command response not sent: {}", e.what());
        }
    });

    return makeSuccessResult();
}

void Session::sendManualRelayCommand(const std::string& command) {
    boost::asio::post(strand_, [self = shared_from_this(), command]() {
        spdlog::info("Manual relay command '{}'", command);
        self->dispatchToRelay(command);
    });
}

void Session::addListener(EventListener listener) {
    std::lock_guard<std::mutex> lock(listenersMutex_);
    listeners_.push_back(std::move(listener));
}

SessionStats Session::getStats() const {
    std::lock_guard<std::mutex> lock(statsMutex_);
    return stats_;
}

SessionConfig Session::getConfig() const {
    std::lock_guard<std::mutex> lock(configMutex_);
    return config_;
}

void Session::startSession(const SessionConfig& config) {
    if (isActiveState(state_.load())) {
        spdlog::warn("connect() ignored, session is already {}", sessionStateToString(state_.load()));
        return;
    }

    {
        std::lock_guard<std::mutex> lock(configMutex_);
        config_ = config;
    }

    userDisconnected_ = false;
    reconnectTimer_.cancel();
    builder_ = gt06_protocol::PacketBuilder(config.frameVariant);
    parser_ = gt06_protocol::Parser(gt06_protocol::Parser::Config(config.frameVariant));
    reconnectPolicy_ = ReconnectPolicy(config.reconnect);
    resetStats();

    spdlog::info("Starting session for IMEI {} against {}:{} ({} checksum)",
                 config.imei, config.serverAddress, config.serverPort,
                 gt06_protocol::frameVariantToString(config.frameVariant));
    startConnect();
}

void Session::startConnect() {
    teardownConnection();
    const uint64_t connectionId = connectionId_;

    setState(SessionState::CONNECTING);

    connectTimedOut_ = false;
    connectTimer_.expires_after(config_.connectTimeout);
    connectTimer_.async_wait(boost::asio::bind_executor(strand_,
        [self = shared_from_this(), connectionId](const boost::system::error_code& error) {
            if (error || connectionId != self->connectionId_) {
                return;
            }
            spdlog::warn("Connect to {}:{} timed out", self->config_.serverAddress, self->config_.serverPort);
            self->connectTimedOut_ = true;
            boost::system::error_code ignored;
            self->resolver_.cancel();
            self->socket_.close(ignored);
        }));

    resolver_.async_resolve(config_.serverAddress, std::to_string(config_.serverPort),
        boost::asio::bind_executor(strand_,
            [self = shared_from_this(), connectionId](const boost::system::error_code& error,
                                                      boost::asio::ip::tcp::resolver::results_type endpoints) {
                self->handleResolve(connectionId, error, endpoints);
            }));
}

void Session::handleResolve(uint64_t connectionId, const boost::system::error_code& error,
                            const boost::asio::ip::tcp::resolver::results_type& endpoints) {
    if (connectionId != connectionId_) {
        return;
    }

    if (error) {
        handleConnectionFailure(connectTimedOut_
            ? "connect timed out"
            : "cannot resolve " + config_.serverAddress + ": " + error.message());
        return;
    }

    boost::asio::async_connect(socket_, endpoints,
        boost::asio::bind_executor(strand_,
            [self = shared_from_this(), connectionId](const boost::system::error_code& error,
                                                      const boost::asio::ip::tcp::endpoint&) {
                self->handleConnect(connectionId, error);
            }));
}

void Session::handleConnect(uint64_t connectionId, const boost::system::error_code& error) {
    if (connectionId != connectionId_) {
        return;
    }
    connectTimer_.cancel();

    if (error) {
        handleConnectionFailure(connectTimedOut_
            ? "connect timed out"
            : "connect to " + config_.serverAddress + ":" + std::to_string(config_.serverPort) +
              " failed: " + error.message());
        return;
    }

    boost::system::error_code optionError;
    socket_.set_option(boost::asio::ip::tcp::no_delay(true), optionError);
    if (optionError) {
        spdlog::debug("Cannot set TCP_NODELAY: {}", optionError.message());
    }

    {
        std::lock_guard<std::mutex> lock(statsMutex_);
        stats_.connectedSince = std::chrono::system_clock::now();
    }

    spdlog::info("Connected to {}:{}", config_.serverAddress, config_.serverPort);
    setState(SessionState::CONNECTED);

    doRead(connectionId);

    queueFrame(builder_.buildLogin(config_.imei));
    setState(SessionState::LOGGING_IN);
}

void Session::doRead(uint64_t connectionId) {
    socket_.async_read_some(
        boost::asio::buffer(readBuffer_),
        boost::asio::bind_executor(strand_,
            [self = shared_from_this(), connectionId](const boost::system::error_code& error,
                                                      std::size_t bytesRead) {
                self->handleRead(connectionId, error, bytesRead);
            }));
}

void Session::handleRead(uint64_t connectionId, const boost::system::error_code& error, std::size_t bytesRead) {
    if (connectionId != connectionId_) {
        return;
    }

    if (error) {
        if (error != boost::asio::error::operation_aborted) {
            handleConnectionLost(error);
        }
        return;
    }

    receiveBuffer_.insert(receiveBuffer_.end(), readBuffer_.begin(), readBuffer_.begin() + bytesRead);
    touchActivity();
    processInbound();

    if (connectionId == connectionId_) {
        doRead(connectionId);
    }
}

void Session::processInbound() {
    std::vector<gt06_protocol::ParseIssue> issues;
    auto packets = parser_.extract(receiveBuffer_, issues);

    for (const auto& issue : issues) {
        switch (issue.type) {
            case gt06_protocol::ParseIssueType::CHECKSUM_MISMATCH:
                spdlog::warn("Checksum mismatch at offset {}: {}", issue.offset, issue.message);
                emitEvent(SessionEventType::CHECKSUM_MISMATCH, issue.message);
                break;
            case gt06_protocol::ParseIssueType::MALFORMED_FRAME:
                spdlog::warn("Malformed frame at offset {}: {}", issue.offset, issue.message);
                emitEvent(SessionEventType::MALFORMED_FRAME, issue.message);
                break;
            default:
                spdlog::debug("Parser: {}", issue.message);
                break;
        }
    }

    for (const auto& packet : packets) {
        {
            std::lock_guard<std::mutex> lock(statsMutex_);
            stats_.packetsReceived++;
        }
        const std::string name = gt06_protocol::protocolName(packet.getProtocolNumber());
        spdlog::debug("RX {} serial={} [{}]", name, packet.getSerialNumber(),
                      gt06_protocol::codec::toHex(packet.getRawFrame()));
        emitEvent(SessionEventType::PACKET_RECEIVED, name);
        handlePacket(packet);
    }
}

void Session::handlePacket(const gt06_protocol::ServerPacket& packet) {
    namespace pn = gt06_protocol::protocol::protocol_number;

    switch (packet.getProtocolNumber()) {
        case pn::LOGIN: {
            SessionState state = state_.load();
            if (state == SessionState::CONNECTED || state == SessionState::LOGGING_IN) {
                handleLoginAck();
            } else {
                spdlog::debug("Login ack ignored in state {}", sessionStateToString(state));
            }
            break;
        }
        case pn::HEARTBEAT: {
            {
                std::lock_guard<std::mutex> lock(statsMutex_);
                stats_.heartbeatsSent++;
            }
            emitEvent(SessionEventType::HEARTBEAT_ACK, "serial " + std::to_string(packet.getSerialNumber()));
            break;
        }
        case pn::LOCATION:
        case pn::LOCATION_EXT: {
            {
                std::lock_guard<std::mutex> lock(statsMutex_);
                stats_.locationsSent++;
            }
            emitEvent(SessionEventType::LOCATION_ACK, "serial " + std::to_string(packet.getSerialNumber()));
            break;
        }
        case pn::COMMAND:
            handleCommand(packet);
            break;
        default:
            spdlog::debug("No handling for {}", gt06_protocol::protocolName(packet.getProtocolNumber()));
            break;
    }
}

void Session::handleLoginAck() {
    spdlog::info("Login accepted for IMEI {}", config_.imei);
    reconnectPolicy_.reset();
    setState(SessionState::ONLINE);
    emitEvent(SessionEventType::LOGIN_ACCEPTED, config_.imei);

    scheduleHeartbeat();
    scheduleLocation();
    sendLocation();
}

void Session::handleCommand(const gt06_protocol::ServerPacket& packet) {
    {
        std::lock_guard<std::mutex> lock(statsMutex_);
        stats_.commandsReceived++;
    }

    gt06_protocol::Command command = gt06_protocol::CommandInterpreter::interpret(packet);
    spdlog::info("Command '{}' classified as {} (serial {})", command.getRawText(),
                 gt06_protocol::commandKindToString(command.getKind()), command.getSerialNumber());
    emitEvent(SessionEventType::COMMAND_RECEIVED,
              gt06_protocol::commandKindToString(command.getKind()) + ": " + command.getRawText());

    const std::string relayCommand = command.relayCommand();
    if (relayCommand.empty()) {
        spdlog::debug("Empty command, nothing forwarded to the relay");
    } else {
        dispatchToRelay(relayCommand);
    }

    // The acknowledgement always carries the server's serial
    queueFrame(builder_.buildCommandAck(packet.getSerialNumber()));
}

void Session::queueFrame(gt06_protocol::Frame frame) {
    if (!socket_.is_open()) {
        spdlog::debug("Dropping frame while disconnected: [{}]", gt06_protocol::codec::toHex(frame));
        return;
    }

    bool idle = writeQueue_.empty();
    writeQueue_.push_back(std::move(frame));
    if (idle) {
        doWrite(connectionId_);
    }
}

void Session::doWrite(uint64_t connectionId) {
    boost::asio::async_write(
        socket_,
        boost::asio::buffer(writeQueue_.front()),
        boost::asio::bind_executor(strand_,
            [self = shared_from_this(), connectionId](const boost::system::error_code& error,
                                                      std::size_t bytesWritten) {
                self->handleWrite(connectionId, error, bytesWritten);
            }));
}

void Session::handleWrite(uint64_t connectionId, const boost::system::error_code& error, std::size_t bytesWritten) {
    if (connectionId != connectionId_) {
        return;
    }

    if (error) {
        if (error != boost::asio::error::operation_aborted) {
            handleConnectionLost(error);
        }
        return;
    }

    const std::string hex = gt06_protocol::codec::toHex(writeQueue_.front());
    spdlog::debug("TX {} bytes [{}]", bytesWritten, hex);
    writeQueue_.pop_front();

    {
        std::lock_guard<std::mutex> lock(statsMutex_);
        stats_.packetsSent++;
    }
    touchActivity();
    emitEvent(SessionEventType::PACKET_SENT, hex);

    if (!writeQueue_.empty()) {
        doWrite(connectionId);
    }
}

void Session::scheduleHeartbeat() {
    const uint64_t connectionId = connectionId_;
    heartbeatTimer_.expires_after(config_.heartbeatInterval);
    heartbeatTimer_.async_wait(boost::asio::bind_executor(strand_,
        [self = shared_from_this(), connectionId](const boost::system::error_code& error) {
            if (error || connectionId != self->connectionId_) {
                return;
            }
            self->sendHeartbeat();
            self->scheduleHeartbeat();
        }));
}

void Session::scheduleLocation() {
    const uint64_t connectionId = connectionId_;
    locationTimer_.expires_after(config_.locationInterval);
    locationTimer_.async_wait(boost::asio::bind_executor(strand_,
        [self = shared_from_this(), connectionId](const boost::system::error_code& error) {
            if (error || connectionId != self->connectionId_) {
                return;
            }
            self->sendLocation();
            self->scheduleLocation();
        }));
}

void Session::sendHeartbeat() {
    if (state_.load() != SessionState::ONLINE) {
        return;
    }

    auto position = locationSource_->currentPosition();

    gt06_protocol::HeartbeatStatus status;
    status.gpsPositioned = position && position->isFix();
    queueFrame(builder_.buildHeartbeat(status));
}

void Session::sendLocation() {
    if (state_.load() != SessionState::ONLINE) {
        return;
    }

    auto position = locationSource_->currentPosition();
    if (!position || !position->isFix()) {
        spdlog::debug("No valid fix, location report skipped");
        return;
    }

    queueFrame(builder_.buildLocation(toLocationReport(*position)));
}

void Session::dispatchToRelay(const std::string& command) {
    if (!relayDispatcher_) {
        spdlog::warn("No relay attached, command '{}' dropped", command);
        return;
    }

    std::weak_ptr<Session> weakSelf = shared_from_this();
    auto dispatcher = relayDispatcher_;
    auto strand = strand_;

    boost::asio::post(relayPool_, [dispatcher, strand, weakSelf, command]() {
        if (dispatcher->send(command)) {
            return;
        }
        boost::asio::post(strand, [weakSelf, command]() {
            if (auto self = weakSelf.lock()) {
                self->handleRelayFailure(command);
            }
        });
    });
}

void Session::handleRelayFailure(const std::string& command) {
    spdlog::error("Relay command '{}' was not delivered", command);
    emitEvent(SessionEventType::RELAY_DISPATCH_FAILURE, command);
}

void Session::handleConnectionLost(const boost::system::error_code& error) {
    teardownConnection();

    if (error == boost::asio::error::eof) {
        spdlog::info("Server closed the connection");
        setState(SessionState::DISCONNECTED);
    } else {
        spdlog::error("Connection lost: {}", error.message());
        setState(SessionState::ERROR);
        emitEvent(SessionEventType::CONNECTION_ERROR, error.message());
    }

    scheduleReconnect();
}

void Session::handleConnectionFailure(const std::string& message) {
    spdlog::error("Connection failed: {}", message);
    teardownConnection();
    setState(SessionState::ERROR);
    emitEvent(SessionEventType::CONNECTION_ERROR, message);
    scheduleReconnect();
}

void Session::scheduleReconnect() {
    if (userDisconnected_) {
        return;
    }

    auto delay = reconnectPolicy_.nextDelay();
    {
        std::lock_guard<std::mutex> lock(statsMutex_);
        stats_.reconnectAttempts++;
    }
    spdlog::info("Reconnecting in {} ms (attempt {})", delay.count(), reconnectPolicy_.attempts());

    const uint64_t connectionId = connectionId_;
    reconnectTimer_.expires_after(delay);
    reconnectTimer_.async_wait(boost::asio::bind_executor(strand_,
        [self = shared_from_this(), connectionId](const boost::system::error_code& error) {
            if (error || self->userDisconnected_ || connectionId != self->connectionId_) {
                return;
            }
            self->startConnect();
        }));
}

void Session::teardownConnection() {
    ++connectionId_;

    connectTimer_.cancel();
    heartbeatTimer_.cancel();
    locationTimer_.cancel();
    resolver_.cancel();

    if (socket_.is_open()) {
        // Errors are irrelevant, the socket is going away
        boost::system::error_code ignored;
        socket_.shutdown(boost::asio::ip::tcp::socket::shutdown_both, ignored);
        socket_.close(ignored);
    }

    receiveBuffer_.clear();
    writeQueue_.clear();

    std::lock_guard<std::mutex> lock(statsMutex_);
    stats_.connectedSince.reset();
}

void Session::setState(SessionState state) {
    SessionState previous = state_.exchange(state);
    if (previous == state) {
        return;
    }

    spdlog::info("Session state {} -> {}", sessionStateToString(previous), sessionStateToString(state));
    emitEvent(SessionEventType::STATE_CHANGED,
              sessionStateToString(previous) + " -> " + sessionStateToString(state));
}

void Session::emitEvent(SessionEventType type, const std::string& message) {
    std::vector<EventListener> listeners;
    {
        std::lock_guard<std::mutex> lock(listenersMutex_);
        listeners = listeners_;
    }

    SessionEvent event;
    event.type = type;
    event.message = message;
    event.timestamp = std::chrono::system_clock::now();

    for (const auto& listener : listeners) {
        try {
            listener(event);
        } catch (const std::exception& e) {
            spdlog::error("Session listener threw on {}: {}", sessionEventTypeToString(type), e.what());
        }
    }
}

void Session::resetStats() {
    std::lock_guard<std::mutex> lock(statsMutex_);
    stats_ = SessionStats{};
}

void Session::touchActivity() {
    std::lock_guard<std::mutex> lock(statsMutex_);
    stats_.lastActivity = std::chrono::system_clock::now();
}

} // namespace tracker_session
