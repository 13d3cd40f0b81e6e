#pragma once

#include "tracker_session/types.hpp"
#include "tracker_session/config.hpp"
#include "tracker_session/location_source.hpp"
#include "tracker_session/reconnect_policy.hpp"

#include "gt06_protocol/builder.hpp"
#include "gt06_protocol/parser.hpp"
#include "relay_dispatcher/relay_dispatcher.hpp"

#include <boost/asio.hpp>

#include <array>
#include <atomic>
#include <deque>
#include <functional>
#include <memory>
#include <mutex>
#include <string>
#include <vector>

namespace tracker_session {

/**
 * @class Session
 * @brief GT06 client session over one persistent TCP connection
 *
 * Drives DISCONNECTED -> CONNECTING -> CONNECTED -> LOGGING_IN -> ONLINE,
 * sends heartbeats and location reports on their own tickers once the
 * server accepts the login, and answers inbound commands: each one is
 * classified, forwarded to the relay dispatcher and acknowledged with the
 * server's serial number.
 *
 * All session state lives on a strand of the supplied io_context, so the
 * context may be run by any number of threads. Relay calls run on a
 * dedicated single-thread pool and never block the socket read loop.
 *
 * Sessions must be owned by a std::shared_ptr.
 */
class Session : public std::enable_shared_from_this<Session> {
public:
    /**
     * @brief Listener for published session events
     *
     * Invoked on an io_context thread; must not block.
     */
    using EventListener = std::function<void(const SessionEvent& event)>;

    /**
     * @brief Construct a new Session object
     *
     * @param ioContext Boost.Asio IO context that runs the session
     * @param locationSource Source of the positions reported to the server
     * @param relayDispatcher Relay collaborator, or nullptr when no relay is attached
     * @throws std::invalid_argument if locationSource is null
     */
    Session(boost::asio::io_context& ioContext,
            std::shared_ptr<ILocationSource> locationSource,
            std::shared_ptr<relay_dispatcher::IRelayDispatcher> relayDispatcher);

    ~Session();

    Session(const Session&) = delete;
    Session& operator=(const Session&) = delete;

    /**
     * @brief Start a new login sequence against the configured server
     *
     * Resets the serial counter and the statistics. The call is queued behind
     * any earlier connect() or disconnect(); if the session is still
     * connecting or online when it runs, it is ignored with a warning. Any
     * pending reconnect is cancelled.
     *
     * @param config Session configuration
     * @throws InvalidConfigError if the configuration can never work
     */
    void connect(const SessionConfig& config);

    /**
     * @brief Close the connection and stop every timer
     *
     * No reconnect follows until connect() is called again.
     */
    void disconnect();

    /**
     * @brief Send an alarm built from the latest fix
     *
     * @return NOT_ONLINE or NO_FIX when nothing was sent
     */
    VoidResult sendAlarm(gt06_protocol::AlarmType alarm);

    /**
     * @brief Send a text command response (protocol 0x21)
     *
     * @return NOT_ONLINE when nothing was sent
     */
    VoidResult sendCommandResponse(const std::string& text);

    /**
     * @brief Forward a command to the relay without involving the server
     */
    void sendManualRelayCommand(const std::string& command);

    void addListener(EventListener listener);

    SessionState getState() const { return state_.load(); }
    SessionStats getStats() const;
    SessionConfig getConfig() const;

private:
    void startSession(const SessionConfig& config);
    void startConnect();
    void handleResolve(uint64_t connectionId, const boost::system::error_code& error,
                       const boost::asio::ip::tcp::resolver::results_type& endpoints);
    void handleConnect(uint64_t connectionId, const boost::system::error_code& error);
    void doRead(uint64_t connectionId);
    void handleRead(uint64_t connectionId, const boost::system::error_code& error, std::size_t bytesRead);
    void processInbound();
    void handlePacket(const gt06_protocol::ServerPacket& packet);
    void handleLoginAck();
    void handleCommand(const gt06_protocol::ServerPacket& packet);

    void queueFrame(gt06_protocol::Frame frame);
    void doWrite(uint64_t connectionId);
    void handleWrite(uint64_t connectionId, const boost::system::error_code& error, std::size_t bytesWritten);

    void scheduleHeartbeat();
    void scheduleLocation();
    void sendHeartbeat();
    void sendLocation();

    void dispatchToRelay(const std::string& command);
    void handleRelayFailure(const std::string& command);

    void handleConnectionLost(const boost::system::error_code& error);
    void handleConnectionFailure(const std::string& message);
    void scheduleReconnect();
    void teardownConnection();

    void setState(SessionState state);
    void emitEvent(SessionEventType type, const std::string& message);
    void resetStats();
    void touchActivity();

    // Core members
    boost::asio::strand<boost::asio::io_context::executor_type> strand_;
    boost::asio::ip::tcp::socket socket_;
    boost::asio::ip::tcp::resolver resolver_;
    boost::asio::steady_timer connectTimer_;
    boost::asio::steady_timer heartbeatTimer_;
    boost::asio::steady_timer locationTimer_;
    boost::asio::steady_timer reconnectTimer_;

    // Collaborators
    std::shared_ptr<ILocationSource> locationSource_;
    std::shared_ptr<relay_dispatcher::IRelayDispatcher> relayDispatcher_;
    boost::asio::thread_pool relayPool_;

    // Strand-owned state
    SessionConfig config_;
    gt06_protocol::PacketBuilder builder_;
    gt06_protocol::Parser parser_;
    ReconnectPolicy reconnectPolicy_;
    std::vector<uint8_t> receiveBuffer_;
    std::array<uint8_t, 1024> readBuffer_;
    std::deque<gt06_protocol::Frame> writeQueue_;
    uint64_t connectionId_ = 0;     ///< Bumped on every teardown; stale handlers compare against it
    bool userDisconnected_ = true;
    bool connectTimedOut_ = false;

    // Shared with other threads
    std::atomic<SessionState> state_{SessionState::DISCONNECTED};
    mutable std::mutex configMutex_;
    mutable std::mutex statsMutex_;
    SessionStats stats_;
    std::mutex listenersMutex_;
    std::vector<EventListener> listeners_;
};

} // namespace tracker_session
