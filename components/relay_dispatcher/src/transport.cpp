#include "relay_dispatcher/transport.hpp"

#include <spdlog/spdlog.h>

namespace relay_dispatcher {

std::string formatRelayLine(const std::string& command) {
    if (!command.empty() && command.back() == '\n') {
        return command;
    }
    return command + "\n";
}

// SerialRelayTransport

SerialRelayTransport::SerialRelayTransport(const Config& config)
    : config_(config)
    , port_(ioContext_)
{
}

SerialRelayTransport::~SerialRelayTransport() {
    std::lock_guard<std::mutex> lock(mutex_);
    closeLocked();
}

bool SerialRelayTransport::open() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (port_.is_open()) {
        return true;
    }

    boost::system::error_code ec;
    port_.open(config_.device, ec);
    if (ec) {
        spdlog::error("Failed to open relay serial port {}: {}", config_.device, ec.message());
        return false;
    }

    using boost::asio::serial_port_base;
    port_.set_option(serial_port_base::baud_rate(config_.baudRate), ec);
    if (!ec) port_.set_option(serial_port_base::character_size(8), ec);
    if (!ec) port_.set_option(serial_port_base::parity(serial_port_base::parity::none), ec);
    if (!ec) port_.set_option(serial_port_base::stop_bits(serial_port_base::stop_bits::one), ec);
    if (!ec) port_.set_option(serial_port_base::flow_control(serial_port_base::flow_control::none), ec);
    if (ec) {
        spdlog::error("Failed to configure relay serial port {}: {}", config_.device, ec.message());
        closeLocked();
        return false;
    }

    spdlog::info("Relay serial port {} open at {} baud", config_.device, config_.baudRate);
    return true;
}

void SerialRelayTransport::close() {
    std::lock_guard<std::mutex> lock(mutex_);
    closeLocked();
}

void SerialRelayTransport::closeLocked() {
    if (!port_.is_open()) {
        return;
    }
    boost::system::error_code ec;
    port_.close(ec);
    if (ec) {
        spdlog::debug("Closing relay serial port {}: {}", config_.device, ec.message());
    }
}

bool SerialRelayTransport::isOpen() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return port_.is_open();
}

bool SerialRelayTransport::writeLine(const std::string& command) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!port_.is_open()) {
        spdlog::warn("Relay serial port {} is not open", config_.device);
        return false;
    }

    const std::string line = formatRelayLine(command);
    boost::system::error_code ec;
    boost::asio::write(port_, boost::asio::buffer(line), ec);
    if (ec) {
        spdlog::error("Relay serial write to {} failed: {}", config_.device, ec.message());
        closeLocked();
        return false;
    }

    spdlog::debug("Relay serial {} <- {}", config_.device, command);
    return true;
}

std::string SerialRelayTransport::describe() const {
    return "serial:" + config_.device;
}

// TcpRelayTransport

TcpRelayTransport::TcpRelayTransport(const Config& config)
    : config_(config)
    , socket_(ioContext_)
{
}

TcpRelayTransport::~TcpRelayTransport() {
    std::lock_guard<std::mutex> lock(mutex_);
    closeLocked();
}

bool TcpRelayTransport::open() {
    std::lock_guard<std::mutex> lock(mutex_);
    if (socket_.is_open()) {
        return true;
    }

    boost::system::error_code ec;
    boost::asio::ip::tcp::resolver resolver(ioContext_);
    auto endpoints = resolver.resolve(config_.host, std::to_string(config_.port), ec);
    if (ec) {
        spdlog::error("Failed to resolve relay bridge {}: {}", config_.host, ec.message());
        return false;
    }

    // Connect on the private context so the attempt is bounded by connectTimeout
    bool timedOut = false;
    boost::asio::steady_timer timer(ioContext_);
    timer.expires_after(config_.connectTimeout);
    timer.async_wait([this, &timedOut](const boost::system::error_code& error) {
        if (error) {
            return;
        }
        timedOut = true;
        boost::system::error_code ignored;
        socket_.close(ignored);
    });

    // No further endpoints are tried once the deadline has passed
    boost::asio::async_connect(socket_, endpoints,
        [&timedOut](const boost::system::error_code&, const boost::asio::ip::tcp::endpoint&) {
            return !timedOut;
        },
        [&ec, &timer](const boost::system::error_code& error, const boost::asio::ip::tcp::endpoint&) {
            ec = error;
            timer.cancel();
        });

    ioContext_.restart();
    ioContext_.run();

    if (timedOut) {
        ec = boost::asio::error::timed_out;
    }
    if (ec) {
        spdlog::error("Failed to connect to relay bridge {}:{}: {}", config_.host, config_.port, ec.message());
        closeLocked();
        return false;
    }

    socket_.set_option(boost::asio::ip::tcp::no_delay(true), ec);
    if (ec) {
        spdlog::debug("Relay bridge no_delay not applied: {}", ec.message());
    }

    spdlog::info("Relay bridge {}:{} connected", config_.host, config_.port);
    return true;
}

void TcpRelayTransport::close() {
    std::lock_guard<std::mutex> lock(mutex_);
    closeLocked();
}

void TcpRelayTransport::closeLocked() {
    if (!socket_.is_open()) {
        return;
    }
    boost::system::error_code ec;
    socket_.shutdown(boost::asio::ip::tcp::socket::shutdown_both, ec);
    socket_.close(ec);
    if (ec) {
        spdlog::debug("Closing relay bridge {}:{}: {}", config_.host, config_.port, ec.message());
    }
}

bool TcpRelayTransport::isOpen() const {
    std::lock_guard<std::mutex> lock(mutex_);
    return socket_.is_open();
}

bool TcpRelayTransport::writeLine(const std::string& command) {
    std::lock_guard<std::mutex> lock(mutex_);
    if (!socket_.is_open()) {
        spdlog::warn("Relay bridge {}:{} is not connected", config_.host, config_.port);
        return false;
    }

    const std::string line = formatRelayLine(command);
    boost::system::error_code ec;
    boost::asio::write(socket_, boost::asio::buffer(line), ec);
    if (ec) {
        spdlog::error("Relay bridge write to {}:{} failed: {}", config_.host, config_.port, ec.message());
        closeLocked();
        return false;
    }

    spdlog::debug("Relay bridge {}:{} <- {}", config_.host, config_.port, command);
    return true;
}

std::string TcpRelayTransport::describe() const {
    return "tcp:" + config_.host + ":" + std::to_string(config_.port);
}

} // namespace relay_dispatcher
