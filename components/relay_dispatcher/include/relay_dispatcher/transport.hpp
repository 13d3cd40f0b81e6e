#pragma once

#include <boost/asio.hpp>
#include <chrono>
#include <cstdint>
#include <mutex>
#include <string>

namespace relay_dispatcher {

/**
 * @class IRelayTransport
 * @brief Line oriented link to the relay controller
 *
 * Implementations are blocking and are only driven from the dispatcher's
 * own thread, never from the tracker session's event loop.
 */
class IRelayTransport {
public:
    virtual ~IRelayTransport() = default;

    /**
     * @brief Open the link
     * @return true if the link is open afterwards
     */
    virtual bool open() = 0;

    /**
     * @brief Close the link, a no-op when already closed
     */
    virtual void close() = 0;

    virtual bool isOpen() const = 0;

    /**
     * @brief Write one command line
     *
     * @param command Command text, terminated with '\n' if it is not already
     * @return true if every byte was written
     */
    virtual bool writeLine(const std::string& command) = 0;

    /**
     * @brief Short description of the endpoint for log lines
     */
    virtual std::string describe() const = 0;
};

/**
 * @brief Append the '\n' terminator unless the command already ends with one
 */
std::string formatRelayLine(const std::string& command);

/**
 * @class SerialRelayTransport
 * @brief Relay controller attached to a serial port (USB CDC / UART), 8N1
 */
class SerialRelayTransport : public IRelayTransport {
public:
    struct Config {
        std::string device;
        unsigned int baudRate;

        Config()
            : device("/dev/ttyUSB0")
            , baudRate(9600)
        {}
    };

    explicit SerialRelayTransport(const Config& config = Config{});
    ~SerialRelayTransport() override;

    bool open() override;
    void close() override;
    bool isOpen() const override;
    bool writeLine(const std::string& command) override;
    std::string describe() const override;

private:
    void closeLocked();

    Config config_;
    boost::asio::io_context ioContext_;
    boost::asio::serial_port port_;
    mutable std::mutex mutex_;
};

/**
 * @class TcpRelayTransport
 * @brief Relay controller reached through a TCP serial bridge
 */
class TcpRelayTransport : public IRelayTransport {
public:
    struct Config {
        std::string host;
        uint16_t port;
        std::chrono::milliseconds connectTimeout;

        Config()
            : host("127.0.0.1")
            , port(8888)
            , connectTimeout(3000)
        {}
    };

    explicit TcpRelayTransport(const Config& config = Config{});
    ~TcpRelayTransport() override;

    bool open() override;
    void close() override;
    bool isOpen() const override;
    bool writeLine(const std::string& command) override;
    std::string describe() const override;

private:
    void closeLocked();

    Config config_;
    boost::asio::io_context ioContext_;
    boost::asio::ip::tcp::socket socket_;
    mutable std::mutex mutex_;
};

} // namespace relay_dispatcher
