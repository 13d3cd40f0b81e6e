#include "tracker_session/session.hpp"
#include "tracker_session/config.hpp"
#include "tracker_session/location_source.hpp"

#include "gt06_protocol/codec.hpp"
#include "relay_dispatcher/relay_dispatcher.hpp"
#include "relay_dispatcher/transport.hpp"

#include <boost/program_options.hpp>
#include <spdlog/spdlog.h>

#include <atomic>
#include <csignal>
#include <iostream>
#include <string>
#include <thread>
#include <utility>

namespace po = boost::program_options;

// Global signal handler
std::atomic<bool> g_running(true);

void signalHandler(int signal) {
    std::cout << "Received signal " << signal << ", shutting down..." << std::endl;
    g_running = false;
}

namespace {

// "host:port" -> (host, port)
std::pair<std::string, uint16_t> parseHostPort(const std::string& value) {
    auto colon = value.rfind(':');
    if (colon == std::string::npos || colon == 0 || colon + 1 == value.size()) {
        throw po::error("--relay-tcp expects host:port, got '" + value + "'");
    }
    unsigned long port = std::stoul(value.substr(colon + 1));
    if (port == 0 || port > 65535) {
        throw po::error("--relay-tcp port out of range: " + value);
    }
    return {value.substr(0, colon), static_cast<uint16_t>(port)};
}

std::shared_ptr<relay_dispatcher::IRelayDispatcher> createRelay(const tracker_session::RelayConfig& config) {
    std::shared_ptr<relay_dispatcher::IRelayTransport> transport;

    switch (config.type) {
        case tracker_session::RelayConfig::Type::SERIAL: {
            relay_dispatcher::SerialRelayTransport::Config serialConfig;
            serialConfig.device = config.device;
            serialConfig.baudRate = config.baudRate;
            transport = std::make_shared<relay_dispatcher::SerialRelayTransport>(serialConfig);
            break;
        }
        case tracker_session::RelayConfig::Type::TCP: {
            relay_dispatcher::TcpRelayTransport::Config tcpConfig;
            tcpConfig.host = config.host;
            tcpConfig.port = config.port;
            tcpConfig.connectTimeout = config.connectTimeout;
            transport = std::make_shared<relay_dispatcher::TcpRelayTransport>(tcpConfig);
            break;
        }
        default:
            return nullptr;
    }

    auto dispatcher = std::make_shared<relay_dispatcher::RelayDispatcher>(transport, config.retry);
    dispatcher->setLostCommandCallback([](const std::string& command) {
        spdlog::error("Relay command '{}' lost after every retry", command);
    });
    return dispatcher;
}

} // anonymous namespace

int main(int argc, char* argv[]) {
    try {
        // Set up signal handling
        std::signal(SIGINT, signalHandler);
        std::signal(SIGTERM, signalHandler);

        // Set up command line options
        po::options_description desc("GT06 tracker options");
        desc.add_options()
            ("help,h", "Print help message")
            ("config,c", po::value<std::string>(), "JSON configuration file")
            ("server,s", po::value<std::string>(), "Tracking server address")
            ("port,p", po::value<uint16_t>(), "Tracking server port")
            ("imei,i", po::value<std::string>(), "Device IMEI (15 digits)")
            ("heartbeat", po::value<uint32_t>(), "Heartbeat interval in seconds")
            ("location-interval", po::value<uint32_t>(), "Location report interval in seconds")
            ("checksum", po::value<std::string>(), "Frame checksum: xor or crc16")
            ("relay-serial", po::value<std::string>(), "Serial device of the relay controller")
            ("baud", po::value<unsigned int>(), "Relay serial baud rate")
            ("relay-tcp", po::value<std::string>(), "Relay controller bridge as host:port")
            ("lat", po::value<double>(), "Fixed latitude")
            ("lon", po::value<double>(), "Fixed longitude")
            ("generate-imei", po::bool_switch()->default_value(false), "Print a valid random IMEI and exit")
            ("log-level,l", po::value<std::string>(), "Log level: trace, debug, info, warn, error");

        po::variables_map vm;
        po::store(po::parse_command_line(argc, argv, desc), vm);
        po::notify(vm);

        // Check for help
        if (vm.count("help")) {
            std::cout << desc << std::endl;
            return 0;
        }

        if (vm["generate-imei"].as<bool>()) {
            std::cout << gt06_protocol::codec::generateImei() << std::endl;
            return 0;
        }

        // Configuration file first, command line overrides
        tracker_session::TrackerConfig config;
        if (vm.count("config")) {
            config = tracker_session::ConfigLoader::loadFromFile(vm["config"].as<std::string>());
        }

        if (vm.count("server")) config.session.serverAddress = vm["server"].as<std::string>();
        if (vm.count("port")) config.session.serverPort = vm["port"].as<uint16_t>();
        if (vm.count("imei")) config.session.imei = vm["imei"].as<std::string>();
        if (vm.count("heartbeat")) {
            config.session.heartbeatInterval = std::chrono::seconds(vm["heartbeat"].as<uint32_t>());
        }
        if (vm.count("location-interval")) {
            config.session.locationInterval = std::chrono::seconds(vm["location-interval"].as<uint32_t>());
        }
        if (vm.count("checksum")) {
            config.session.frameVariant =
                tracker_session::ConfigLoader::parseFrameVariant(vm["checksum"].as<std::string>());
        }
        if (vm.count("relay-serial")) {
            config.relay.type = tracker_session::RelayConfig::Type::SERIAL;
            config.relay.device = vm["relay-serial"].as<std::string>();
        }
        if (vm.count("baud")) config.relay.baudRate = vm["baud"].as<unsigned int>();
        if (vm.count("relay-tcp")) {
            auto hostPort = parseHostPort(vm["relay-tcp"].as<std::string>());
            config.relay.type = tracker_session::RelayConfig::Type::TCP;
            config.relay.host = hostPort.first;
            config.relay.port = hostPort.second;
        }
        if (vm.count("lat")) config.latitude = vm["lat"].as<double>();
        if (vm.count("lon")) config.longitude = vm["lon"].as<double>();
        if (vm.count("log-level")) config.logLevel = vm["log-level"].as<std::string>();

        spdlog::set_level(spdlog::level::from_str(config.logLevel));

        // Collaborators
        auto locationSource = std::make_shared<tracker_session::StaticLocationSource>();
        if (config.latitude && config.longitude) {
            locationSource->setCoordinates(*config.latitude, *config.longitude);
        } else {
            spdlog::warn("No fixed position configured, location reports are skipped until a fix is set");
        }
        auto relay = createRelay(config.relay);

        std::cout << "Starting GT06 tracker " << config.session.imei << " -> "
                  << config.session.serverAddress << ":" << config.session.serverPort << std::endl;

        // Run the session on a worker thread
        boost::asio::io_context ioContext;
        auto workGuard = boost::asio::make_work_guard(ioContext);
        auto session = std::make_shared<tracker_session::Session>(ioContext, locationSource, relay);
        session->connect(config.session);

        std::thread worker([&ioContext] { ioContext.run(); });

        // Run until signal received
        int counter = 0;
        while (g_running) {
            std::this_thread::sleep_for(std::chrono::seconds(1));

            // Periodically print some stats
            if (++counter % 10 == 0) {  // Every 10 seconds
                auto stats = session->getStats();
                std::cout << "State: " << tracker_session::sessionStateToString(session->getState())
                          << ", Sent: " << stats.packetsSent
                          << ", Received: " << stats.packetsReceived
                          << ", Heartbeats acked: " << stats.heartbeatsSent
                          << ", Locations acked: " << stats.locationsSent
                          << ", Commands: " << stats.commandsReceived << std::endl;
            }
        }

        // Stop the session
        std::cout << "Stopping the tracker..." << std::endl;
        session->disconnect();
        workGuard.reset();
        worker.join();
        std::cout << "Tracker stopped" << std::endl;

        return 0;
    } catch (const std::exception& e) {
        std::cerr << "Error: " << e.what() << std::endl;
        return 1;
    }
}
