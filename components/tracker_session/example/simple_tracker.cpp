#include "tracker_session/session.hpp"
#include "tracker_session/location_source.hpp"
#include "gt06_protocol/codec.hpp"
#include <boost/asio.hpp>
#include <iostream>
#include <thread>
#include <csignal>
#include <atomic>

// Global signal handler
std::atomic<bool> g_running(true);

void signalHandler(int signal) {
    std::cout << "Received signal " << signal << ", shutting down..." << std::endl;
    g_running = false;
}

// Relay stand-in that prints what the server asked for
class PrintingRelay : public relay_dispatcher::IRelayDispatcher {
public:
    bool send(const std::string& command) override {
        std::cout << "RELAY <- " << command << std::endl;
        return true;
    }

    bool isConnected() const override {
        return true;
    }
};

int main() {
    try {
        // Set up signal handling
        std::signal(SIGINT, signalHandler);
        std::signal(SIGTERM, signalHandler);

        // Configure the session
        tracker_session::SessionConfig config;
        config.serverAddress = "127.0.0.1";
        config.serverPort = 5023;
        config.imei = gt06_protocol::codec::generateImei();
        config.heartbeatInterval = std::chrono::seconds(30);
        config.locationInterval = std::chrono::seconds(10);

        std::cout << "Starting tracker " << config.imei << " -> "
                  << config.serverAddress << ":" << config.serverPort << std::endl;

        boost::asio::io_context ioContext;
        auto workGuard = boost::asio::make_work_guard(ioContext);

        auto location = std::make_shared<tracker_session::StaticLocationSource>(-23.5505, -46.6333);
        auto session = std::make_shared<tracker_session::Session>(
            ioContext, location, std::make_shared<PrintingRelay>());

        session->addListener([](const tracker_session::SessionEvent& event) {
            std::cout << tracker_session::sessionEventTypeToString(event.type)
                      << ": " << event.message << std::endl;
        });

        session->connect(config);
        std::thread worker([&ioContext] { ioContext.run(); });

        // Run until signal received
        while (g_running) {
            std::this_thread::sleep_for(std::chrono::seconds(1));
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
