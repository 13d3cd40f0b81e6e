#include "relay_dispatcher/relay_dispatcher.hpp"

#include <spdlog/spdlog.h>

#include <algorithm>
#include <stdexcept>
#include <thread>

namespace relay_dispatcher {

RelayDispatcher::RelayDispatcher(std::shared_ptr<IRelayTransport> transport, const RetryPolicy& policy)
    : transport_(std::move(transport))
    , policy_(policy)
{
    if (!transport_) {
        throw std::invalid_argument("RelayDispatcher requires a transport");
    }
    policy_.maxAttempts = std::max<uint32_t>(1, policy_.maxAttempts);
}

bool RelayDispatcher::send(const std::string& command) {
    if (command.empty()) {
        spdlog::warn("Rejecting empty relay command");
        std::lock_guard<std::mutex> statsLock(statsMutex_);
        stats_.commandsFailed++;
        return false;
    }

    std::lock_guard<std::mutex> lock(sendMutex_);

    for (uint32_t attempt = 1; attempt <= policy_.maxAttempts; ++attempt) {
        if (attempt > 1) {
            spdlog::warn("Relay command {} failed, reconnecting to {} (attempt {}/{})",
                         command, transport_->describe(), attempt, policy_.maxAttempts);
            pause(policy_.backoff);
            transport_->close();
            if (!openTransport()) {
                continue;
            }
            std::lock_guard<std::mutex> statsLock(statsMutex_);
            stats_.reconnects++;
        } else if (!transport_->isOpen() && !openTransport()) {
            continue;
        }

        if (transport_->writeLine(command)) {
            spdlog::info("Relay command {} sent to {}", command, transport_->describe());
            std::lock_guard<std::mutex> statsLock(statsMutex_);
            stats_.commandsSent++;
            return true;
        }
    }

    spdlog::error("Relay command {} lost after {} attempts", command, policy_.maxAttempts);
    {
        std::lock_guard<std::mutex> statsLock(statsMutex_);
        stats_.commandsFailed++;
        stats_.commandsLost++;
    }

    if (lostCommandCallback_) {
        lostCommandCallback_(command);
    }
    return false;
}

bool RelayDispatcher::isConnected() const {
    return transport_->isOpen();
}

void RelayDispatcher::setLostCommandCallback(LostCommandCallback callback) {
    std::lock_guard<std::mutex> lock(sendMutex_);
    lostCommandCallback_ = std::move(callback);
}

DispatcherStats RelayDispatcher::getStats() const {
    std::lock_guard<std::mutex> lock(statsMutex_);
    return stats_;
}

bool RelayDispatcher::openTransport() {
    if (!transport_->open()) {
        spdlog::warn("Relay link {} could not be opened", transport_->describe());
        return false;
    }
    // Microcontrollers reset when the port opens
    pause(policy_.settleDelay);
    return true;
}

void RelayDispatcher::pause(std::chrono::milliseconds delay) const {
    if (delay.count() > 0) {
        std::this_thread::sleep_for(delay);
    }
}

} // namespace relay_dispatcher
