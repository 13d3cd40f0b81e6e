#pragma once

#include "tracker_session/config.hpp"

#include <chrono>
#include <cstdint>

namespace tracker_session {

/**
 * @class ReconnectPolicy
 * @brief Capped exponential backoff between reconnect attempts
 *
 * The first delay is ReconnectConfig::initialDelay; each following delay is
 * the previous one times the multiplier, never exceeding maxDelay.
 */
class ReconnectPolicy {
public:
    explicit ReconnectPolicy(const ReconnectConfig& config = ReconnectConfig{});

    /**
     * @brief Delay before the next attempt; advances the backoff
     */
    std::chrono::milliseconds nextDelay();

    /**
     * @brief Return to the initial delay, e.g. after a login is acknowledged
     */
    void reset();

    uint32_t attempts() const { return attempts_; }

private:
    ReconnectConfig config_;
    std::chrono::milliseconds current_;
    uint32_t attempts_ = 0;
};

} // namespace tracker_session
