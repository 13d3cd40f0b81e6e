#include "tracker_session/reconnect_policy.hpp"

#include <algorithm>

namespace tracker_session {

ReconnectPolicy::ReconnectPolicy(const ReconnectConfig& config)
    : config_(config)
    , current_(config.initialDelay)
{
}

std::chrono::milliseconds ReconnectPolicy::nextDelay() {
    std::chrono::milliseconds delay = std::min(current_, config_.maxDelay);

    double scaled = static_cast<double>(current_.count()) * config_.multiplier;
    if (scaled >= static_cast<double>(config_.maxDelay.count())) {
        current_ = config_.maxDelay;
    } else {
        current_ = std::chrono::milliseconds(static_cast<int64_t>(scaled));
    }

    ++attempts_;
    return delay;
}

void ReconnectPolicy::reset() {
    current_ = config_.initialDelay;
    attempts_ = 0;
}

} // namespace tracker_session
