#pragma once

#include "relay_dispatcher/transport.hpp"

#include <chrono>
#include <cstdint>
#include <functional>
#include <memory>
#include <mutex>
#include <string>

namespace relay_dispatcher {

/**
 * @class IRelayDispatcher
 * @brief Interface the tracker session uses to drive the ignition relay
 *
 * Calls may block for the duration of a retry cycle, so callers must not
 * invoke them from a socket event loop.
 */
class IRelayDispatcher {
public:
    virtual ~IRelayDispatcher() = default;

    /**
     * @brief Forward a canonical command line to the relay controller
     *
     * @param command ENGINE_STOP, ENGINE_RESUME or pass-through text
     * @return true if the command was written
     */
    virtual bool send(const std::string& command) = 0;

    /**
     * @brief Check whether the relay link is currently open
     */
    virtual bool isConnected() const = 0;
};

/**
 * @brief Bounded retry policy for relay writes
 */
struct RetryPolicy {
    uint32_t maxAttempts;                   ///< Total write attempts, including the first
    std::chrono::milliseconds backoff;      ///< Wait before reopening the link after a failure
    std::chrono::milliseconds settleDelay;  ///< Wait after opening the link before writing

    RetryPolicy()
        : maxAttempts(2)
        , backoff(1000)
        , settleDelay(500)
    {}
};

/**
 * @brief Dispatcher statistics
 */
struct DispatcherStats {
    uint64_t commandsSent = 0;
    uint64_t commandsFailed = 0;
    uint64_t commandsLost = 0;      ///< Failed after every retry
    uint64_t reconnects = 0;
};

/**
 * @class RelayDispatcher
 * @brief IRelayDispatcher over an IRelayTransport with reconnect-and-resend
 *
 * Each send() opens the transport if needed, waits for the controller to
 * settle, and writes the line. On failure it waits, closes, reopens and
 * resends, up to RetryPolicy::maxAttempts writes in total. Concurrent
 * send() calls are serialized so lines reach the controller in call order.
 */
class RelayDispatcher : public IRelayDispatcher {
public:
    /**
     * @brief Called with the command when every attempt has failed
     *
     * Runs on the thread that called send(); it must not call send() itself.
     */
    using LostCommandCallback = std::function<void(const std::string& command)>;

    /**
     * @brief Construct a new RelayDispatcher
     *
     * @param transport Link to the relay controller
     * @param policy Retry policy
     */
    explicit RelayDispatcher(std::shared_ptr<IRelayTransport> transport,
                             const RetryPolicy& policy = RetryPolicy{});

    bool send(const std::string& command) override;
    bool isConnected() const override;

    void setLostCommandCallback(LostCommandCallback callback);

    DispatcherStats getStats() const;
    const RetryPolicy& getRetryPolicy() const { return policy_; }

private:
    bool openTransport();
    void pause(std::chrono::milliseconds delay) const;

    std::shared_ptr<IRelayTransport> transport_;
    RetryPolicy policy_;
    LostCommandCallback lostCommandCallback_;

    std::mutex sendMutex_;
    mutable std::mutex statsMutex_;
    DispatcherStats stats_;
};

} // namespace relay_dispatcher
