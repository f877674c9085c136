#pragma once

#include "cloudmove/events/event_bus.hpp"

#include <boost/asio/io_context.hpp>
#include <boost/asio/signal_set.hpp>

#include <atomic>
#include <thread>

namespace cloudmove {

/**
 * @brief Process-wide cooperative stop flag
 *
 * Set once, never reset. The orchestrator reads it only at the top of
 * its per-file loop.
 */
class CancellationToken {
public:
    CancellationToken() = default;

    CancellationToken(const CancellationToken&) = delete;
    CancellationToken& operator=(const CancellationToken&) = delete;

    /// @return true if this call was the one that set the flag
    bool request() noexcept {
        bool expected = false;
        return requested_.compare_exchange_strong(expected, true);
    }

    [[nodiscard]] bool is_requested() const noexcept {
        return requested_.load();
    }

private:
    std::atomic<bool> requested_{false};
};

/**
 * @brief Turns SIGINT/SIGTERM into a cancellation request
 *
 * Runs a boost::asio io_context on a background thread with a signal_set
 * registered for SIGINT and SIGTERM. The first signal sets the token and
 * emits CancellationRequestedEvent; later signals are logged and ignored,
 * so an in-flight copy or poll loop always completes.
 */
class InterruptListener {
public:
    InterruptListener(CancellationToken& token, events::EventBus& bus);
    ~InterruptListener();

    InterruptListener(const InterruptListener&) = delete;
    InterruptListener& operator=(const InterruptListener&) = delete;

    void stop();

private:
    void arm();

    CancellationToken& token_;
    events::EventBus& bus_;
    boost::asio::io_context io_context_;
    boost::asio::signal_set signals_;
    std::thread worker_;
};

} // namespace cloudmove
