#include "cloudmove/core/cancellation.hpp"

#include "cloudmove/events/events.hpp"

#include <spdlog/spdlog.h>

#include <csignal>

namespace cloudmove {

InterruptListener::InterruptListener(CancellationToken& token, events::EventBus& bus)
    : token_(token),
      bus_(bus),
      signals_(io_context_, SIGINT, SIGTERM) {
    arm();
    worker_ = std::thread([this] { io_context_.run(); });
}

InterruptListener::~InterruptListener() {
    stop();
}

void InterruptListener::stop() {
    if (!worker_.joinable()) {
        return;
    }
    io_context_.stop();
    worker_.join();

    // The worker has exited, so the signal set is no longer shared
    boost::system::error_code ec;
    signals_.cancel(ec);
    if (ec) {
        spdlog::debug("Signal set cancel: {}", ec.message());
    }
}

void InterruptListener::arm() {
    signals_.async_wait([this](const boost::system::error_code& ec, int signal_number) {
        if (ec) {
            // operation_aborted on shutdown
            return;
        }

        if (token_.request()) {
            bus_.emit(events::CancellationRequestedEvent{signal_number});
        } else {
            spdlog::debug("Signal {} ignored, stop already requested", signal_number);
        }
        arm();
    });
}

} // namespace cloudmove
