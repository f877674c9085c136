#pragma once

#include "cloudmove/core/clock.hpp"
#include "cloudmove/events/event_bus.hpp"
#include "cloudmove/migrate/status_classifier.hpp"
#include "cloudmove/migrate/status_probe.hpp"
#include "cloudmove/migrate/types.hpp"

#include <chrono>
#include <cstddef>

namespace cloudmove::migrate {

struct StabilitySettings {
    std::chrono::milliseconds poll_interval{std::chrono::seconds(5)};
    std::chrono::milliseconds timeout{std::chrono::minutes(30)};
    std::size_t stable_polls_required = 2;
};

/**
 * @brief Confirms that a destination copy has settled into the Done state
 *
 * Each tick probes the destination, classifies the answer and updates the
 * StabilityState:
 *   1. Done increments the counter, anything else resets it to 0
 *   2. counter >= stable_polls_required  -> Success
 *   3. time since task.started_at >= timeout -> TimedOut
 *   4. otherwise sleep poll_interval and tick again
 *
 * The timeout is only evaluated on a tick, never during a sleep. Probe
 * failures count as Blank observations.
 */
class StabilityMonitor {
public:
    StabilityMonitor(SyncStatusProbe& probe,
                     const StatusClassifier& classifier,
                     StabilitySettings settings,
                     events::EventBus& bus,
                     Clock clock = Clock::system());

    /**
     * @brief Poll until Success or TimedOut
     *
     * @param task           File being confirmed; started_at anchors the timeout
     * @param run_started_at Process start, reported in poll events only
     */
    StabilityResult wait_for_sync(const TransferTask& task, SteadyTime run_started_at);

    [[nodiscard]] const StabilitySettings& settings() const noexcept { return settings_; }

private:
    SyncStatusProbe& probe_;
    const StatusClassifier& classifier_;
    StabilitySettings settings_;
    events::EventBus& bus_;
    Clock clock_;
};

} // namespace cloudmove::migrate
