#include "cloudmove/migrate/stability_monitor.hpp"

#include "cloudmove/events/events.hpp"

#include <algorithm>
#include <utility>

namespace cloudmove::migrate {
namespace {

std::chrono::milliseconds since(SteadyTime start, SteadyTime now) {
    return std::chrono::duration_cast<std::chrono::milliseconds>(now - start);
}

} // namespace

StabilityMonitor::StabilityMonitor(SyncStatusProbe& probe,
                                   const StatusClassifier& classifier,
                                   StabilitySettings settings,
                                   events::EventBus& bus,
                                   Clock clock)
    : probe_(probe),
      classifier_(classifier),
      settings_(settings),
      bus_(bus),
      clock_(std::move(clock)) {
    settings_.stable_polls_required = std::max<std::size_t>(settings_.stable_polls_required, 1);
}

StabilityResult StabilityMonitor::wait_for_sync(const TransferTask& task, SteadyTime run_started_at) {
    StabilityState state;
    state.poll_started_at = clock_.now();

    while (true) {
        auto raw = probe_.probe(task.destination_path);
        const bool probe_failed = raw.is_error();
        const std::string raw_status = probe_failed ? std::string{} : raw.value();
        const SyncStatus status = probe_failed ? SyncStatus::Blank : classifier_.classify(raw_status);

        ++state.polls;
        if (status == SyncStatus::Done) {
            ++state.consecutive_done;
        } else {
            state.consecutive_done = 0;
        }

        const SteadyTime now = clock_.now();
        const auto file_elapsed = since(task.started_at, now);

        events::PollObservedEvent tick;
        tick.destination_path = task.destination_path;
        tick.raw_status = raw_status;
        tick.status = status;
        tick.probe_failed = probe_failed;
        if (probe_failed) {
            tick.probe_error = raw.error().message;
        }
        tick.stable_count = state.consecutive_done;
        tick.stable_required = settings_.stable_polls_required;
        tick.poll_number = state.polls;
        tick.file_elapsed = file_elapsed;
        tick.run_elapsed = since(run_started_at, now);
        bus_.emit(tick);

        if (state.consecutive_done >= settings_.stable_polls_required) {
            return StabilityResult{StabilityVerdict::Success, state.polls, file_elapsed};
        }
        if (file_elapsed >= settings_.timeout) {
            return StabilityResult{StabilityVerdict::TimedOut, state.polls, file_elapsed};
        }

        clock_.sleep(settings_.poll_interval);
    }
}

} // namespace cloudmove::migrate
