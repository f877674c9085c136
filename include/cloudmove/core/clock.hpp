#pragma once

#include <chrono>
#include <functional>
#include <thread>

namespace cloudmove {

using SteadyTime = std::chrono::steady_clock::time_point;

/**
 * @brief Time source and sleeper used by the transfer pipeline
 *
 * The pipeline never reads std::chrono clocks directly, so tests can
 * substitute a clock whose sleep advances a counter instead of blocking.
 */
struct Clock {
    std::function<SteadyTime()> now;
    std::function<void(std::chrono::milliseconds)> sleep;

    static Clock system() {
        return Clock{
            [] { return std::chrono::steady_clock::now(); },
            [](std::chrono::milliseconds duration) { std::this_thread::sleep_for(duration); }
        };
    }
};

} // namespace cloudmove
