#include "Clock.h"

#include <chrono>
#include <thread>

namespace pneuma {

double monotonicNow_s() {
    // steady_clock is CLOCK_MONOTONIC on Linux, so readings compare across
    // forked processes.
    const auto d = std::chrono::steady_clock::now().time_since_epoch();
    return std::chrono::duration<double>(d).count();
}

void sleepFor_s(double seconds) {
    if (!(seconds > 0.0)) return;
    std::this_thread::sleep_for(std::chrono::duration<double>(seconds));
}

double SteadyClock::now_s() {
    return monotonicNow_s();
}

} // namespace pneuma
