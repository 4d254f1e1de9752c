#pragma once

#include <cstddef>
#include <string>

#include "Log.h"

namespace pneuma {

// Upper bound on muscles per limb; sizes the fixed shared-memory buffers.
constexpr int kMaxMuscles = 64;

// Nominal timing (seconds).
constexpr double kCycleTimeout_s = 0.0045;  // 4.5 ms per worker poll/actuate cycle
constexpr double kFullLooseTime_s = 0.5;    // full de-actuation duration
constexpr double kLockTimeout_s = 0.25;     // bound on observation-lock waits

// Discrete actuation levels. Anything else is accepted and inert.
constexpr double kActionLoose = -1.0;
constexpr double kActionHold = 0.0;
constexpr double kActionContract = 1.0;

struct LimbConfig {
    std::string hostname = "clonepiext";

    // Per-cycle budget for both workers; also the wake-up interval of
    // blocking waits that poll for worker faults.
    double cycle_timeout_s = kCycleTimeout_s;

    // Default period for looseAll()/reset().
    double full_loose_time_s = kFullLooseTime_s;

    double lock_timeout_s = kLockTimeout_s;

    LogLevel log_level = LogLevel::Error;
};

} // namespace pneuma
