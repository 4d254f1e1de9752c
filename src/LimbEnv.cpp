#include "LimbEnv.h"

#include "Log.h"

#include <cstdio>
#include <string>
#include <utility>

namespace pneuma {

const char* envStateName(EnvState s) {
    switch (s) {
        case EnvState::Unconnected: return "unconnected";
        case EnvState::Connected:   return "connected";
        case EnvState::Closed:      return "closed";
    }
    return "?";
}

LimbEnv::LimbEnv(LimbConfig config, HardwareClientFactory factory)
    : LimbEnv(std::move(config), std::move(factory), nullptr) {}

LimbEnv::LimbEnv(LimbConfig config, HardwareClientFactory factory, std::shared_ptr<Clock> clock)
    : config_(std::move(config)), factory_(std::move(factory)), clock_(std::move(clock)) {
    if (!factory_) {
        throw ControlError("LimbEnv: no hardware client factory");
    }
    if (!clock_) {
        clock_ = std::make_shared<SteadyClock>();
    }
    setLogLevel(config_.log_level);
}

LimbEnv::~LimbEnv() {
    forceClose();
}

std::unique_ptr<HardwareClient> LimbEnv::openClient() {
    std::unique_ptr<HardwareClient> client = factory_(config_.hostname);
    if (!client) {
        throw ControlError("hardware client factory returned null for '" + config_.hostname + "'");
    }
    return client;
}

void LimbEnv::requireConnected(const char* op) const {
    if (state_ != EnvState::Connected) {
        throw NotConnectedError(std::string(op) + ": not connected to the robot (state: " +
                                envStateName(state_) + "). Please connect first.");
    }
}

// ------------------------------------------------------------
// Lifecycle
// ------------------------------------------------------------

void LimbEnv::connect() {
    if (state_ == EnvState::Connected) {
        throw AlreadyConnectedError("connect: already connected; close() or forceClose() first");
    }

    // The muscle count is validated before anything is pressurized; once
    // pressuregen runs, every failure below stops it again.
    std::unique_ptr<HardwareClient> client = openClient();
    const int muscles = client->numberOfMuscles();
    if (muscles < 1 || muscles > kMaxMuscles) {
        throw ControlError("connect: hardware reports " + std::to_string(muscles) +
                           " muscles, supported range is 1.." + std::to_string(kMaxMuscles));
    }

    client->startPressuregen();
    try {
        client->waitForDesiredPressure();
        startWorkers(muscles);
    } catch (const std::exception& e) {
        logf(LogLevel::Error, "connect: %s; stopping pressuregen", e.what());
        stopPressuregenAfterFailure(*client);
        throw;
    }
    client.reset();

    steps_ = 0;
    state_ = EnvState::Connected;
    logf(LogLevel::Info, "connected to '%s': %d muscles, cycle budget %.2f ms",
         config_.hostname.c_str(), muscles_, config_.cycle_timeout_s * 1e3);
}

void LimbEnv::startWorkers(int muscles) {
    // Previous connection (if any) is fully torn down already; its handles
    // go now.
    comm_.reset();
    ctrl_.reset();
    comm_body_.reset();
    ctrl_body_.reset();
    region_.reset();

    region_ = std::make_unique<SharedRegion>(muscles);

    WorkerParams params;
    params.hostname = config_.hostname;
    params.factory = factory_;
    params.cycle_timeout_s = config_.cycle_timeout_s;

    comm_body_ = std::make_unique<CommWorker>(params, *region_);
    ctrl_body_ = std::make_unique<CtrlWorker>(params, *region_);

    CommWorker* comm_body = comm_body_.get();
    CtrlWorker* ctrl_body = ctrl_body_.get();
    comm_ = std::make_unique<WorkerProcess>("comm", [comm_body] { return comm_body->run(); },
                                            &region_->commFault());
    ctrl_ = std::make_unique<WorkerProcess>("ctrl", [ctrl_body] { return ctrl_body->run(); },
                                            &region_->ctrlFault());

    try {
        comm_->start();
        ctrl_->start();
    } catch (const std::exception& e) {
        logf(LogLevel::Error, "connect: worker start failed: %s", e.what());
        comm_->terminate();
        ctrl_->terminate();
        // connect() did not succeed, so the accessors report "not initialized".
        comm_.reset();
        ctrl_.reset();
        comm_body_.reset();
        ctrl_body_.reset();
        region_.reset();
        throw;
    }
    muscles_ = muscles;
}

void LimbEnv::stopPressuregenAfterFailure(HardwareClient& client) {
    try {
        client.stopPressuregen();
    } catch (const std::exception& e) {
        // The original failure is what connect() reports.
        logf(LogLevel::Error, "connect: stopPressuregen after failure also failed: %s", e.what());
    }
}

void LimbEnv::close() {
    requireConnected("close");
    try {
        reset();
        std::unique_ptr<HardwareClient> client = openClient();
        client->stopPressuregen();
    } catch (const std::exception& e) {
        logf(LogLevel::Error, "close: %s", e.what());
        forceClose();
        throw;
    }
    forceClose();
}

void LimbEnv::forceClose() {
    if (comm_) comm_->terminate();
    if (ctrl_) ctrl_->terminate();

    // Nothing references the mapping once both children are reaped.
    comm_body_.reset();
    ctrl_body_.reset();
    region_.reset();

    if (state_ == EnvState::Connected) {
        state_ = EnvState::Closed;
        logf(LogLevel::Info, "connection to '%s' closed", config_.hostname.c_str());
    }
}

WorkerProcess& LimbEnv::commWorker() {
    if (!comm_) {
        throw NotConnectedError("Communication worker is not initialized. Please connect to the robot first.");
    }
    return *comm_;
}

WorkerProcess& LimbEnv::ctrlWorker() {
    if (!ctrl_) {
        throw NotConnectedError("Control worker is not initialized. Please connect to the robot first.");
    }
    return *ctrl_;
}

SharedRegion& LimbEnv::sharedRegion() {
    requireConnected("sharedRegion");
    return *region_;
}

// ------------------------------------------------------------
// Fault detection
// ------------------------------------------------------------

void LimbEnv::failWith(WorkerFault fault) {
    logf(LogLevel::Error, "%s worker fault: %s; terminating workers",
         fault.worker.c_str(), fault.cause.c_str());
    forceClose();
    throw WorkerFaultError(std::move(fault));
}

void LimbEnv::checkWorkers() {
    WorkerFault f;
    if (region_->commFault().read(f)) failWith(std::move(f));
    if (region_->ctrlFault().read(f)) failWith(std::move(f));

    // A worker can also vanish without a captured fault (killed from
    // outside, or stopped after its peer failed).
    WorkerProcess* workers[] = {comm_.get(), ctrl_.get()};
    for (WorkerProcess* w : workers) {
        if (w->isAlive()) continue;
        if (std::optional<WorkerFault> captured = w->fault()) {
            failWith(std::move(*captured));
        }
        char status[64];
        std::snprintf(status, sizeof(status), "  wait status %d", w->waitStatus());
        failWith(WorkerFault{w->name(), w->name() + " worker exited unexpectedly", status});
    }
}

bool LimbEnv::consumerGone() {
    return region_->commFault().isSet() || region_->ctrlFault().isSet() ||
           !ctrl_->isAlive() || !comm_->isAlive();
}

// ------------------------------------------------------------
// Observe / act
// ------------------------------------------------------------

std::vector<double> LimbEnv::getObs() {
    requireConnected("getObs");
    checkWorkers();

    std::vector<double> obs;
    switch (region_->readObservation(obs, config_.lock_timeout_s)) {
        case RobustMutex::LockResult::Acquired:
            return obs;
        case RobustMutex::LockResult::OwnerDied:
            failWith(WorkerFault{"comm", "comm worker died while holding the observation lock",
                                 "  detected by getObs"});
        case RobustMutex::LockResult::TimedOut:
            break;
    }
    char cause[96];
    std::snprintf(cause, sizeof(cause), "observation lock not released within %.1f ms",
                  config_.lock_timeout_s * 1e3);
    failWith(WorkerFault{"comm", cause, "  detected by getObs"});
}

void LimbEnv::step(const std::vector<double>& actions) {
    requireConnected("step");
    if (static_cast<int>(actions.size()) != muscles_) {
        throw InvalidActionError("step: expected " + std::to_string(muscles_) +
                                 " actions, got " + std::to_string(actions.size()));
    }

    // Blocks while the previous action is unconsumed (backpressure).
    const bool pushed = region_->commands().push(actions, config_.cycle_timeout_s,
                                                 [this] { return consumerGone(); });
    if (pushed) {
        ++steps_;
    }

    checkWorkers();

    if (!pushed) {
        failWith(WorkerFault{"ctrl", "command channel abandoned: control worker stopped consuming",
                             "  detected by step"});
    }
}

void LimbEnv::keepStep(const std::vector<double>& actions, double period_s) {
    requireConnected("keepStep");
    const double start = clock_->now_s();
    do {
        step(actions);
    } while (clock_->now_s() - start < period_s);
}

void LimbEnv::looseAll() {
    looseAll(config_.full_loose_time_s);
}

void LimbEnv::looseAll(double period_s) {
    requireConnected("looseAll");
    keepStep(std::vector<double>(static_cast<std::size_t>(muscles_), kActionLoose), period_s);
}

std::vector<double> LimbEnv::reset() {
    return reset(std::nullopt, config_.full_loose_time_s);
}

std::vector<double> LimbEnv::reset(const std::optional<std::vector<double>>& actions, double period_s) {
    requireConnected("reset");
    if (!actions) {
        looseAll(period_s);
    } else {
        keepStep(*actions, period_s);
    }
    // Also serves as a liveness check on both workers.
    return getObs();
}

std::vector<double> LimbEnv::lastAppliedActions() {
    requireConnected("lastAppliedActions");
    std::vector<double> out;
    if (region_->readAppliedActions(out, config_.lock_timeout_s) != RobustMutex::LockResult::Acquired) {
        failWith(WorkerFault{"ctrl", "control worker lost while holding the action buffer lock",
                             "  detected by lastAppliedActions"});
    }
    return out;
}

LimbEnv::Stats LimbEnv::stats() {
    Stats s;
    s.steps = steps_;
    if (region_) {
        WorkerStats& w = region_->stats();
        s.comm_cycles = w.comm_cycles.load(std::memory_order_relaxed);
        s.ctrl_actuations = w.ctrl_actuations.load(std::memory_order_relaxed);
        s.ticks_seen_by_comm = w.ticks_seen_by_comm.load(std::memory_order_relaxed);
    }
    return s;
}

} // namespace pneuma
