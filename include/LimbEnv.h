#pragma once

// LimbEnv
//
// Synchronous observe/act surface over the pneumatic limb:
//
//   connect()                   pressuregen handshake, shared state, workers
//   getObs() / step(actions)    snapshot contractions / queue one action
//   keepStep / looseAll / reset timed sequences built on step()
//   close() / forceClose()      clean shutdown / immediate teardown
//
// Worker failures are detected lazily: getObs() and step() check both
// workers, and on a fault terminate both and throw WorkerFaultError. There
// are no retries; reconnecting is the caller's decision.
//
// Threading: one controlling thread. LimbEnv is not thread-safe.

#include <cstdint>
#include <memory>
#include <optional>
#include <vector>

#include "Clock.h"
#include "Config.h"
#include "Errors.h"
#include "HardwareClient.h"
#include "SharedState.h"
#include "Workers.h"

namespace pneuma {

enum class EnvState {
    Unconnected,
    Connected,
    Closed,
};

const char* envStateName(EnvState s);

class LimbEnv {
public:
    struct Stats {
        std::uint64_t steps = 0;             // actions pushed by this env
        std::uint64_t comm_cycles = 0;       // observation cycles completed
        std::uint64_t ctrl_actuations = 0;   // actions forwarded to hardware
        std::uint64_t ticks_seen_by_comm = 0;
    };

    LimbEnv(LimbConfig config, HardwareClientFactory factory);
    LimbEnv(LimbConfig config, HardwareClientFactory factory, std::shared_ptr<Clock> clock);
    ~LimbEnv();

    LimbEnv(const LimbEnv&) = delete;
    LimbEnv& operator=(const LimbEnv&) = delete;
    LimbEnv(LimbEnv&&) = delete;
    LimbEnv& operator=(LimbEnv&&) = delete;

    // Throws AlreadyConnectedError while Connected. From Closed, builds a
    // fresh connection.
    void connect();

    std::vector<double> getObs();
    void step(const std::vector<double>& actions);

    // step() at least once, then until `period_s` has elapsed on the clock.
    void keepStep(const std::vector<double>& actions, double period_s);

    void looseAll();
    void looseAll(double period_s);

    // looseAll(period) or keepStep(actions, period), then getObs().
    std::vector<double> reset();
    std::vector<double> reset(const std::optional<std::vector<double>>& actions, double period_s);

    void close();
    void forceClose();

    // Handles stay valid (and inspectable) after teardown until the next
    // connect(). NotConnectedError before the first connect().
    WorkerProcess& commWorker();
    WorkerProcess& ctrlWorker();

    EnvState state() const { return state_; }
    bool isConnected() const { return state_ == EnvState::Connected; }
    int muscleCount() const { return muscles_; }
    std::uint64_t stepCount() const { return steps_; }
    const LimbConfig& config() const { return config_; }

    // Shared state of the live connection, for diagnostics.
    // NotConnectedError unless Connected.
    SharedRegion& sharedRegion();

    // Last action vector the control worker forwarded to hardware.
    std::vector<double> lastAppliedActions();
    Stats stats();

private:
    void requireConnected(const char* op) const;
    void checkWorkers();
    [[noreturn]] void failWith(WorkerFault fault);
    bool consumerGone();
    std::unique_ptr<HardwareClient> openClient();
    void startWorkers(int muscles);
    void stopPressuregenAfterFailure(HardwareClient& client);

    LimbConfig config_;
    HardwareClientFactory factory_;
    std::shared_ptr<Clock> clock_;

    EnvState state_ = EnvState::Unconnected;
    int muscles_ = 0;
    std::uint64_t steps_ = 0;

    // Declaration order matters: workers are destroyed (terminated) before
    // the region their fault slots live in.
    std::unique_ptr<SharedRegion> region_;
    std::unique_ptr<CommWorker> comm_body_;
    std::unique_ptr<CtrlWorker> ctrl_body_;
    std::unique_ptr<WorkerProcess> comm_;
    std::unique_ptr<WorkerProcess> ctrl_;
};

} // namespace pneuma
