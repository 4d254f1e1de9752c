#pragma once

// Worker processes.
//
// WorkerProcess is the handle the orchestrator keeps for a forked worker.
// CommWorker and CtrlWorker are the bodies that run inside the children:
//
//   CommWorker  hardware -> observation buffer, once per cycle
//   CtrlWorker  command channel -> hardware, as actions arrive
//
// Neither body lets an exception escape. A failure is written into the
// worker's FaultSlot (cause + trace), announced to the peer over the duplex
// channel, and the child exits; the orchestrator picks it up on its next
// getObs()/step().

#include <cstdint>
#include <functional>
#include <optional>
#include <string>
#include <sys/types.h>

#include "Errors.h"
#include "HardwareClient.h"
#include "SharedState.h"

namespace pneuma {

enum class WorkerState {
    NotStarted,
    Running,
    Terminated,
};

const char* workerStateName(WorkerState s);

class WorkerProcess {
public:
    using Body = std::function<int()>;

    // `slot` must stay mapped until terminate() or until the exit has been
    // reaped by isAlive(); the handle copies any captured fault out of it then.
    WorkerProcess(std::string name, Body body, FaultSlot* slot);
    ~WorkerProcess();

    WorkerProcess(const WorkerProcess&) = delete;
    WorkerProcess& operator=(const WorkerProcess&) = delete;

    void start();

    // SIGKILL + reap. Safe to call any number of times, in any state.
    void terminate();

    // Reaps the child if it has exited on its own.
    bool isAlive();

    WorkerState state() const { return state_; }
    pid_t pid() const { return pid_; }
    const std::string& name() const { return name_; }

    // Raw wait status of a reaped child, -1 if unknown.
    int waitStatus() const { return wait_status_; }

    std::optional<WorkerFault> fault() const;

private:
    void detachSlot();

    std::string name_;
    Body body_;
    FaultSlot* slot_ = nullptr;
    std::optional<WorkerFault> captured_;

    WorkerState state_ = WorkerState::NotStarted;
    pid_t pid_ = -1;
    int wait_status_ = -1;
};

struct WorkerParams {
    std::string hostname;
    HardwareClientFactory factory;
    double cycle_timeout_s = 0.0;
};

class CommWorker {
public:
    CommWorker(WorkerParams params, SharedRegion& region);

    // Child-side entry point. Returns the process exit code.
    int run();

private:
    WorkerParams params_;
    SharedRegion& region_;
    DuplexEndpoint endpoint_;
};

class CtrlWorker {
public:
    CtrlWorker(WorkerParams params, SharedRegion& region);

    int run();

private:
    WorkerParams params_;
    SharedRegion& region_;
    DuplexEndpoint endpoint_;
};

} // namespace pneuma
