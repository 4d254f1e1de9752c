#include "Workers.h"

#include "Clock.h"
#include "Log.h"

#include <cerrno>
#include <csignal>
#include <cstdio>
#include <cstring>
#include <stdexcept>
#include <sys/wait.h>
#include <unistd.h>

#ifdef __linux__
#  include <sys/prctl.h>
#endif

namespace pneuma {

namespace {

static std::string formatTrace(const char* worker,
                               const std::string& hostname,
                               std::uint64_t cycle,
                               const char* stage) {
    char buf[256];
    std::snprintf(buf, sizeof(buf), "  at %s worker (pid %d, host '%s'), cycle %llu, stage '%s'",
                  worker, static_cast<int>(::getpid()), hostname.c_str(),
                  static_cast<unsigned long long>(cycle), stage);
    return buf;
}

static void captureFault(FaultSlot& slot,
                         DuplexEndpoint& endpoint,
                         const char* worker,
                         const std::string& hostname,
                         std::uint64_t cycle,
                         const char* stage,
                         const char* cause) {
    WorkerFault f;
    f.worker = worker;
    f.cause = cause ? cause : "(unknown)";
    f.trace = formatTrace(worker, hostname, cycle, stage);
    slot.capture(f);
    endpoint.postFault();
    logf(LogLevel::Error, "%s failed in '%s': %s", worker, stage, f.cause.c_str());
}

// Sleeps out the remainder of a cycle that began at t0_s.
static void finishCycle(double t0_s, double budget_s, const char* worker, std::uint64_t cycle) {
    const double used = monotonicNow_s() - t0_s;
    if (used > budget_s) {
        logf(LogLevel::Debug, "%s cycle %llu overran budget: %.3f ms > %.3f ms", worker,
             static_cast<unsigned long long>(cycle), used * 1e3, budget_s * 1e3);
        return;
    }
    sleepFor_s(budget_s - used);
}

static std::unique_ptr<HardwareClient> openClient(const WorkerParams& p) {
    if (!p.factory) {
        throw std::runtime_error("no hardware client factory");
    }
    std::unique_ptr<HardwareClient> client = p.factory(p.hostname);
    if (!client) {
        throw std::runtime_error("hardware client factory returned null");
    }
    return client;
}

} // namespace

const char* workerStateName(WorkerState s) {
    switch (s) {
        case WorkerState::NotStarted: return "not-started";
        case WorkerState::Running:    return "running";
        case WorkerState::Terminated: return "terminated";
    }
    return "?";
}

// ------------------------------------------------------------
// WorkerProcess
// ------------------------------------------------------------

WorkerProcess::WorkerProcess(std::string name, Body body, FaultSlot* slot)
    : name_(std::move(name)), body_(std::move(body)), slot_(slot) {}

WorkerProcess::~WorkerProcess() {
    terminate();
}

void WorkerProcess::start() {
    if (state_ != WorkerState::NotStarted) {
        throw ControlError(name_ + " worker already started");
    }

    // Do not let buffered parent output get flushed twice.
    std::fflush(nullptr);

    const pid_t parent = ::getpid();
    const pid_t pid = ::fork();
    if (pid < 0) {
        throw ControlError(name_ + " worker: fork failed: " + std::strerror(errno));
    }

    if (pid == 0) {
#ifdef __linux__
        ::prctl(PR_SET_PDEATHSIG, SIGKILL);
        if (::getppid() != parent) {
            ::_exit(1);
        }
#endif
        setLogRole(name_.c_str());
        int rc = 1;
        try {
            rc = body_();
        } catch (const std::exception& e) {
            // Bodies capture their own faults; this only guards the handoff.
            logf(LogLevel::Error, "uncaught exception in worker body: %s", e.what());
        }
        std::fflush(nullptr);
        ::_exit(rc);
    }

    pid_ = pid;
    state_ = WorkerState::Running;
    logf(LogLevel::Info, "%s worker started (pid %d)", name_.c_str(), static_cast<int>(pid_));
}

void WorkerProcess::terminate() {
    if (state_ == WorkerState::NotStarted) {
        state_ = WorkerState::Terminated;
        detachSlot();
        return;
    }
    if (state_ == WorkerState::Terminated) {
        return;
    }

    if (::kill(pid_, SIGKILL) != 0 && errno != ESRCH) {
        logf(LogLevel::Warning, "%s worker: kill(%d) failed: %s", name_.c_str(),
             static_cast<int>(pid_), std::strerror(errno));
    }

    int status = 0;
    pid_t r = -1;
    do {
        r = ::waitpid(pid_, &status, 0);
    } while (r < 0 && errno == EINTR);
    if (r == pid_) {
        wait_status_ = status;
    }

    state_ = WorkerState::Terminated;
    detachSlot();
    logf(LogLevel::Info, "%s worker terminated (pid %d)", name_.c_str(), static_cast<int>(pid_));
}

bool WorkerProcess::isAlive() {
    if (state_ != WorkerState::Running) {
        return false;
    }
    int status = 0;
    const pid_t r = ::waitpid(pid_, &status, WNOHANG);
    if (r == 0) {
        return true;
    }
    if (r == pid_) {
        wait_status_ = status;
    }
    // Exited on its own (or is no longer our child).
    state_ = WorkerState::Terminated;
    detachSlot();
    logf(LogLevel::Warning, "%s worker (pid %d) exited, status %d", name_.c_str(),
         static_cast<int>(pid_), wait_status_);
    return false;
}

std::optional<WorkerFault> WorkerProcess::fault() const {
    if (captured_) {
        return captured_;
    }
    WorkerFault f;
    if (slot_ && slot_->read(f)) {
        return f;
    }
    return std::nullopt;
}

void WorkerProcess::detachSlot() {
    if (!slot_) return;
    WorkerFault f;
    if (slot_->read(f)) {
        captured_ = f;
    }
    slot_ = nullptr;
}

// ------------------------------------------------------------
// CommWorker
// ------------------------------------------------------------

CommWorker::CommWorker(WorkerParams params, SharedRegion& region)
    : params_(std::move(params)), region_(region), endpoint_(region.commEndpoint()) {}

int CommWorker::run() {
    const char* stage = "connect";
    std::uint64_t cycle = 0;
    try {
        std::unique_ptr<HardwareClient> client = openClient(params_);
        const int muscles = region_.muscles();

        for (;;) {
            const double t0 = monotonicNow_s();

            stage = "read_contractions";
            const std::vector<double> obs = client->readContractions();
            if (static_cast<int>(obs.size()) != muscles) {
                char msg[96];
                std::snprintf(msg, sizeof(msg), "protocol error: expected %d readings, got %zu",
                              muscles, obs.size());
                throw std::runtime_error(msg);
            }

            stage = "publish_observation";
            region_.writeObservation(obs);

            stage = "duplex";
            const DuplexEndpoint::Signals sig = endpoint_.poll();
            if (sig.new_ticks > 0) {
                region_.stats().ticks_seen_by_comm.fetch_add(sig.new_ticks, std::memory_order_relaxed);
            }
            if (sig.peer_faulted) {
                logf(LogLevel::Warning, "control worker faulted; stopping observation stream");
                return 0;
            }
            endpoint_.postTick();
            region_.stats().comm_cycles.fetch_add(1, std::memory_order_relaxed);

            finishCycle(t0, params_.cycle_timeout_s, "comm", cycle);
            ++cycle;
        }
    } catch (const std::exception& e) {
        captureFault(region_.commFault(), endpoint_, "comm", params_.hostname, cycle, stage, e.what());
    }
    return 1;
}

// ------------------------------------------------------------
// CtrlWorker
// ------------------------------------------------------------

CtrlWorker::CtrlWorker(WorkerParams params, SharedRegion& region)
    : params_(std::move(params)), region_(region), endpoint_(region.ctrlEndpoint()) {}

int CtrlWorker::run() {
    const char* stage = "connect";
    std::uint64_t cycle = 0;
    try {
        std::unique_ptr<HardwareClient> client = openClient(params_);
        std::vector<double> actions;
        actions.reserve(static_cast<std::size_t>(region_.muscles()));

        for (;;) {
            stage = "receive";
            // Bounded so the duplex channel is still read while idle.
            if (region_.commands().pop(actions, params_.cycle_timeout_s)) {
                const double t0 = monotonicNow_s();

                stage = "send_actions";
                client->sendActions(actions);

                const double used = monotonicNow_s() - t0;
                if (used > params_.cycle_timeout_s) {
                    logf(LogLevel::Debug, "actuation %llu took %.3f ms (budget %.3f ms)",
                         static_cast<unsigned long long>(cycle), used * 1e3,
                         params_.cycle_timeout_s * 1e3);
                }

                stage = "mirror_actions";
                region_.writeAppliedActions(actions);
                region_.stats().ctrl_actuations.fetch_add(1, std::memory_order_relaxed);
                endpoint_.postTick();
                ++cycle;
            }

            stage = "duplex";
            if (endpoint_.poll().peer_faulted) {
                logf(LogLevel::Warning, "comm worker faulted; stopping actuation");
                return 0;
            }
        }
    } catch (const std::exception& e) {
        captureFault(region_.ctrlFault(), endpoint_, "ctrl", params_.hostname, cycle, stage, e.what());
    }
    return 1;
}

} // namespace pneuma
