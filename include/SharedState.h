#pragma once

// SharedState.h
//
// Everything the orchestrator and the two worker processes share for one
// connection, laid out in a single anonymous shared-memory mapping created
// before the workers are forked:
//
//   observation buffer + lock   comm worker writes, orchestrator snapshots
//   action buffer + lock        control worker mirrors the last forwarded action
//   command channel             capacity 1, orchestrator -> control worker
//   duplex channel              comm <-> control, opaque to the orchestrator
//   fault slots                 one per worker, written once
//   worker stats                monotonic counters
//
// The mapping is rebuilt on every connect, so primitives orphaned by a
// killed worker never carry over into the next connection.

#include <atomic>
#include <cstdint>
#include <functional>
#include <memory>
#include <vector>

#include <boost/interprocess/mapped_region.hpp>
#include <boost/interprocess/sync/interprocess_condition.hpp>
#include <boost/interprocess/sync/interprocess_mutex.hpp>

#include "Config.h"
#include "Errors.h"
#include "RobustMutex.h"

namespace pneuma {

// Single-slot queue of action vectors. Lives in shared memory.
class CommandChannel {
public:
    explicit CommandChannel(int width);

    CommandChannel(const CommandChannel&) = delete;
    CommandChannel& operator=(const CommandChannel&) = delete;

    // Blocks while an earlier action is still unconsumed. The wait wakes at
    // least every poll_s to ask `abandon`; returns false without pushing
    // once it answers true.
    bool push(const std::vector<double>& actions,
              double poll_s,
              const std::function<bool()>& abandon);

    bool tryPush(const std::vector<double>& actions);

    // Waits up to timeout_s for an action. False on timeout.
    bool pop(std::vector<double>& out, double timeout_s);

    bool pending();
    int width() const { return width_; }
    std::uint64_t pushedCount();
    std::uint64_t poppedCount();

private:
    void storeLocked(const std::vector<double>& actions);

    boost::interprocess::interprocess_mutex mutex_;
    boost::interprocess::interprocess_condition not_empty_;
    boost::interprocess::interprocess_condition not_full_;

    int width_ = 0;
    bool full_ = false;
    double slot_[kMaxMuscles] = {};
    std::uint64_t pushed_ = 0;
    std::uint64_t popped_ = 0;
};

// Worker-to-worker signalling: two lock-free mailboxes, one per direction.
// Ticks are counters (latest wins, never block); a fault flag is sticky.
struct DuplexMailbox {
    std::atomic<std::uint64_t> ticks{0};
    std::atomic<std::uint32_t> fault{0};
};

class DuplexEndpoint {
public:
    struct Signals {
        std::uint64_t new_ticks = 0;   // peer ticks since the previous poll
        std::uint64_t peer_ticks = 0;  // peer tick total
        bool peer_faulted = false;
    };

    DuplexEndpoint() = default;
    DuplexEndpoint(DuplexMailbox* inbox, DuplexMailbox* outbox) : in_(inbox), out_(outbox) {}

    void postTick();
    void postFault();
    Signals poll();

    bool valid() const { return in_ != nullptr && out_ != nullptr; }

private:
    DuplexMailbox* in_ = nullptr;
    DuplexMailbox* out_ = nullptr;
    std::uint64_t seen_ = 0;
};

// Written once by the worker that owns it, read by anyone.
class FaultSlot {
public:
    // First capture wins; later ones are ignored.
    void capture(const WorkerFault& fault);
    bool isSet() const;
    bool read(WorkerFault& out) const;

private:
    std::atomic<std::uint32_t> state_{0};  // 0 empty, 1 writing, 2 ready
    char worker_[16] = {};
    char cause_[256] = {};
    char trace_[512] = {};
};

struct WorkerStats {
    std::atomic<std::uint64_t> comm_cycles{0};
    std::atomic<std::uint64_t> ctrl_actuations{0};
    std::atomic<std::uint64_t> ticks_seen_by_comm{0};
};

struct SharedLayout {
    explicit SharedLayout(int muscles_in) : muscles(muscles_in), commands(muscles_in) {}

    const int muscles;

    RobustMutex obs_lock;
    double obs[kMaxMuscles] = {};

    RobustMutex act_lock;
    double act[kMaxMuscles] = {};

    CommandChannel commands;

    DuplexMailbox to_comm;
    DuplexMailbox to_ctrl;

    FaultSlot comm_fault;
    FaultSlot ctrl_fault;

    WorkerStats stats;
};

// Owner of one connection's shared mapping.
class SharedRegion {
public:
    explicit SharedRegion(int muscles);
    ~SharedRegion();

    SharedRegion(const SharedRegion&) = delete;
    SharedRegion& operator=(const SharedRegion&) = delete;

    int muscles() const { return layout_->muscles; }

    // Comm worker side.
    void writeObservation(const std::vector<double>& obs);

    // Orchestrator side. `out` is untouched unless the lock was acquired.
    RobustMutex::LockResult readObservation(std::vector<double>& out, double timeout_s);

    void writeAppliedActions(const std::vector<double>& actions);
    RobustMutex::LockResult readAppliedActions(std::vector<double>& out, double timeout_s);

    RobustMutex& observationLock() { return layout_->obs_lock; }
    RobustMutex& actionLock() { return layout_->act_lock; }

    CommandChannel& commands() { return layout_->commands; }
    FaultSlot& commFault() { return layout_->comm_fault; }
    FaultSlot& ctrlFault() { return layout_->ctrl_fault; }
    WorkerStats& stats() { return layout_->stats; }

    DuplexEndpoint commEndpoint() { return DuplexEndpoint(&layout_->to_comm, &layout_->to_ctrl); }
    DuplexEndpoint ctrlEndpoint() { return DuplexEndpoint(&layout_->to_ctrl, &layout_->to_comm); }

private:
    boost::interprocess::mapped_region region_;
    SharedLayout* layout_ = nullptr;
};

} // namespace pneuma
