#include "SharedState.h"

#include <algorithm>
#include <cstdio>
#include <mutex>
#include <new>
#include <stdexcept>

#include <boost/date_time/posix_time/posix_time_types.hpp>
#include <boost/interprocess/anonymous_shared_memory.hpp>
#include <boost/interprocess/sync/scoped_lock.hpp>

namespace pneuma {

namespace bip = boost::interprocess;

namespace {

// Boost.Interprocess timed waits take an absolute UTC deadline.
static boost::posix_time::ptime deadlineAfter(double seconds) {
    const long us = static_cast<long>(std::max(0.0, seconds) * 1e6);
    return boost::posix_time::microsec_clock::universal_time() +
           boost::posix_time::microseconds(us);
}

} // namespace

// ------------------------------------------------------------
// CommandChannel
// ------------------------------------------------------------

CommandChannel::CommandChannel(int width) : width_(width) {
    if (width < 1 || width > kMaxMuscles) {
        throw std::invalid_argument("CommandChannel: width out of range");
    }
}

void CommandChannel::storeLocked(const std::vector<double>& actions) {
    std::copy(actions.begin(), actions.end(), slot_);
    full_ = true;
    ++pushed_;
}

bool CommandChannel::push(const std::vector<double>& actions,
                          double poll_s,
                          const std::function<bool()>& abandon) {
    if (static_cast<int>(actions.size()) != width_) {
        throw std::invalid_argument("CommandChannel::push: width mismatch");
    }

    // Every wait here is bounded: a consumer killed mid-pop may hold the
    // mutex forever, and `abandon` is how the caller finds out.
    for (;;) {
        {
            bip::scoped_lock<bip::interprocess_mutex> lock(mutex_, deadlineAfter(poll_s));
            if (lock.owns()) {
                if (full_) {
                    not_full_.timed_wait(lock, deadlineAfter(poll_s));
                }
                if (!full_) {
                    storeLocked(actions);
                    not_empty_.notify_one();
                    return true;
                }
            }
        }
        if (abandon && abandon()) {
            return false;
        }
    }
}

bool CommandChannel::tryPush(const std::vector<double>& actions) {
    if (static_cast<int>(actions.size()) != width_) {
        throw std::invalid_argument("CommandChannel::tryPush: width mismatch");
    }
    bip::scoped_lock<bip::interprocess_mutex> lock(mutex_);
    if (full_) return false;
    storeLocked(actions);
    not_empty_.notify_one();
    return true;
}

bool CommandChannel::pop(std::vector<double>& out, double timeout_s) {
    const boost::posix_time::ptime deadline = deadlineAfter(timeout_s);
    bip::scoped_lock<bip::interprocess_mutex> lock(mutex_, deadline);
    if (!lock.owns()) return false;

    while (!full_) {
        if (!not_empty_.timed_wait(lock, deadline)) {
            if (!full_) return false;
            break;
        }
    }

    out.assign(slot_, slot_ + width_);
    full_ = false;
    ++popped_;
    not_full_.notify_one();
    return true;
}

bool CommandChannel::pending() {
    bip::scoped_lock<bip::interprocess_mutex> lock(mutex_);
    return full_;
}

std::uint64_t CommandChannel::pushedCount() {
    bip::scoped_lock<bip::interprocess_mutex> lock(mutex_);
    return pushed_;
}

std::uint64_t CommandChannel::poppedCount() {
    bip::scoped_lock<bip::interprocess_mutex> lock(mutex_);
    return popped_;
}

// ------------------------------------------------------------
// DuplexEndpoint
// ------------------------------------------------------------

void DuplexEndpoint::postTick() {
    out_->ticks.fetch_add(1, std::memory_order_release);
}

void DuplexEndpoint::postFault() {
    out_->fault.store(1u, std::memory_order_release);
}

DuplexEndpoint::Signals DuplexEndpoint::poll() {
    Signals s;
    s.peer_ticks = in_->ticks.load(std::memory_order_acquire);
    s.new_ticks = s.peer_ticks - seen_;
    seen_ = s.peer_ticks;
    s.peer_faulted = in_->fault.load(std::memory_order_acquire) != 0u;
    return s;
}

// ------------------------------------------------------------
// FaultSlot
// ------------------------------------------------------------

void FaultSlot::capture(const WorkerFault& fault) {
    std::uint32_t expected = 0;
    if (!state_.compare_exchange_strong(expected, 1u, std::memory_order_acq_rel)) {
        return;
    }
    std::snprintf(worker_, sizeof(worker_), "%s", fault.worker.c_str());
    std::snprintf(cause_, sizeof(cause_), "%s", fault.cause.c_str());
    std::snprintf(trace_, sizeof(trace_), "%s", fault.trace.c_str());
    state_.store(2u, std::memory_order_release);
}

bool FaultSlot::isSet() const {
    return state_.load(std::memory_order_acquire) == 2u;
}

bool FaultSlot::read(WorkerFault& out) const {
    if (!isSet()) return false;
    out.worker = worker_;
    out.cause = cause_;
    out.trace = trace_;
    return true;
}

// ------------------------------------------------------------
// SharedRegion
// ------------------------------------------------------------

SharedRegion::SharedRegion(int muscles)
    : region_(bip::anonymous_shared_memory(sizeof(SharedLayout))) {
    if (muscles < 1 || muscles > kMaxMuscles) {
        throw ControlError("muscle count out of range");
    }
    layout_ = new (region_.get_address()) SharedLayout(muscles);
}

SharedRegion::~SharedRegion() {
    // No destructors run on the layout: a worker may have been killed inside
    // a critical section, destroying a held mutex is undefined, and the
    // primitives own nothing beyond the mapping itself.
    layout_ = nullptr;
}

void SharedRegion::writeObservation(const std::vector<double>& obs) {
    const std::size_t n = std::min(obs.size(), static_cast<std::size_t>(layout_->muscles));
    std::lock_guard<RobustMutex> lock(layout_->obs_lock);
    std::copy(obs.begin(), obs.begin() + static_cast<std::ptrdiff_t>(n), layout_->obs);
}

RobustMutex::LockResult SharedRegion::readObservation(std::vector<double>& out, double timeout_s) {
    const RobustMutex::LockResult r = layout_->obs_lock.lockFor(timeout_s);
    if (r == RobustMutex::LockResult::TimedOut) return r;
    out.assign(layout_->obs, layout_->obs + layout_->muscles);
    layout_->obs_lock.unlock();
    return r;
}

void SharedRegion::writeAppliedActions(const std::vector<double>& actions) {
    const std::size_t n = std::min(actions.size(), static_cast<std::size_t>(layout_->muscles));
    std::lock_guard<RobustMutex> lock(layout_->act_lock);
    std::copy(actions.begin(), actions.begin() + static_cast<std::ptrdiff_t>(n), layout_->act);
}

RobustMutex::LockResult SharedRegion::readAppliedActions(std::vector<double>& out, double timeout_s) {
    const RobustMutex::LockResult r = layout_->act_lock.lockFor(timeout_s);
    if (r == RobustMutex::LockResult::TimedOut) return r;
    out.assign(layout_->act, layout_->act + layout_->muscles);
    layout_->act_lock.unlock();
    return r;
}

} // namespace pneuma
