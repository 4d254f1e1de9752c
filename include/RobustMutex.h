#pragma once

#include <pthread.h>

namespace pneuma {

// Process-shared mutex that survives its holder being killed.
//
// Lives inside a shared mapping (construct with placement new before any
// fork). When the previous owner died while holding it, the next locker gets
// the mutex back marked consistent and is told so through LockResult; the
// data it guards may be half-written.
//
// Satisfies Lockable, so std::lock_guard / std::unique_lock work; plain
// lock() swallows nothing: owner death is logged, real errors throw
// std::system_error.
class RobustMutex {
public:
    enum class LockResult {
        Acquired,
        OwnerDied,   // acquired, previous holder died inside the critical section
        TimedOut,
    };

    RobustMutex();
    ~RobustMutex();

    RobustMutex(const RobustMutex&) = delete;
    RobustMutex& operator=(const RobustMutex&) = delete;

    void lock();
    bool try_lock();
    void unlock();

    LockResult lockFor(double timeout_s);

private:
    pthread_mutex_t m_;
};

} // namespace pneuma
