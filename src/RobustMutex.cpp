#include "RobustMutex.h"

#include "Log.h"

#include <cerrno>
#include <cmath>
#include <ctime>
#include <system_error>

namespace pneuma {

namespace {

static void throwIfError(int rc, const char* what) {
    if (rc != 0) {
        throw std::system_error(rc, std::generic_category(), what);
    }
}

// pthread_mutex_timedlock takes an absolute CLOCK_REALTIME deadline.
static timespec realtimeDeadline(double timeout_s) {
    timespec ts{};
    ::clock_gettime(CLOCK_REALTIME, &ts);
    if (!(timeout_s > 0.0)) return ts;
    const double whole = std::floor(timeout_s);
    ts.tv_sec += static_cast<time_t>(whole);
    ts.tv_nsec += static_cast<long>((timeout_s - whole) * 1e9);
    if (ts.tv_nsec >= 1000000000L) {
        ts.tv_sec += 1;
        ts.tv_nsec -= 1000000000L;
    }
    return ts;
}

} // namespace

RobustMutex::RobustMutex() {
    pthread_mutexattr_t attr;
    throwIfError(::pthread_mutexattr_init(&attr), "pthread_mutexattr_init");
    int rc = ::pthread_mutexattr_setpshared(&attr, PTHREAD_PROCESS_SHARED);
    if (rc == 0) rc = ::pthread_mutexattr_setrobust(&attr, PTHREAD_MUTEX_ROBUST);
    if (rc == 0) rc = ::pthread_mutex_init(&m_, &attr);
    ::pthread_mutexattr_destroy(&attr);
    throwIfError(rc, "RobustMutex init");
}

RobustMutex::~RobustMutex() {
    ::pthread_mutex_destroy(&m_);
}

void RobustMutex::lock() {
    const int rc = ::pthread_mutex_lock(&m_);
    if (rc == EOWNERDEAD) {
        logf(LogLevel::Warning, "robust mutex: previous owner died, recovering");
        throwIfError(::pthread_mutex_consistent(&m_), "pthread_mutex_consistent");
        return;
    }
    throwIfError(rc, "pthread_mutex_lock");
}

bool RobustMutex::try_lock() {
    const int rc = ::pthread_mutex_trylock(&m_);
    if (rc == EBUSY) return false;
    if (rc == EOWNERDEAD) {
        logf(LogLevel::Warning, "robust mutex: previous owner died, recovering");
        throwIfError(::pthread_mutex_consistent(&m_), "pthread_mutex_consistent");
        return true;
    }
    throwIfError(rc, "pthread_mutex_trylock");
    return true;
}

void RobustMutex::unlock() {
    ::pthread_mutex_unlock(&m_);
}

RobustMutex::LockResult RobustMutex::lockFor(double timeout_s) {
    const timespec deadline = realtimeDeadline(timeout_s);
    const int rc = ::pthread_mutex_timedlock(&m_, &deadline);
    if (rc == 0) return LockResult::Acquired;
    if (rc == ETIMEDOUT) return LockResult::TimedOut;
    if (rc == EOWNERDEAD) {
        throwIfError(::pthread_mutex_consistent(&m_), "pthread_mutex_consistent");
        return LockResult::OwnerDied;
    }
    throwIfError(rc, "pthread_mutex_timedlock");
    return LockResult::TimedOut;
}

} // namespace pneuma
