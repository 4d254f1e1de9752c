#pragma once

#include <stdexcept>
#include <string>
#include <utility>

namespace pneuma {

// A failure captured inside a worker process.
struct WorkerFault {
    std::string worker;  // "comm" or "ctrl"
    std::string cause;   // what() of the original exception
    std::string trace;   // pid, cycle, stage at the point of failure
};

class ControlError : public std::runtime_error {
public:
    explicit ControlError(const std::string& what) : std::runtime_error(what) {}
};

// Operation needs an active connection (or a worker accessor was used
// before the first connect).
class NotConnectedError : public ControlError {
public:
    explicit NotConnectedError(const std::string& what) : ControlError(what) {}
};

class AlreadyConnectedError : public ControlError {
public:
    explicit AlreadyConnectedError(const std::string& what) : ControlError(what) {}
};

class InvalidActionError : public ControlError {
public:
    explicit InvalidActionError(const std::string& what) : ControlError(what) {}
};

// Raised from the first getObs()/step() that observes a worker fault. Both
// workers have already been terminated when this is thrown.
class WorkerFaultError : public ControlError {
public:
    explicit WorkerFaultError(WorkerFault fault)
        : ControlError(format(fault)), fault_(std::move(fault)) {}

    const WorkerFault& fault() const { return fault_; }

private:
    static std::string format(const WorkerFault& f) {
        std::string s = f.worker + " worker fault: " + f.cause;
        if (!f.trace.empty()) {
            s += "\n" + f.trace;
        }
        return s;
    }

    WorkerFault fault_;
};

} // namespace pneuma
