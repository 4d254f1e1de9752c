#include "SimulatedLimb.h"

#include "Clock.h"
#include "Config.h"
#include "Log.h"
#include "RobustMutex.h"

#include <algorithm>
#include <cmath>
#include <cstdio>
#include <memory>
#include <mutex>
#include <new>
#include <stdexcept>

#include <boost/interprocess/anonymous_shared_memory.hpp>

namespace pneuma {

namespace bip = boost::interprocess;

namespace {

constexpr double kPressureReachedFrac = 0.999;
constexpr double kPressurePoll_s = 0.001;

static inline double clampd(double x, double lo, double hi) {
    return (x < lo) ? lo : (x > hi) ? hi : x;
}

// Only the three discrete levels move a valve.
static inline bool toValve(double action, std::int8_t& valve) {
    if (action == kActionLoose)    { valve = -1; return true; }
    if (action == kActionHold)     { valve = 0;  return true; }
    if (action == kActionContract) { valve = 1;  return true; }
    return false;
}

} // namespace

struct SimulatedLimb::State {
    RobustMutex mutex;

    Config cfg{};
    int muscles = 0;

    bool pressuregen_on = false;
    double pressure_bar = 0.0;
    double last_update_s = 0.0;

    double contraction[kMaxMuscles] = {};
    std::int8_t valve[kMaxMuscles] = {};

    double last_actions[kMaxMuscles] = {};
    std::uint64_t actions_received = 0;
    std::uint32_t clients_opened = 0;

    bool read_fault = false;
    bool actuation_fault = false;
    char fault_message[128] = {};

    // Caller holds mutex.
    void advance(double now_s) {
        const double dt = now_s - last_update_s;
        last_update_s = now_s;
        if (!(dt > 0.0)) return;

        const double rate = (cfg.pressure_ramp_s > 0.0)
            ? cfg.target_pressure_bar / cfg.pressure_ramp_s
            : 1e12;
        if (pressuregen_on) {
            pressure_bar = std::min(cfg.target_pressure_bar, pressure_bar + rate * dt);
        } else {
            pressure_bar = std::max(0.0, pressure_bar - rate * dt);
        }

        const double a_contract = 1.0 - std::exp(-dt / std::max(cfg.tau_contract_s, 1e-6));
        const double k_loose = std::exp(-dt / std::max(cfg.tau_loose_s, 1e-6));
        for (int i = 0; i < muscles; ++i) {
            double c = contraction[i];
            if (valve[i] > 0) {
                c += (pressure_bar - c) * a_contract;
            } else if (valve[i] < 0) {
                c *= k_loose;
            }
            contraction[i] = clampd(c, 0.0, pressure_bar);
        }
    }
};

class SimulatedLimb::Client : public HardwareClient {
public:
    explicit Client(State* s) : s_(s) {}

    int numberOfMuscles() const override {
        return s_->muscles;
    }

    void startPressuregen() override {
        std::lock_guard<RobustMutex> lock(s_->mutex);
        s_->advance(monotonicNow_s());
        s_->pressuregen_on = true;
    }

    void stopPressuregen() override {
        std::lock_guard<RobustMutex> lock(s_->mutex);
        s_->advance(monotonicNow_s());
        s_->pressuregen_on = false;
        // Venting: every valve opens.
        for (int i = 0; i < s_->muscles; ++i) {
            s_->valve[i] = -1;
        }
    }

    void waitForDesiredPressure() override {
        const double deadline = monotonicNow_s() + s_->cfg.pressure_wait_timeout_s;
        for (;;) {
            {
                std::lock_guard<RobustMutex> lock(s_->mutex);
                const double now = monotonicNow_s();
                s_->advance(now);
                if (!s_->pressuregen_on) {
                    throw std::runtime_error("waitForDesiredPressure: pressuregen is not running");
                }
                if (s_->pressure_bar >= kPressureReachedFrac * s_->cfg.target_pressure_bar) {
                    return;
                }
                if (now >= deadline) {
                    throw std::runtime_error("waitForDesiredPressure: timed out before reaching target pressure");
                }
            }
            sleepFor_s(kPressurePoll_s);
        }
    }

    std::vector<double> readContractions() override {
        std::lock_guard<RobustMutex> lock(s_->mutex);
        if (s_->read_fault) {
            throw std::runtime_error(s_->fault_message);
        }
        s_->advance(monotonicNow_s());
        return std::vector<double>(s_->contraction, s_->contraction + s_->muscles);
    }

    void sendActions(const std::vector<double>& actions) override {
        std::lock_guard<RobustMutex> lock(s_->mutex);
        if (s_->actuation_fault) {
            throw std::runtime_error(s_->fault_message);
        }
        if (static_cast<int>(actions.size()) != s_->muscles) {
            throw std::invalid_argument("sendActions: action count does not match muscle count");
        }
        s_->advance(monotonicNow_s());
        for (int i = 0; i < s_->muscles; ++i) {
            std::int8_t v = 0;
            if (toValve(actions[i], v)) {
                s_->valve[i] = v;
            }
            s_->last_actions[i] = actions[i];
        }
        ++s_->actions_received;
    }

private:
    State* s_;
};

SimulatedLimb::SimulatedLimb() : SimulatedLimb(Config{}) {}

SimulatedLimb::SimulatedLimb(const Config& cfg)
    : region_(bip::anonymous_shared_memory(sizeof(State))) {
    if (cfg.muscles < 1 || cfg.muscles > kMaxMuscles) {
        throw std::invalid_argument("SimulatedLimb: muscles out of range");
    }
    state_ = new (region_.get_address()) State();
    state_->cfg = cfg;
    state_->muscles = cfg.muscles;
    state_->last_update_s = monotonicNow_s();
}

SimulatedLimb::~SimulatedLimb() {
    if (state_) {
        state_->~State();
        state_ = nullptr;
    }
}

std::unique_ptr<HardwareClient> SimulatedLimb::connect(const std::string& hostname) {
    if (hostname.empty()) {
        throw std::runtime_error("SimulatedLimb: empty hostname");
    }
    {
        std::lock_guard<RobustMutex> lock(state_->mutex);
        ++state_->clients_opened;
    }
    logf(LogLevel::Debug, "simulated limb: client opened for '%s'", hostname.c_str());
    return std::make_unique<Client>(state_);
}

HardwareClientFactory SimulatedLimb::factory() {
    return [this](const std::string& hostname) { return connect(hostname); };
}

void SimulatedLimb::injectReadFault(const std::string& message) {
    std::lock_guard<RobustMutex> lock(state_->mutex);
    std::snprintf(state_->fault_message, sizeof(state_->fault_message), "%s", message.c_str());
    state_->read_fault = true;
}

void SimulatedLimb::injectActuationFault(const std::string& message) {
    std::lock_guard<RobustMutex> lock(state_->mutex);
    std::snprintf(state_->fault_message, sizeof(state_->fault_message), "%s", message.c_str());
    state_->actuation_fault = true;
}

void SimulatedLimb::clearFaults() {
    std::lock_guard<RobustMutex> lock(state_->mutex);
    state_->read_fault = false;
    state_->actuation_fault = false;
    state_->fault_message[0] = '\0';
}

int SimulatedLimb::muscles() const {
    return state_->muscles;
}

bool SimulatedLimb::pressuregenOn() const {
    std::lock_guard<RobustMutex> lock(state_->mutex);
    return state_->pressuregen_on;
}

double SimulatedLimb::pressure_bar() const {
    std::lock_guard<RobustMutex> lock(state_->mutex);
    state_->advance(monotonicNow_s());
    return state_->pressure_bar;
}

std::vector<double> SimulatedLimb::contractions() const {
    std::lock_guard<RobustMutex> lock(state_->mutex);
    state_->advance(monotonicNow_s());
    return std::vector<double>(state_->contraction, state_->contraction + state_->muscles);
}

std::vector<double> SimulatedLimb::lastActions() const {
    std::lock_guard<RobustMutex> lock(state_->mutex);
    return std::vector<double>(state_->last_actions, state_->last_actions + state_->muscles);
}

std::uint64_t SimulatedLimb::actionsReceived() const {
    std::lock_guard<RobustMutex> lock(state_->mutex);
    return state_->actions_received;
}

std::uint32_t SimulatedLimb::clientsOpened() const {
    std::lock_guard<RobustMutex> lock(state_->mutex);
    return state_->clients_opened;
}

} // namespace pneuma
