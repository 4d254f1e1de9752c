#pragma once

// SimulatedLimb
//
// Stand-in for the pneumatic limb hardware. The muscle model lives in an
// anonymous shared-memory mapping created by the constructor, so clients
// opened in forked worker processes all act on the same limb: actions sent
// by the control worker show up in the readings of the comm worker.
//
// Model (per muscle, integrated lazily on every access):
//   - pressuregen ramps system pressure linearly to target_pressure_bar
//     over pressure_ramp_s, and bleeds it back to 0 when stopped.
//   - valve +1 (contract): contraction -> pressure, first order, tau_contract_s
//   - valve -1 (loose):    contraction -> 0,        first order, tau_loose_s
//   - valve  0 (hold):     contraction unchanged
//   - contraction is clamped to [0, pressure].
//
// Fault injection hooks let tests trip either worker from the outside.
//
// Lifetime: the SimulatedLimb must outlive every client and every LimbEnv
// built from factory().

#include <cstdint>
#include <memory>
#include <string>
#include <vector>

#include <boost/interprocess/mapped_region.hpp>

#include "HardwareClient.h"

namespace pneuma {

class SimulatedLimb {
public:
    struct Config {
        int muscles = 3;
        double target_pressure_bar = 4.0;
        double pressure_ramp_s = 0.05;
        double tau_contract_s = 0.08;
        double tau_loose_s = 0.06;
        double pressure_wait_timeout_s = 2.0;
    };

    SimulatedLimb();
    explicit SimulatedLimb(const Config& cfg);
    ~SimulatedLimb();

    SimulatedLimb(const SimulatedLimb&) = delete;
    SimulatedLimb& operator=(const SimulatedLimb&) = delete;

    std::unique_ptr<HardwareClient> connect(const std::string& hostname);
    HardwareClientFactory factory();

    // Fault injection. The message becomes the exception text seen by the
    // failing worker.
    void injectReadFault(const std::string& message);
    void injectActuationFault(const std::string& message);
    void clearFaults();

    // Inspection (integrates the model up to now).
    int muscles() const;
    bool pressuregenOn() const;
    double pressure_bar() const;
    std::vector<double> contractions() const;
    std::vector<double> lastActions() const;
    std::uint64_t actionsReceived() const;
    std::uint32_t clientsOpened() const;

private:
    struct State;
    class Client;

    boost::interprocess::mapped_region region_;
    State* state_ = nullptr;
};

} // namespace pneuma
