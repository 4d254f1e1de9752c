#pragma once

#include <functional>
#include <memory>
#include <string>
#include <vector>

namespace pneuma {

// Connection to the limb's pressure-generation and valve hardware.
//
// Each process opens its own client through a HardwareClientFactory: the
// orchestrator for the pressuregen handshake, each worker for its per-cycle
// traffic. Calls may block until the hardware confirms the requested state.
// Failures are reported by throwing.
class HardwareClient {
public:
    virtual ~HardwareClient() = default;

    virtual int numberOfMuscles() const = 0;

    virtual void startPressuregen() = 0;
    virtual void stopPressuregen() = 0;
    virtual void waitForDesiredPressure() = 0;

    // Comm worker: one contraction reading per muscle.
    virtual std::vector<double> readContractions() = 0;

    // Control worker: one actuation value per muscle (-1 loose, 0 hold,
    // 1 contract; other values inert).
    virtual void sendActions(const std::vector<double>& actions) = 0;
};

using HardwareClientFactory =
    std::function<std::unique_ptr<HardwareClient>(const std::string& hostname)>;

} // namespace pneuma
