#pragma once

namespace pneuma {

// Time source for the timed actuation sequences. Seconds, arbitrary epoch,
// monotonic.
class Clock {
public:
    virtual ~Clock() = default;
    virtual double now_s() = 0;
};

class SteadyClock : public Clock {
public:
    double now_s() override;
};

// Deterministic clock for tests: every now_s() call advances by tick_s.
class ManualClock : public Clock {
public:
    explicit ManualClock(double tick_s = 0.0) : tick_s_(tick_s) {}

    double now_s() override {
        const double t = t_s_;
        t_s_ += tick_s_;
        return t;
    }

    void advance(double dt_s) { t_s_ += dt_s; }
    double peek_s() const { return t_s_; }

private:
    double t_s_ = 0.0;
    double tick_s_ = 0.0;
};

// Wall-clock helpers shared by workers and the simulated limb.
double monotonicNow_s();
void sleepFor_s(double seconds);

} // namespace pneuma
