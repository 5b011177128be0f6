// Fixed-step accumulator with a single pause flag shared by every time-driven subsystem.
#pragma once

#include <cstdint>

#include "Time.h"

namespace Engine {

class SimulationClock {
public:
    explicit SimulationClock(double fixedStep = kFixedTickSeconds, int maxStepsPerAdvance = 5);

    // Feeds real frame time; returns how many fixed steps the caller should run now.
    // While paused nothing accumulates, so resuming never produces a catch-up burst.
    int advance(double realDeltaSeconds);
    // Marks one fixed step as simulated; advances simulated time.
    TimeStep consumeStep();

    void setPaused(bool paused);
    bool paused() const { return paused_; }

    double fixedStep() const { return fixedStep_; }
    double elapsedSeconds() const { return elapsed_; }
    int64_t nowMs() const { return static_cast<int64_t>(elapsed_ * 1000.0 + 0.5); }
    uint64_t stepCount() const { return steps_; }

    void reset();

private:
    double fixedStep_{kFixedTickSeconds};
    int maxSteps_{5};
    double accumulator_{0.0};
    double elapsed_{0.0};
    uint64_t steps_{0};
    bool paused_{false};
};

}  // namespace Engine
