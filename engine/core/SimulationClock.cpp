#include "SimulationClock.h"

#include <algorithm>

namespace Engine {

SimulationClock::SimulationClock(double fixedStep, int maxStepsPerAdvance)
    : fixedStep_(fixedStep > 0.0 ? fixedStep : kFixedTickSeconds), maxSteps_(std::max(1, maxStepsPerAdvance)) {}

int SimulationClock::advance(double realDeltaSeconds) {
    if (paused_ || realDeltaSeconds <= 0.0) {
        return 0;
    }
    accumulator_ += realDeltaSeconds;
    int steps = static_cast<int>(accumulator_ / fixedStep_);
    if (steps > maxSteps_) {
        // Long stalls (debugger, window drag) drop the excess instead of fast-forwarding.
        steps = maxSteps_;
        accumulator_ = 0.0;
    } else {
        accumulator_ -= steps * fixedStep_;
    }
    return steps;
}

TimeStep SimulationClock::consumeStep() {
    elapsed_ += fixedStep_;
    ++steps_;
    return TimeStep{fixedStep_, elapsed_};
}

void SimulationClock::setPaused(bool paused) {
    if (paused_ == paused) return;
    paused_ = paused;
    accumulator_ = 0.0;
}

void SimulationClock::reset() {
    accumulator_ = 0.0;
    elapsed_ = 0.0;
    steps_ = 0;
    paused_ = false;
}

}  // namespace Engine
