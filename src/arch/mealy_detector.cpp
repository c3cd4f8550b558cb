#include "arch/mealy_detector.hpp"
#include <cassert>

namespace sd {

DetectorState MealyNextState(DetectorState state, bool bit) {
    switch (state) {
        case DetectorState::kIdle:   return bit ? DetectorState::kSaw1   : DetectorState::kIdle;
        case DetectorState::kSaw1:   return bit ? DetectorState::kSaw1   : DetectorState::kSaw10;
        case DetectorState::kSaw10:  return bit ? DetectorState::kSaw101 : DetectorState::kIdle;
        // Overlap: the final '1' of a match is also the first '1' of the next one.
        case DetectorState::kSaw101: return bit ? DetectorState::kSaw1   : DetectorState::kSaw10;
        default:
            assert(false && "MealyNextState: state outside the Mealy state set");
            return DetectorState::kIdle;
    }
}

bool MealyOutput(DetectorState state, bool bit) {
    return state == DetectorState::kSaw101 && bit;
}

StepResult MealyStep(DetectorState state, bool bit) {
    StepResult r;
    r.next_state = MealyNextState(state, bit);
    r.detected   = MealyOutput(state, bit);
    return r;
}

DetectorState MealyReset() {
    return DetectorState::kIdle;
}

MealyDetector::MealyDetector() : state_(MealyReset()), data_in_(false) {}

bool MealyDetector::Tick(bool reset, bool data_in) {
    data_in_ = data_in;
    if (reset) {
        state_ = MealyReset();
        return false;
    }
    const StepResult r = MealyStep(state_, data_in_);
    state_ = r.next_state;
    return r.detected;
}

void MealyDetector::Reset() {
    state_   = MealyReset();
    data_in_ = false;
}

} // namespace sd
