#include "arch/moore_detector.hpp"
#include <cassert>

namespace sd {

DetectorState MooreNextState(DetectorState state, bool bit) {
    switch (state) {
        case DetectorState::kIdle:    return bit ? DetectorState::kSaw1    : DetectorState::kIdle;
        case DetectorState::kSaw1:    return bit ? DetectorState::kSaw1    : DetectorState::kSaw10;
        case DetectorState::kSaw10:   return bit ? DetectorState::kSaw101  : DetectorState::kIdle;
        case DetectorState::kSaw101:  return bit ? DetectorState::kSaw1011 : DetectorState::kSaw10;
        case DetectorState::kSaw1011: return bit ? DetectorState::kSaw1    : DetectorState::kSaw10;
        default:
            assert(false && "MooreNextState: state outside the Moore state set");
            return DetectorState::kIdle;
    }
}

bool MooreOutput(DetectorState state) {
    return state == DetectorState::kSaw1011;
}

StepResult MooreStep(DetectorState state, bool bit) {
    StepResult r;
    r.next_state = MooreNextState(state, bit);
    r.detected   = MooreOutput(state);
    return r;
}

DetectorState MooreReset() {
    return DetectorState::kIdle;
}

MooreDetector::MooreDetector() : state_(MooreReset()) {}

bool MooreDetector::Tick(bool reset, bool data_in) {
    // The registered output is visible for the whole cycle, reset included.
    const bool out = MooreOutput(state_);
    state_ = reset ? MooreReset() : MooreNextState(state_, data_in);
    return out;
}

void MooreDetector::Reset() {
    state_ = MooreReset();
}

} // namespace sd
