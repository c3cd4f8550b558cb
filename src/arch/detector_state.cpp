#include "arch/detector_state.hpp"
#include "common/constants.hpp"
#include <iostream>

namespace sd {

namespace {

DetectorState DecodeBounded(std::uint8_t code, int state_count, const char* variant) {
    if (code < state_count) {
        return static_cast<DetectorState>(code);
    }
    std::cerr << "[DetectorState][Warn] " << variant << " register holds undefined code "
              << static_cast<int>(code) << "; falling back to Idle.\n";
    return DetectorState::kIdle;
}

} // namespace

const char* ToString(DetectorState s) {
    switch (s) {
        case DetectorState::kIdle:    return "Idle";
        case DetectorState::kSaw1:    return "Saw1";
        case DetectorState::kSaw10:   return "Saw10";
        case DetectorState::kSaw101:  return "Saw101";
        case DetectorState::kSaw1011: return "Saw1011";
        default:                      return "unknown";
    }
}

std::uint8_t EncodeState(DetectorState s) {
    return static_cast<std::uint8_t>(s);
}

DetectorState DecodeMealyState(std::uint8_t code) {
    return DecodeBounded(code, kMealyStateCount, "Mealy");
}

DetectorState DecodeMooreState(std::uint8_t code) {
    return DecodeBounded(code, kMooreStateCount, "Moore");
}

} // namespace sd
