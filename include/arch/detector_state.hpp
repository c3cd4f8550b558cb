#pragma once
#include <cstdint>

namespace sd {

// Register contents of both detectors. Saw1011 is only reachable in the
// Moore variant; the Mealy variant flags the match combinationally instead.
enum class DetectorState : std::uint8_t {
    kIdle    = 0,
    kSaw1    = 1,
    kSaw10   = 2,
    kSaw101  = 3,
    kSaw1011 = 4,
};

// Pure step result: successor state plus the output seen during this cycle.
struct StepResult {
    DetectorState next_state = DetectorState::kIdle;
    bool          detected   = false;
};

const char* ToString(DetectorState s);

// Binary state code as it sits in the register.
std::uint8_t EncodeState(DetectorState s);

// Raw register value -> state. Codes outside the variant's state set decode
// to kIdle with a warning on stderr.
DetectorState DecodeMealyState(std::uint8_t code);
DetectorState DecodeMooreState(std::uint8_t code);

} // namespace sd
