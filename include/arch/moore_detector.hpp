#pragma once
#include "arch/detector_state.hpp"
#include "core/detector_iface.hpp"

namespace sd {

// ---- Pure next-state / output functions ----
DetectorState MooreNextState(DetectorState state, bool bit);
bool          MooreOutput(DetectorState state);
// 'detected' in the result is the output of the current state, not of next_state.
StepResult    MooreStep(DetectorState state, bool bit);
DetectorState MooreReset();

// Moore "1011" detector: 5 states, 'detected' decoded from the register only,
// so a match shows up one cycle after its last bit.
class MooreDetector final : public DetectorIface {
public:
    MooreDetector();

    const char*  Name() const override { return ToString(kind()); }
    DetectorKind kind() const override { return DetectorKind::kMoore; }

    bool Tick(bool reset, bool data_in) override;
    void Reset() override;

    DetectorState state()    const override { return state_; }
    bool          detected() const override { return MooreOutput(state_); }

private:
    DetectorState state_;
};

} // namespace sd
