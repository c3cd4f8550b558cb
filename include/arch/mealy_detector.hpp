#pragma once
#include "arch/detector_state.hpp"
#include "core/detector_iface.hpp"

namespace sd {

// ---- Pure next-state / output functions ----
DetectorState MealyNextState(DetectorState state, bool bit);
bool          MealyOutput(DetectorState state, bool bit);
StepResult    MealyStep(DetectorState state, bool bit);
DetectorState MealyReset();

// Mealy "1011" detector: 4 states, 'detected' is combinational with data_in.
class MealyDetector final : public DetectorIface {
public:
    MealyDetector();

    const char*  Name() const override { return ToString(kind()); }
    DetectorKind kind() const override { return DetectorKind::kMealy; }

    // Output during a reset cycle is masked; the input bit is discarded.
    bool Tick(bool reset, bool data_in) override;
    void Reset() override;

    DetectorState state()    const override { return state_; }
    bool          detected() const override { return MealyOutput(state_, data_in_); }

    // Drive the input port without a clock edge (combinational settle).
    void set_data_in(bool bit) { data_in_ = bit; }
    bool data_in() const { return data_in_; }

private:
    DetectorState state_;
    bool          data_in_;
};

} // namespace sd
