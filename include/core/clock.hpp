#pragma once
// All comments are in English.
#include <cstddef>
#include <cstdint>
#include <vector>
#include "common/signals.hpp"
#include "core/detector_iface.hpp"

namespace sd {

// Single synchronous clock domain. Every registered detector sees the same
// reset/data_in and advances exactly once per Tick().
class ClockDomain final {
public:
    ClockDomain() = default;

    // Non-owning; the detector must outlive the domain.
    ClockDomain& Register(DetectorIface* det);

    // One rising edge. Returns true if any detector asserted 'detected'
    // during the cycle. Throws std::logic_error when nothing is registered.
    bool Tick(const Signals& in);

    // Out-of-band reset of every detector; does not advance the cycle count.
    void Reset();

    std::uint64_t cycle() const { return cycle_; }
    std::size_t   size()  const { return detectors_.size(); }

    DetectorIface&       detector(std::size_t i)       { return *detectors_.at(i); }
    const DetectorIface& detector(std::size_t i) const { return *detectors_.at(i); }

    // Per-detector outputs of the last Tick(), in registration order.
    const std::vector<bool>& last_outputs() const { return last_outputs_; }

private:
    std::vector<DetectorIface*> detectors_;
    std::vector<bool>           last_outputs_;
    std::uint64_t               cycle_ = 0;
};

} // namespace sd
