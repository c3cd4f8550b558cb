#pragma once
#include "arch/detector_state.hpp"

namespace sd {

enum class DetectorKind { kMealy, kMoore };

// All comments are in English.
// Register-level view of one detector, driven by ClockDomain and Testbench.
class DetectorIface {
public:
  virtual ~DetectorIface() = default;

  virtual const char*  Name() const = 0;
  virtual DetectorKind kind() const = 0;

  // One rising clock edge. Returns the value of 'detected' observed during
  // the cycle that this edge closes.
  virtual bool Tick(bool reset, bool data_in) = 0;

  // Out-of-band reset: register back to Idle without a clock edge.
  virtual void Reset() = 0;

  virtual DetectorState state() const = 0;

  // Output for the current register contents and the last driven input.
  virtual bool detected() const = 0;
};

const char* ToString(DetectorKind k);

} // namespace sd
