// All comments are in English.
#pragma once
#include <cstdint>
#include "arch/detector_state.hpp"

namespace sd {

// One simulated cycle as seen on the detector ports.
struct TraceRow {
  uint64_t      cycle        = 0;
  bool          reset        = false;
  bool          data_in      = false;
  DetectorState state_before = DetectorState::kIdle;
  DetectorState state_after  = DetectorState::kIdle;
  bool          detected     = false;
};

struct RunStats {
  uint64_t cycles     = 0;
  uint64_t ones       = 0;
  uint64_t zeros      = 0;
  uint64_t resets     = 0;
  uint64_t detections = 0;

  void Reset() { *this = RunStats{}; }
};

// Helper: fold one trace row into the counters.
inline void AccumulateRow(RunStats& dst, const TraceRow& row) {
  dst.cycles += 1;
  if (row.reset)        dst.resets += 1;
  else if (row.data_in) dst.ones += 1;
  else                  dst.zeros += 1;
  if (row.detected)     dst.detections += 1;
}

// Helper: accumulate RunStats (run -> suite)
inline void AccumulateRunStats(RunStats& dst, const RunStats& src) {
  dst.cycles     += src.cycles;
  dst.ones       += src.ones;
  dst.zeros      += src.zeros;
  dst.resets     += src.resets;
  dst.detections += src.detections;
}

} // namespace sd
