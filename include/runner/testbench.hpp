// All comments are in English.
#pragma once
#include <cstdint>
#include <optional>
#include <ostream>
#include <set>
#include <string>
#include <vector>

#include "common/constants.hpp"
#include "core/detector_iface.hpp"
#include "stats/sim_stats.hpp"

namespace sd {

// A literal bit sequence plus the cycles on which reset is held.
struct Stimulus {
  std::string           name;
  std::string           bits;           // '0'/'1'; '_' and whitespace ignored
  std::set<uint64_t>    reset_cycles;   // cycle index == bit index
  int                   drain_cycles = kDefaultDrainCycles;

  // Expected cycles with 'detected' high, per detector kind (optional).
  std::optional<std::vector<uint64_t>> expect_mealy;
  std::optional<std::vector<uint64_t>> expect_moore;
};

struct TraceResult {
  std::string            stimulus_name;
  std::string            detector_name;
  std::vector<TraceRow>  rows;
  std::vector<uint64_t>  detect_cycles;
  RunStats               stats{};
  std::optional<std::vector<uint64_t>> expected;

  bool Passed() const { return !expected || *expected == detect_cycles; }
};

// '0'/'1' string -> bits. Throws std::invalid_argument on anything else
// except the '_' and whitespace separators.
std::vector<bool> ParseBits(const std::string& text);

// Drives one detector with a stimulus, one bit per cycle.
//  - The detector gets an out-of-band reset before cycle 0.
//  - Bit i is driven on cycle i; reset_cycles hold reset on those edges.
//  - drain_cycles idle cycles (data_in = 0) follow the last bit.
// Each TraceRow holds the values observed during the cycle and the state
// after its closing edge.
class Testbench {
public:
  explicit Testbench(DetectorIface& dut) : dut_(dut) {}

  TraceResult Run(const Stimulus& stim);

private:
  DetectorIface& dut_;
};

// $monitor-style table of one run.
void PrintTrace(std::ostream& os, const TraceResult& r);

// The fixed hand-written suite: basic match, overlap, non-matching streams
// and a mid-stream reset.
std::vector<Stimulus> DefaultStimuli();

} // namespace sd
