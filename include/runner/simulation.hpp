// All comments are in English.
#pragma once
#include <cstdint>
#include <memory>
#include <ostream>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>
#include "core/detector_iface.hpp"
#include "runner/testbench.hpp"
#include "stats/sim_stats.hpp"

namespace sd {

struct SimConfig {
  std::vector<DetectorKind> detectors{DetectorKind::kMealy, DetectorKind::kMoore};
  std::vector<Stimulus>     stimuli;
  std::string               trace_csv_dir;      // empty = no CSV traces
  bool                      print_traces = true;
};

// Mealy vs. Moore on one stream through a shared ClockDomain.
struct LatencyCheck {
  std::vector<uint64_t> mealy_cycles;
  std::vector<uint64_t> moore_cycles;
  bool                  consistent = true;  // every Moore hit one cycle after a Mealy hit
};

struct SuiteSummary {
  int      runs       = 0;
  int      mismatches = 0;
  int      latency_violations = 0;
  RunStats totals{};

  bool Passed() const { return mismatches == 0 && latency_violations == 0; }
};

DetectorKind ParseDetectorKind(const std::string& s);
std::unique_ptr<DetectorIface> MakeDetector(DetectorKind kind);

// JSON -> SimConfig. Throws std::invalid_argument on schema errors and
// std::runtime_error when the file cannot be opened.
SimConfig ParseStimulusConfig(const std::string& json_path);
SimConfig ParseStimulusConfigJson(const nlohmann::json& j);

// Built-in suite on both variants.
SimConfig DefaultConfig();

LatencyCheck RunSideBySide(const Stimulus& stim);

// Runs every stimulus on every selected detector, prints traces and
// writes CSV traces when configured.
SuiteSummary RunSuite(const SimConfig& cfg, std::ostream& os);

} // namespace sd
