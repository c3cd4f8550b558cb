// All comments are in English.
#include "runner/simulation.hpp"
#include "arch/mealy_detector.hpp"
#include "arch/moore_detector.hpp"
#include "core/clock.hpp"
#include "stats/trace_csv.hpp"
#include <algorithm>
#include <cctype>
#include <filesystem>
#include <fstream>
#include <iostream>
#include <iterator>
#include <limits>
#include <stdexcept>

using nlohmann::json;

namespace sd {

namespace {

std::string SanitizeName(const std::string& input) {
  std::string out;
  out.reserve(input.size());
  for (char ch : input) {
    const unsigned char uch = static_cast<unsigned char>(ch);
    if (std::isalnum(uch) || ch == '_' || ch == '-') {
      out.push_back(ch);
    } else {
      out.push_back('_');
    }
  }
  if (out.empty()) {
    out = "unnamed";
  }
  return out;
}

// The stimulus index keeps names that sanitize alike ("a b", "a_b") apart.
std::filesystem::path BuildTraceCsvPath(const std::string& dir,
                                        const std::string& detector_name,
                                        std::size_t stimulus_index,
                                        const std::string& stimulus_name) {
  std::filesystem::path file =
      SanitizeName(detector_name) + "__" + std::to_string(stimulus_index) + "_" +
      SanitizeName(stimulus_name) + "__trace.csv";
  return std::filesystem::path(dir) / file;
}

std::vector<uint64_t> ReadCycleList(const json& arr, const std::string& what) {
  if (!arr.is_array()) {
    throw std::invalid_argument("ParseStimulusConfig: '" + what + "' must be an array");
  }
  std::vector<uint64_t> out;
  out.reserve(arr.size());
  for (const auto& v : arr) {
    // nlohmann stores non-negative literals as unsigned; negatives and floats fail here.
    if (!v.is_number_unsigned()) {
      throw std::invalid_argument("ParseStimulusConfig: '" + what + "' must hold non-negative integers, got " +
                                  v.dump());
    }
    out.push_back(v.get<uint64_t>());
  }
  std::sort(out.begin(), out.end());
  return out;
}

const std::string& RequireString(const json& v, const std::string& what) {
  if (!v.is_string()) {
    throw std::invalid_argument("ParseStimulusConfig: '" + what + "' must be a string, got " + v.dump());
  }
  return v.get_ref<const std::string&>();
}

int ReadDrainCycles(const json& js, const std::string& stim_name) {
  if (!js.contains("drain_cycles")) return kDefaultDrainCycles;
  const auto& v = js.at("drain_cycles");
  if (!v.is_number_integer()) {
    throw std::invalid_argument("ParseStimulusConfig: drain_cycles must be an integer for " + stim_name);
  }
  const bool in_range = v.is_number_unsigned()
      ? v.get<std::uint64_t>() <= static_cast<std::uint64_t>(std::numeric_limits<int>::max())
      : v.get<std::int64_t>() >= 0;
  if (!in_range) {
    throw std::invalid_argument("ParseStimulusConfig: drain_cycles out of range [0, INT_MAX] for " +
                                stim_name + ": " + v.dump());
  }
  return static_cast<int>(v.get<std::int64_t>());
}

} // namespace

DetectorKind ParseDetectorKind(const std::string& s) {
  if (s == "mealy") return DetectorKind::kMealy;
  if (s == "moore") return DetectorKind::kMoore;
  throw std::invalid_argument("Unknown detector kind: " + s);
}

std::unique_ptr<DetectorIface> MakeDetector(DetectorKind kind) {
  switch (kind) {
    case DetectorKind::kMealy: return std::make_unique<MealyDetector>();
    case DetectorKind::kMoore: return std::make_unique<MooreDetector>();
    default:
      throw std::invalid_argument("MakeDetector: unknown detector kind");
  }
}

SimConfig ParseStimulusConfigJson(const json& j) {
  if (!j.contains("stimuli") || !j["stimuli"].is_array()) {
    throw std::invalid_argument("ParseStimulusConfig: missing 'stimuli' array");
  }

  SimConfig cfg;

  if (j.contains("detectors")) {
    if (!j["detectors"].is_array() || j["detectors"].empty()) {
      throw std::invalid_argument("ParseStimulusConfig: 'detectors' must be a non-empty array");
    }
    cfg.detectors.clear();
    for (const auto& d : j["detectors"]) {
      const DetectorKind k = ParseDetectorKind(RequireString(d, "detectors[]"));
      if (std::find(cfg.detectors.begin(), cfg.detectors.end(), k) == cfg.detectors.end()) {
        cfg.detectors.push_back(k);
      }
    }
  }

  if (j.contains("trace_csv_dir")) cfg.trace_csv_dir = RequireString(j.at("trace_csv_dir"), "trace_csv_dir");
  if (j.contains("print_traces")) {
    if (!j.at("print_traces").is_boolean()) {
      throw std::invalid_argument("ParseStimulusConfig: 'print_traces' must be a boolean");
    }
    cfg.print_traces = j.at("print_traces").get<bool>();
  }

  cfg.stimuli.reserve(j["stimuli"].size());
  for (const auto& js : j["stimuli"]) {
    Stimulus s;

    if (!js.contains("bits")) throw std::invalid_argument("ParseStimulusConfig: stimulus entry missing 'bits'");
    s.bits = RequireString(js.at("bits"), "bits");
    s.name = js.contains("name") ? RequireString(js.at("name"), "name")
                                 : std::string("stim") + std::to_string(cfg.stimuli.size());
    const std::size_t num_bits = ParseBits(s.bits).size();  // fail fast on malformed sequences

    s.drain_cycles = ReadDrainCycles(js, s.name);

    if (js.contains("reset_at")) {
      const uint64_t total = num_bits + static_cast<uint64_t>(s.drain_cycles);
      for (uint64_t c : ReadCycleList(js.at("reset_at"), "reset_at")) {
        // Non-fatal: the cycle is simply never reached.
        if (c >= total) {
          std::cerr << "[ParseConfig][Warn] " << s.name << ": reset_at " << c
                    << " is past the last cycle (" << total << " cycles); ignored.\n";
          continue;
        }
        s.reset_cycles.insert(c);
      }
    }

    // expect (optional)
    if (js.contains("expect")) {
      const auto& ex = js.at("expect");
      if (!ex.is_object()) {
        throw std::invalid_argument("ParseStimulusConfig: 'expect' must be an object in " + s.name);
      }
      for (auto it = ex.begin(); it != ex.end(); ++it) {
        const DetectorKind k = ParseDetectorKind(it.key());
        auto cycles = ReadCycleList(it.value(), "expect." + it.key());
        if (k == DetectorKind::kMealy) s.expect_mealy = std::move(cycles);
        else                           s.expect_moore = std::move(cycles);
      }
    }

    cfg.stimuli.push_back(std::move(s));
  }
  return cfg;
}

SimConfig ParseStimulusConfig(const std::string& json_path) {
  // Read entire JSON file as text.
  std::ifstream ifs(json_path);
  if (!ifs) throw std::runtime_error("ParseStimulusConfig: cannot open json file: " + json_path);
  std::string jtxt((std::istreambuf_iterator<char>(ifs)), std::istreambuf_iterator<char>());

  return ParseStimulusConfigJson(json::parse(jtxt));
}

SimConfig DefaultConfig() {
  SimConfig cfg;
  cfg.stimuli = DefaultStimuli();
  return cfg;
}

LatencyCheck RunSideBySide(const Stimulus& stim) {
  const std::vector<bool> bits = ParseBits(stim.bits);
  const uint64_t total = bits.size() + static_cast<uint64_t>(std::max(stim.drain_cycles, 0));

  MealyDetector mealy;
  MooreDetector moore;
  ClockDomain clk;
  clk.Register(&mealy).Register(&moore);
  clk.Reset();

  LatencyCheck chk;
  for (uint64_t cyc = 0; cyc < total; ++cyc) {
    Signals in;
    in.reset   = stim.reset_cycles.count(cyc) != 0;
    in.data_in = (cyc < bits.size()) ? bits[cyc] : false;
    clk.Tick(in);
    if (clk.last_outputs()[0]) chk.mealy_cycles.push_back(cyc);
    if (clk.last_outputs()[1]) chk.moore_cycles.push_back(cyc);
  }

  // A Mealy hit on the final cycle has no cycle left for the Moore output.
  std::vector<uint64_t> expect_moore;
  for (uint64_t c : chk.mealy_cycles) {
    if (c + 1 < total) expect_moore.push_back(c + 1);
  }
  chk.consistent = (expect_moore == chk.moore_cycles);
  return chk;
}

SuiteSummary RunSuite(const SimConfig& cfg, std::ostream& os) {
  if (cfg.detectors.empty()) throw std::invalid_argument("RunSuite: no detectors selected");

  if (!cfg.trace_csv_dir.empty()) {
    std::filesystem::create_directories(cfg.trace_csv_dir);
  }

  SuiteSummary sum;
  for (const DetectorKind kind : cfg.detectors) {
    auto dut = MakeDetector(kind);
    Testbench tb(*dut);
    os << "[Simulation] " << ToString(kind) << ": " << cfg.stimuli.size() << " stimuli\n";

    for (std::size_t idx = 0; idx < cfg.stimuli.size(); ++idx) {
      const Stimulus& stim = cfg.stimuli[idx];
      TraceResult r = tb.Run(stim);
      ++sum.runs;
      AccumulateRunStats(sum.totals, r.stats);

      if (cfg.print_traces) PrintTrace(os, r);
      if (!r.Passed()) {
        ++sum.mismatches;
        std::cerr << "[Testbench][Error] " << r.detector_name << " / " << r.stimulus_name
                  << ": detections do not match expectation\n";
      }

      if (!cfg.trace_csv_dir.empty()) {
        TraceCsvLogger csv(BuildTraceCsvPath(cfg.trace_csv_dir, r.detector_name, idx, r.stimulus_name).string());
        csv.AppendRows(r.rows);
        os << "[Testbench] Trace CSV written to " << csv.path() << "\n";
      }
    }
  }

  const bool both =
      std::find(cfg.detectors.begin(), cfg.detectors.end(), DetectorKind::kMealy) != cfg.detectors.end() &&
      std::find(cfg.detectors.begin(), cfg.detectors.end(), DetectorKind::kMoore) != cfg.detectors.end();
  if (both) {
    for (const auto& stim : cfg.stimuli) {
      const LatencyCheck chk = RunSideBySide(stim);
      if (!chk.consistent) {
        ++sum.latency_violations;
        std::cerr << "[Simulation][Error] " << stim.name
                  << ": Moore detections are not one cycle behind Mealy\n";
      }
    }
  }

  os << "[Simulation] runs=" << sum.runs
     << " cycles=" << sum.totals.cycles
     << " detections=" << sum.totals.detections
     << " resets=" << sum.totals.resets
     << " mismatches=" << sum.mismatches
     << " latency_violations=" << sum.latency_violations << "\n";
  return sum;
}

} // namespace sd
