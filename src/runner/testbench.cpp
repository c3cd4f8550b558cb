// All comments are in English.
#include "runner/testbench.hpp"
#include <cctype>
#include <iomanip>
#include <stdexcept>

namespace sd {

std::vector<bool> ParseBits(const std::string& text) {
  std::vector<bool> out;
  out.reserve(text.size());
  for (std::size_t i = 0; i < text.size(); ++i) {
    const char ch = text[i];
    if (ch == '0' || ch == '1') {
      out.push_back(ch == '1');
    } else if (ch == '_' || std::isspace(static_cast<unsigned char>(ch))) {
      continue;
    } else {
      throw std::invalid_argument("ParseBits: invalid character '" + std::string(1, ch) +
                                  "' at position " + std::to_string(i) + " in \"" + text + "\"");
    }
  }
  return out;
}

TraceResult Testbench::Run(const Stimulus& stim) {
  if (stim.drain_cycles < 0) {
    throw std::invalid_argument("Testbench: drain_cycles must be >= 0 for stimulus " + stim.name);
  }
  const std::vector<bool> bits = ParseBits(stim.bits);

  TraceResult res;
  res.stimulus_name = stim.name;
  res.detector_name = dut_.Name();
  res.expected = (dut_.kind() == DetectorKind::kMealy) ? stim.expect_mealy : stim.expect_moore;

  const uint64_t total = bits.size() + static_cast<uint64_t>(stim.drain_cycles);
  res.rows.reserve(total);

  dut_.Reset();
  for (uint64_t cyc = 0; cyc < total; ++cyc) {
    TraceRow row;
    row.cycle        = cyc;
    row.reset        = stim.reset_cycles.count(cyc) != 0;
    row.data_in      = (cyc < bits.size()) ? bits[cyc] : false;
    row.state_before = dut_.state();
    row.detected     = dut_.Tick(row.reset, row.data_in);
    row.state_after  = dut_.state();

    if (row.detected) res.detect_cycles.push_back(cyc);
    AccumulateRow(res.stats, row);
    res.rows.push_back(row);
  }
  return res;
}

void PrintTrace(std::ostream& os, const TraceResult& r) {
  os << "[Testbench] " << r.detector_name << " / " << r.stimulus_name << "\n";
  os << "  cycle rst din  state      -> next       det\n";
  for (const auto& row : r.rows) {
    os << "  " << std::setw(5) << row.cycle << ' '
       << std::setw(3) << (row.reset ? 1 : 0) << ' '
       << std::setw(3) << (row.data_in ? 1 : 0) << "  "
       << std::left << std::setw(10) << ToString(row.state_before) << " -> "
       << std::setw(10) << ToString(row.state_after) << std::right << ' '
       << (row.detected ? 1 : 0)
       << (row.detected ? "  <== detected" : "") << "\n";
  }
  os << "[Testbench] detections=" << r.stats.detections << " at {";
  for (std::size_t i = 0; i < r.detect_cycles.size(); ++i) {
    os << (i ? "," : "") << r.detect_cycles[i];
  }
  os << "}";
  if (r.expected) os << (r.Passed() ? " [PASS]" : " [MISMATCH]");
  os << "\n";
}

std::vector<Stimulus> DefaultStimuli() {
  std::vector<Stimulus> v;

  {
    Stimulus s;
    s.name = "single_match";
    s.bits = kPattern;
    s.expect_mealy = std::vector<uint64_t>{3};
    s.expect_moore = std::vector<uint64_t>{4};
    v.push_back(s);
  }
  {
    Stimulus s;
    s.name = "overlap";
    s.bits = "1011011";
    s.expect_mealy = std::vector<uint64_t>{3, 6};
    s.expect_moore = std::vector<uint64_t>{4, 7};
    v.push_back(s);
  }
  {
    Stimulus s;
    s.name = "all_zeros";
    s.bits = "0000000";
    s.expect_mealy = std::vector<uint64_t>{};
    s.expect_moore = std::vector<uint64_t>{};
    v.push_back(s);
  }
  {
    Stimulus s;
    s.name = "alternating";
    s.bits = "1010101010";
    s.expect_mealy = std::vector<uint64_t>{};
    s.expect_moore = std::vector<uint64_t>{};
    v.push_back(s);
  }
  {
    // Reset lands on the last bit of the first "1011"; the match is dropped
    // and the next "1011" is still found.
    Stimulus s;
    s.name = "reset_mid_stream";
    s.bits = "1011_1011";
    s.reset_cycles = {3};
    s.expect_mealy = std::vector<uint64_t>{7};
    s.expect_moore = std::vector<uint64_t>{8};
    v.push_back(s);
  }
  {
    Stimulus s;
    s.name = "back_to_back";
    s.bits = "11011011";
    s.expect_mealy = std::vector<uint64_t>{4, 7};
    s.expect_moore = std::vector<uint64_t>{5, 8};
    v.push_back(s);
  }
  return v;
}

} // namespace sd
