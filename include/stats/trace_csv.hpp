// All comments are in English.
#pragma once
#include <fstream>
#include <string>
#include <stdexcept>
#include <vector>
#include "stats/sim_stats.hpp"

namespace sd {

// Writes one row per simulated cycle.
class TraceCsvLogger {
public:
  explicit TraceCsvLogger(const std::string& path)
  : path_(path)
  {
    file_.open(path_, std::ios::out | std::ios::trunc);
    if (!file_.is_open()) {
      throw std::runtime_error("TraceCsvLogger: failed to open file: " + path_);
    }
    WriteHeader_();
  }

  void AppendRow(const TraceRow& r) {
    file_
      << r.cycle << ','
      << (r.reset ? 1 : 0) << ','
      << (r.data_in ? 1 : 0) << ','
      << ToString(r.state_before) << ','
      << ToString(r.state_after) << ','
      << (r.detected ? 1 : 0)
      << '\n';
  }

  void AppendRows(const std::vector<TraceRow>& rows) {
    for (const auto& r : rows) AppendRow(r);
    file_.flush();
  }

  const std::string& path() const { return path_; }

private:
  void WriteHeader_() {
    file_ << "cycle,reset,data_in,state_before,state_after,detected\n";
  }

  std::string   path_;
  std::ofstream file_;
};

} // namespace sd
