// tests/smoke/smoke_default_suite.cpp
// All comments in English.

#include <cstdio>
#include <cstdlib>
#include <iostream>

#include "runner/simulation.hpp"

using namespace sd;

static void check(bool cond, const char* msg) {
  if (!cond) {
    std::fprintf(stderr, "SMOKE (suite) FAILED: %s\n", msg);
    std::exit(1);
  }
}

int main(int argc, char** argv) {
  std::printf("[suite-smoke] start\n");

  // Optional JSON stimulus path (CTest passes configs/default_stimulus.json).
  const SimConfig cfg = (argc > 1) ? ParseStimulusConfig(argv[1]) : DefaultConfig();
  check(!cfg.stimuli.empty(), "no stimuli");

  const SuiteSummary sum = RunSuite(cfg, std::cout);
  check(sum.mismatches == 0, "expectation mismatch");
  check(sum.latency_violations == 0, "Moore is not one cycle behind Mealy");
  check(sum.totals.detections > 0, "suite never detected anything");

  std::printf("[suite-smoke] OK\n");
  return 0;
}
