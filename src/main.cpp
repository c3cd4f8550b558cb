// All comments are in English.
#include <exception>
#include <iostream>
#include <string>

#include "runner/simulation.hpp"

int main(int argc, char** argv) {
  // Usage: ./seqdet_sim [stimulus.json]
  if (argc > 2) {
    std::cerr << "Usage: " << argv[0] << " [stimulus.json]\n";
    return 1;
  }

  try {
    // (1) Stimulus: JSON file or the built-in suite
    sd::SimConfig cfg;
    if (argc == 2) {
      cfg = sd::ParseStimulusConfig(argv[1]);
      std::cout << "[Simulation] Loaded " << cfg.stimuli.size() << " stimuli from " << argv[1] << "\n";
    } else {
      cfg = sd::DefaultConfig();
      std::cout << "[Simulation] Running built-in suite (" << cfg.stimuli.size() << " stimuli)\n";
    }

    // (2) Drive every stimulus through every selected detector
    const sd::SuiteSummary sum = sd::RunSuite(cfg, std::cout);

    if (!sum.Passed()) {
      std::cerr << "[Simulation] Completed with " << sum.mismatches << " mismatch(es) and "
                << sum.latency_violations << " latency violation(s).\n";
      return 3;
    }
    std::cout << "[Simulation] Completed successfully.\n";
    return 0;
  } catch (const std::exception& ex) {
    std::cerr << "[Simulation] Error: " << ex.what() << "\n";
    return 2;
  }
}
