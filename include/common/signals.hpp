#pragma once
#include <cstdint>

/* All comments are in English.
 * Port bundle shared by the detectors, the clock domain and the testbench.
 */

namespace sd {

// Inputs sampled on one rising clock edge.
struct Signals {
    bool reset   = false;  // synchronous, active high
    bool data_in = false;  // serial bit for this cycle
};

} // namespace sd
