// common/constants.hpp
#pragma once
// All comments are in English.

#include <cstddef>
#include <cstdint>

namespace sd {

// -----------------------------------------------------------------------------
// Target pattern
// -----------------------------------------------------------------------------
// Bits are listed in arrival order (first bit on the wire first).
inline constexpr char        kPattern[]    = "1011";
inline constexpr std::size_t kPatternBits  = 4;

// -----------------------------------------------------------------------------
// State register widths
// -----------------------------------------------------------------------------
inline constexpr int kMealyStateCount = 4;   // Idle, Saw1, Saw10, Saw101
inline constexpr int kMooreStateCount = 5;   // + Saw1011
inline constexpr int kMealyStateBits  = 2;
inline constexpr int kMooreStateBits  = 3;

// -----------------------------------------------------------------------------
// Testbench
// -----------------------------------------------------------------------------
// Idle cycles (data_in = 0) appended after a stimulus so the registered
// Moore output of the last bit is observed.
inline constexpr int kDefaultDrainCycles = 1;

// -----------------------------------------------------------------------------
// Sanity checks
// -----------------------------------------------------------------------------
static_assert(sizeof(kPattern) - 1 == kPatternBits, "kPatternBits must match kPattern");
static_assert((1 << kMealyStateBits) >= kMealyStateCount, "Mealy register too narrow");
static_assert((1 << kMooreStateBits) >= kMooreStateCount, "Moore register too narrow");
static_assert(kMooreStateCount == kMealyStateCount + 1, "Moore adds exactly one accepting state");
static_assert(kDefaultDrainCycles >= 1, "Moore output needs at least one drain cycle");

} // namespace sd
