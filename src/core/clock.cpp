// core/clock.cpp
#include "core/clock.hpp"
#include <stdexcept>

namespace sd {

ClockDomain& ClockDomain::Register(DetectorIface* det) {
  if (!det) throw std::invalid_argument("ClockDomain: null detector");
  detectors_.push_back(det);
  last_outputs_.push_back(false);
  return *this;
}

bool ClockDomain::Tick(const Signals& in) {
  if (detectors_.empty()) {
    throw std::logic_error("ClockDomain: Tick() with no registered detector");
  }
  bool any = false;
  for (std::size_t i = 0; i < detectors_.size(); ++i) {
    const bool out = detectors_[i]->Tick(in.reset, in.data_in);
    last_outputs_[i] = out;
    any = any || out;
  }
  ++cycle_;
  return any;
}

void ClockDomain::Reset() {
  for (DetectorIface* det : detectors_) det->Reset();
  for (std::size_t i = 0; i < last_outputs_.size(); ++i) last_outputs_[i] = false;
}

} // namespace sd
