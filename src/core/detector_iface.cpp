#include "core/detector_iface.hpp"

namespace sd {

const char* ToString(DetectorKind k) {
  switch (k) {
    case DetectorKind::kMealy: return "mealy";
    case DetectorKind::kMoore: return "moore";
    default:                   return "unknown";
  }
}

} // namespace sd
