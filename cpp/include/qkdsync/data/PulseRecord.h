#pragma once

#include <cstddef>
#include <vector>

namespace qkdsync::data {

/// One transmitted pulse. Index is the emission slot (temporal order).
struct PulseRecord {
  std::size_t index{0};
  double intensity{0.0}; ///< Mean photon number (signal_power or decoy_power).
  bool isSignal{false};
};

using PulseSequence = std::vector<PulseRecord>;

} // namespace qkdsync::data
