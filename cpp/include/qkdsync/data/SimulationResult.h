#pragma once

#include "qkdsync/core/SimulationConfig.h"
#include "qkdsync/data/DetectionEvent.h"
#include "qkdsync/data/Histogram.h"
#include "qkdsync/data/PulseRecord.h"
#include <cstdint>
#include <string>
#include <unordered_map>
#include <vector>

namespace qkdsync::data {

struct CorrelationResult {
  std::vector<int> offsets;                 // -maxOffset .. +maxOffset
  std::vector<double> correlationValues;    // index-aligned with offsets
  int peakOffset{0};
  double peakValue{0.0};
  double floorMean{0.0};   // sidelobe mean (all offsets but the peak)
  double floorStdDev{0.0}; // sidelobe population std dev
  double significance{0.0}; // (peak - floorMean) / floorStdDev, 0 if undefined
  bool syncSuccess{false};
};

struct SimulationStatistics {
  std::uint64_t totalCounts{0};
  double meanCountRate{0.0}; // counts per second
  double qber{0.0};
  bool syncSuccess{false};
  /// Set when totalCounts == 0; rates and QBER are then reported as 0.
  bool degenerate{false};

  std::uint64_t signalCounts{0};
  std::uint64_t decoyCounts{0};
  std::uint64_t darkCounts{0};
  std::uint64_t errorCounts{0};
  double signalRate{0.0};
  double decoyRate{0.0};
};

/// Everything one run hands to the front ends. Never shared across runs.
struct SimulationResult {
  core::SimulationConfig config;
  std::uint64_t seed{0};
  PulseSequence states;
  DetectionRecord detections;
  Histogram reference;
  Histogram detected;
  CorrelationResult correlation;
  SimulationStatistics statistics;
  std::vector<double> timePoints; // offsets converted to seconds
  std::unordered_map<std::string, double> metrics;
};

} // namespace qkdsync::data
