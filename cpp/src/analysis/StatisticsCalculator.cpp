#include "qkdsync/analysis/StatisticsCalculator.h"
#include "qkdsync/core/Error.h"
#include <QDebug>
#include <cmath>

namespace qkdsync::analysis {

namespace {
constexpr const char *kComponent = "StatisticsCalculator";

bool isError(const data::DetectionEvent &ev, int peakOffset,
             const data::PulseSequence &states) {
  if (ev.origin == data::EventOrigin::Dark)
    return true;
  const long long sent = ev.timestampBin - peakOffset;
  if (sent < 0 || sent >= static_cast<long long>(states.size()))
    return true;
  const bool expectSignal = states[static_cast<std::size_t>(sent)].isSignal;
  return expectSignal != (ev.origin == data::EventOrigin::Signal);
}
} // namespace

data::SimulationStatistics
computeStatistics(const data::DetectionRecord &events,
                  const data::CorrelationResult &correlation,
                  const data::PulseSequence &referenceStates,
                  double timeBinWidth, std::size_t observationBins) {
  core::require(std::isfinite(timeBinWidth) && timeBinWidth > 0.0, kComponent,
                "time_bin_width must be a finite value > 0");
  core::require(observationBins > 0, kComponent,
                "observation window must span at least one bin");

  data::SimulationStatistics stats;
  stats.syncSuccess = correlation.syncSuccess;
  stats.totalCounts = events.size();

  for (const auto &ev : events) {
    switch (ev.origin) {
    case data::EventOrigin::Signal:
      ++stats.signalCounts;
      break;
    case data::EventOrigin::Decoy:
      ++stats.decoyCounts;
      break;
    case data::EventOrigin::Dark:
      ++stats.darkCounts;
      break;
    }
    if (isError(ev, correlation.peakOffset, referenceStates))
      ++stats.errorCounts;
  }

  if (stats.totalCounts == 0) {
    stats.degenerate = true;
    qWarning("computeStatistics: no detections, statistics are degenerate");
    return stats;
  }

  const double duration =
      static_cast<double>(observationBins) * timeBinWidth;
  stats.meanCountRate = static_cast<double>(stats.totalCounts) / duration;
  stats.signalRate = static_cast<double>(stats.signalCounts) / duration;
  stats.decoyRate = static_cast<double>(stats.decoyCounts) / duration;
  stats.qber = static_cast<double>(stats.errorCounts) /
               static_cast<double>(stats.totalCounts);
  return stats;
}

} // namespace qkdsync::analysis
