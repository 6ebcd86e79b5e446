#include "qkdsync/analysis/Preprocessor.h"
#include "qkdsync/core/Error.h"
#include <QDebug>
#include <algorithm>
#include <cmath>

namespace qkdsync::analysis {

namespace {
constexpr const char *kComponent = "DataPreprocessor";

void checkBinWidth(double binWidth) {
  core::require(std::isfinite(binWidth) && binWidth > 0.0, kComponent,
                "bin_width must be a finite value > 0");
}
} // namespace

data::Histogram referenceHistogram(const data::PulseSequence &states,
                                   double binWidth) {
  checkBinWidth(binWidth);
  data::Histogram ref;
  ref.binWidth = binWidth;
  ref.counts.reserve(states.size());
  for (const auto &s : states)
    ref.counts.push_back(s.isSignal ? 1u : 0u);
  return ref;
}

data::Histogram detectedHistogram(const data::DetectionRecord &events,
                                  double binWidth, std::size_t minLength) {
  checkBinWidth(binWidth);
  std::size_t length = minLength;
  for (const auto &ev : events) {
    core::require(ev.timestampBin >= 0, kComponent,
                  "detection event before the window opened");
    length = std::max(length, static_cast<std::size_t>(ev.timestampBin) + 1);
  }

  data::Histogram det;
  det.binWidth = binWidth;
  det.counts.assign(length, 0);
  for (const auto &ev : events)
    ++det.counts[static_cast<std::size_t>(ev.timestampBin)];
  return det;
}

HistogramPair buildHistograms(std::size_t sentPulseCount,
                              const data::DetectionRecord &events,
                              double binWidth,
                              const data::PulseSequence &states,
                              std::size_t minWindowBins) {
  checkBinWidth(binWidth);
  core::require(sentPulseCount > 0, kComponent,
                "sent_pulse_count must be positive");
  core::require(states.size() == sentPulseCount, kComponent,
                "reference states do not match sent_pulse_count");
  if (events.empty())
    throw core::SimulationError(core::ErrorKind::EmptyInput, kComponent,
                                "no detection events to correlate");

  HistogramPair out{
      referenceHistogram(states, binWidth),
      detectedHistogram(events, binWidth,
                        std::max(sentPulseCount, minWindowBins))};

  qDebug("buildHistograms: reference=%zu bins, detected=%zu bins, %zu events",
         out.reference.size(), out.detected.size(), events.size());
  return out;
}

} // namespace qkdsync::analysis
