#pragma once

#include "qkdsync/data/DetectionEvent.h"
#include "qkdsync/data/Histogram.h"
#include "qkdsync/data/PulseRecord.h"
#include <cstddef>

namespace qkdsync::analysis {

struct HistogramPair {
  data::Histogram reference; ///< Transmitted pattern, one bin per pulse.
  data::Histogram detected;  ///< Receiver click counts per detector bin.
};

/// counts[i] = 1 if states[i] is a signal pulse, else 0.
data::Histogram referenceHistogram(const data::PulseSequence &states,
                                   double binWidth);

/// counts[b] = events in bin b; length max(minLength, last bin + 1).
data::Histogram detectedHistogram(const data::DetectionRecord &events,
                                  double binWidth, std::size_t minLength);

/**
 * @brief Aggregate the detection record into the two correlation inputs.
 *
 * The reference covers [0, sentPulseCount); the detected histogram spans
 * max(sentPulseCount, minWindowBins, last bin + 1) bins. Pure aggregation,
 * no randomness.
 *
 * @throws core::SimulationError EmptyInput when events is empty;
 *         InvalidParameter on binWidth <= 0, sentPulseCount == 0, a states
 *         size different from sentPulseCount or a negative event bin.
 */
HistogramPair buildHistograms(std::size_t sentPulseCount,
                              const data::DetectionRecord &events,
                              double binWidth,
                              const data::PulseSequence &states,
                              std::size_t minWindowBins = 0);

} // namespace qkdsync::analysis
