#pragma once

#include "qkdsync/data/DetectionEvent.h"
#include "qkdsync/data/PulseRecord.h"
#include "qkdsync/data/SimulationResult.h"
#include <cstddef>

namespace qkdsync::analysis {

/**
 * @brief Summarise one run once the clock offset is known.
 *
 * Each event is mapped back to sent pulse (timestampBin - peakOffset). It
 * counts as an error when it is a dark count, when no pulse was sent at that
 * index, or when its Signal/Decoy origin disagrees with the pulse sent there.
 * The mean rate is totalCounts / (observationBins * timeBinWidth).
 *
 * A run without events is not an error: the result has zero rates, qber 0
 * and degenerate set.
 *
 * @throws core::SimulationError (InvalidParameter) on timeBinWidth <= 0 or
 *         observationBins == 0.
 */
data::SimulationStatistics
computeStatistics(const data::DetectionRecord &events,
                  const data::CorrelationResult &correlation,
                  const data::PulseSequence &referenceStates,
                  double timeBinWidth, std::size_t observationBins);

} // namespace qkdsync::analysis
