#pragma once

#include "qkdsync/data/Histogram.h"
#include "qkdsync/data/SimulationResult.h"
#include <cstddef>

namespace qkdsync::analysis {

/// C(k) = sum_i reference[i] * detected[i + k] over the valid overlap.
double correlationAt(const data::Histogram &reference,
                     const data::Histogram &detected, int offset);

/// Throws core::SimulationError (InvalidParameter) unless
/// 0 < maxOffset < histogramLength.
void checkSearchRange(int maxOffset, std::size_t histogramLength);

/**
 * @brief Recover the clock offset between sender and receiver.
 *
 * Evaluates C(k) for every k in [-maxOffset, +maxOffset]. The peak is the
 * arg-max of C; equal values prefer the smallest |k|, then the smallest
 * signed k. Synchronisation succeeds when the peak is positive and exceeds
 * the sidelobe floor (mean of C over all other offsets) by more than
 * thresholdSigma standard deviations of that floor.
 *
 * @throws core::SimulationError (InvalidParameter) when maxOffset <= 0,
 *         maxOffset is not smaller than both histogram lengths, or
 *         thresholdSigma is negative / non-finite.
 */
data::CorrelationResult correlate(const data::Histogram &reference,
                                  const data::Histogram &detected,
                                  int maxOffset, double thresholdSigma);

} // namespace qkdsync::analysis
