#pragma once

#include "qkdsync/data/DetectionEvent.h"
#include "qkdsync/sim/Rng.h"

namespace qkdsync::sim {

/**
 * @brief Inject dark counts and produce the receiver's detection record.
 *
 * For every bin in [0, windowBins) the number of dark events is drawn from a
 * Poisson distribution with mean darkCountRate. Survivors and dark events are
 * merged and sorted ascending by timestampBin; events sharing a bin are all
 * kept. The result holds survivors.size() + (dark events) entries.
 *
 * @throws core::SimulationError (InvalidParameter) when darkCountRate is
 *         negative / non-finite or windowBins <= 0.
 */
data::DetectionRecord recordDetections(data::DetectionRecord survivors,
                                       double darkCountRate,
                                       long long windowBins, Rng &rng);

} // namespace qkdsync::sim
