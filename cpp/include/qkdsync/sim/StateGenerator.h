#pragma once

#include "qkdsync/data/PulseRecord.h"
#include "qkdsync/sim/Rng.h"
#include <vector>

namespace qkdsync::sim {

/**
 * @brief Draw blockSize i.i.d. pulse intensities for the sender.
 *
 * Each slot carries signalPower with probability signalProbability and
 * decoyPower otherwise. A record is flagged isSignal iff its intensity equals
 * signalPower.
 *
 * @throws core::SimulationError (InvalidParameter) on negative or non-finite
 *         powers, a probability outside [0,1] or blockSize <= 0.
 */
data::PulseSequence generateStates(double signalPower, double decoyPower,
                                   double signalProbability, int blockSize,
                                   Rng &rng);

/// is_signal flag per pulse, index-aligned with states.
std::vector<bool> signalFlags(const data::PulseSequence &states);

} // namespace qkdsync::sim
