#pragma once

#include "qkdsync/data/DetectionEvent.h"
#include "qkdsync/data/PulseRecord.h"
#include "qkdsync/sim/Rng.h"

namespace qkdsync::sim {

/// Per-pulse loss probability equivalent to an attenuation of lossDb dB.
double lossProbabilityFromDb(double lossDb);

/**
 * @brief Survival probability of a pulse of the given intensity.
 *
 * Photon-number click model 1 - exp(-eta * mu), with eta chosen so that a
 * pulse of maxIntensity survives with exactly 1 - lossProbability:
 * P = 1 - lossProbability^(intensity / maxIntensity). A lossless link
 * (lossProbability 0) keeps every pulse, vacuum pulses included.
 */
double survivalProbability(double intensity, double maxIntensity,
                           double lossProbability);

/**
 * @brief Propagate pulses through the lossy link.
 *
 * Each pulse survives an independent Bernoulli trial (see
 * survivalProbability). A survivor arrives in bin
 * index + trueOffset + round(N(0, jitterStd)); arrivals before bin 0 are
 * dropped. Returns Signal/Decoy events in pulse order, not merged with dark
 * counts.
 *
 * @throws core::SimulationError (InvalidParameter) when lossProbability is
 *         outside [0,1] or jitterStd is negative / non-finite.
 */
data::DetectionRecord applyChannel(const data::PulseSequence &states,
                                   double lossProbability, int trueOffset,
                                   double jitterStd, Rng &rng);

} // namespace qkdsync::sim
