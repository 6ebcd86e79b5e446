#pragma once

#include <cstdint>
#include <optional>

namespace qkdsync::core {

/// Sender (Alice) parameters.
struct SourceConfig {
  /// Mean photon number per signal pulse.
  double signalPower{0.5};
  /// Mean photon number per decoy pulse.
  double decoyPower{0.1};
  /// Probability that a slot carries a signal pulse.
  double signalProbability{0.7};
  /// Number of pulses per block.
  int blockSize{1000};
};

/**
 * @brief Link and detector parameters, fixed for the duration of one run.
 *
 * Offsets and jitter are in detector bins; timeBinWidth converts bins to
 * seconds for rates and plot axes.
 */
struct ChannelConfig {
  /// Probability that a signal pulse produces no click.
  double lossProbability{0.9};
  /// Mean dark counts per detector bin.
  double darkCountRate{0.01};
  /// Seconds per detector bin.
  double timeBinWidth{100e-12};
  /// Clock offset between sender and receiver, in bins.
  int syncOffsetTrue{5};
  /// Standard deviation of the arrival-time jitter, in bins.
  double syncJitterStd{0.0};
};

/// Receiver-side processing parameters.
struct ProcessingConfig {
  /// Largest |offset| searched by the correlation engine.
  int maxOffset{20};
  /// Peak must exceed the sidelobe floor by this many standard deviations.
  double syncThresholdSigma{2.5};
};

/**
 * @brief Immutable input of one simulation run.
 *
 * Front ends fill this from JSON / command-line options and pass it once into
 * runSimulation(). Each pipeline stage re-checks the fields it consumes.
 */
struct SimulationConfig {
  SourceConfig source;
  ChannelConfig channel;
  ProcessingConfig processing;
  /// Fixed seed for reproducible runs; drawn from std::random_device if unset.
  std::optional<std::uint64_t> seed;
};

} // namespace qkdsync::core
