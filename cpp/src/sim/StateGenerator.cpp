#include "qkdsync/sim/StateGenerator.h"
#include "qkdsync/core/Error.h"
#include <QDebug>
#include <cmath>

namespace qkdsync::sim {

namespace {
constexpr const char *kComponent = "StateGenerator";
} // namespace

data::PulseSequence generateStates(double signalPower, double decoyPower,
                                   double signalProbability, int blockSize,
                                   Rng &rng) {
  core::require(std::isfinite(signalPower) && signalPower >= 0.0, kComponent,
                "signal_power must be a finite value >= 0");
  core::require(std::isfinite(decoyPower) && decoyPower >= 0.0, kComponent,
                "decoy_power must be a finite value >= 0");
  core::require(signalProbability >= 0.0 && signalProbability <= 1.0,
                kComponent, "signal_probability must lie in [0, 1]");
  core::require(blockSize > 0, kComponent, "block_size must be positive");

  std::bernoulli_distribution pickSignal(signalProbability);

  data::PulseSequence states;
  states.reserve(static_cast<std::size_t>(blockSize));
  std::size_t signals = 0;
  for (int i = 0; i < blockSize; ++i) {
    const double intensity = pickSignal(rng) ? signalPower : decoyPower;
    const bool isSignal = intensity == signalPower;
    signals += isSignal ? 1 : 0;
    states.push_back({static_cast<std::size_t>(i), intensity, isSignal});
  }

  qDebug("generateStates: %d pulses, %zu signal (mu_s=%.3f mu_d=%.3f p=%.3f)",
         blockSize, signals, signalPower, decoyPower, signalProbability);
  return states;
}

std::vector<bool> signalFlags(const data::PulseSequence &states) {
  std::vector<bool> flags;
  flags.reserve(states.size());
  for (const auto &s : states)
    flags.push_back(s.isSignal);
  return flags;
}

} // namespace qkdsync::sim
