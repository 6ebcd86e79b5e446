#include "qkdsync/sim/ChannelModel.h"
#include "qkdsync/core/Error.h"
#include <QDebug>
#include <algorithm>
#include <cmath>

namespace qkdsync::sim {

namespace {
constexpr const char *kComponent = "ChannelEffects";
} // namespace

double lossProbabilityFromDb(double lossDb) {
  core::require(std::isfinite(lossDb) && lossDb >= 0.0, kComponent,
                "loss_db must be a finite value >= 0");
  return 1.0 - std::pow(10.0, -lossDb / 10.0);
}

double survivalProbability(double intensity, double maxIntensity,
                           double lossProbability) {
  if (lossProbability <= 0.0) // lossless link keeps vacuum pulses too
    return 1.0;
  if (maxIntensity <= 0.0) // all-vacuum block: fall back to flat loss
    return 1.0 - lossProbability;
  if (intensity <= 0.0)
    return 0.0;
  return 1.0 - std::pow(lossProbability, intensity / maxIntensity);
}

data::DetectionRecord applyChannel(const data::PulseSequence &states,
                                   double lossProbability, int trueOffset,
                                   double jitterStd, Rng &rng) {
  core::require(lossProbability >= 0.0 && lossProbability <= 1.0, kComponent,
                "loss_probability must lie in [0, 1]");
  core::require(std::isfinite(jitterStd) && jitterStd >= 0.0, kComponent,
                "jitter_std must be a finite value >= 0");

  double maxIntensity = 0.0;
  for (const auto &s : states)
    maxIntensity = std::max(maxIntensity, s.intensity);

  std::uniform_real_distribution<double> unit(0.0, 1.0);
  std::normal_distribution<double> jitter(0.0, jitterStd > 0.0 ? jitterStd
                                                                : 1.0);

  data::DetectionRecord events;
  std::size_t dropped = 0;
  for (const auto &s : states) {
    const double p = survivalProbability(s.intensity, maxIntensity,
                                         lossProbability);
    if (!(unit(rng) < p))
      continue;
    long long bin = static_cast<long long>(s.index) + trueOffset;
    if (jitterStd > 0.0)
      bin += std::llround(jitter(rng));
    if (bin < 0) {
      ++dropped;
      continue;
    }
    events.push_back({bin, s.isSignal ? data::EventOrigin::Signal
                                      : data::EventOrigin::Decoy});
  }

  qDebug("applyChannel: %zu of %zu pulses survived (loss=%.3f offset=%d "
         "jitter=%.2f, %zu before window)",
         events.size(), states.size(), lossProbability, trueOffset, jitterStd,
         dropped);
  return events;
}

} // namespace qkdsync::sim
