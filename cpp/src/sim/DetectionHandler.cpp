#include "qkdsync/sim/DetectionHandler.h"
#include "qkdsync/core/Error.h"
#include <QDebug>
#include <algorithm>
#include <cmath>
#include <utility>

namespace qkdsync::sim {

namespace {
constexpr const char *kComponent = "DetectionHandler";
} // namespace

data::DetectionRecord recordDetections(data::DetectionRecord survivors,
                                       double darkCountRate,
                                       long long windowBins, Rng &rng) {
  core::require(std::isfinite(darkCountRate) && darkCountRate >= 0.0,
                kComponent, "dark_count_rate must be a finite value >= 0");
  core::require(windowBins > 0, kComponent,
                "detection window must span at least one bin");

  const std::size_t signalEvents = survivors.size();
  data::DetectionRecord events = std::move(survivors);

  // std::poisson_distribution requires a strictly positive mean.
  if (darkCountRate > 0.0) {
    std::poisson_distribution<int> darkPerBin(darkCountRate);
    for (long long bin = 0; bin < windowBins; ++bin) {
      const int n = darkPerBin(rng);
      for (int k = 0; k < n; ++k)
        events.push_back({bin, data::EventOrigin::Dark});
    }
  }

  std::sort(events.begin(), events.end(),
            [](const data::DetectionEvent &a, const data::DetectionEvent &b) {
              return a.timestampBin < b.timestampBin;
            });

  qDebug("recordDetections: %zu survivors + %zu dark over %lld bins",
         signalEvents, events.size() - signalEvents, windowBins);
  return events;
}

} // namespace qkdsync::sim
