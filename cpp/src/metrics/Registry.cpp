#include "qkdsync/metrics/Registry.h"
#include <utility>

namespace qkdsync::metrics {

void Registry::registerMetric(std::unique_ptr<IMetric> metric) {
  metrics_.push_back(std::move(metric));
}

void Registry::computeAll(data::SimulationResult &result) const {
  for (const auto &m : metrics_) {
    result.metrics[m->name()] = m->compute(result);
  }
}

Registry Registry::withDefaults() {
  Registry registry;
  registry.registerMetric(std::make_unique<SignalRate>());
  registry.registerMetric(std::make_unique<DecoyRate>());
  registry.registerMetric(std::make_unique<DarkFraction>());
  registry.registerMetric(std::make_unique<SyncSignificance>());
  return registry;
}

double SignalRate::compute(const data::SimulationResult &result) const {
  return result.statistics.signalRate;
}

double DecoyRate::compute(const data::SimulationResult &result) const {
  return result.statistics.decoyRate;
}

double DarkFraction::compute(const data::SimulationResult &result) const {
  if (result.statistics.totalCounts == 0)
    return 0.0;
  return static_cast<double>(result.statistics.darkCounts) /
         static_cast<double>(result.statistics.totalCounts);
}

double SyncSignificance::compute(const data::SimulationResult &result) const {
  return result.correlation.significance;
}

} // namespace qkdsync::metrics
