#pragma once

#include "qkdsync/metrics/IMetric.h"
#include <memory>
#include <vector>

namespace qkdsync::metrics {

class Registry {
public:
  void registerMetric(std::unique_ptr<IMetric> metric);
  /// Store every registered metric in result.metrics under its name.
  void computeAll(data::SimulationResult &result) const;
  std::size_t size() const { return metrics_.size(); }

  /// Registry holding the metrics reported by the front ends.
  static Registry withDefaults();

private:
  std::vector<std::unique_ptr<IMetric>> metrics_;
};

/// Signal-origin detections per second.
class SignalRate final : public IMetric {
public:
  std::string name() const override { return "signal_rate"; }
  double compute(const data::SimulationResult &result) const override;
};

/// Decoy-origin detections per second.
class DecoyRate final : public IMetric {
public:
  std::string name() const override { return "decoy_rate"; }
  double compute(const data::SimulationResult &result) const override;
};

/// Share of the detection record made of dark counts.
class DarkFraction final : public IMetric {
public:
  std::string name() const override { return "dark_fraction"; }
  double compute(const data::SimulationResult &result) const override;
};

/// Correlation peak height above the sidelobe floor, in floor std devs.
class SyncSignificance final : public IMetric {
public:
  std::string name() const override { return "sync_significance"; }
  double compute(const data::SimulationResult &result) const override;
};

} // namespace qkdsync::metrics
