#pragma once

#include "qkdsync/data/SimulationResult.h"
#include <string>

namespace qkdsync::metrics {

/// A named scalar derived from a finished run.
class IMetric {
public:
  virtual ~IMetric() = default;
  virtual std::string name() const = 0;
  virtual double compute(const data::SimulationResult &result) const = 0;
};

} // namespace qkdsync::metrics
