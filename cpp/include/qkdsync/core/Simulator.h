#pragma once

#include "qkdsync/core/Error.h"
#include "qkdsync/core/EventBus.h"
#include "qkdsync/core/SimulationConfig.h"
#include "qkdsync/data/SimulationResult.h"
#include "qkdsync/sim/Rng.h"
#include <cstddef>
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

namespace qkdsync::core {

/// Topic published by runTrials() after each finished trial.
inline constexpr const char *kTrialFinishedTopic = "trial.finished";

struct TrialEvent {
  std::size_t trial{0};
  std::size_t total{0};
  std::uint64_t seed{0};
  bool syncSuccess{false};
  bool failed{false};
};

struct TrialOutcome {
  std::uint64_t seed{0};
  std::optional<data::SimulationResult> result; ///< Empty when the run failed.
  std::optional<ErrorKind> errorKind;
  std::string error;
};

/**
 * @brief Run the full pipeline once.
 *
 * States -> channel -> detections -> histograms -> correlation -> statistics
 * -> derived metrics. Uses config.seed when set, otherwise a fresh seed from
 * std::random_device; the seed used is stored in the result.
 *
 * The detection window spans blockSize + maxOffset bins; arrivals after it
 * closes are not recorded. A run without any detection is returned with a
 * zero correlation series, syncSuccess false and degenerate statistics
 * rather than aborting.
 *
 * @throws SimulationError (InvalidParameter) naming the stage that rejected
 *         its input. maxOffset is checked right after state generation,
 *         before the window is built.
 */
data::SimulationResult runSimulation(const SimulationConfig &config);

/// Same as above, drawing from a caller-owned generator. seed is only
/// recorded in the result.
data::SimulationResult runSimulation(const SimulationConfig &config,
                                     sim::Rng &rng, std::uint64_t seed);

/**
 * @brief Run independent trials on worker threads.
 *
 * Trial i uses its own generator seeded base + i, where base is config.seed
 * or a random_device draw, so results do not depend on the thread count.
 * Outcomes are returned in trial order. A trial rejected with a
 * SimulationError is recorded in its outcome; any other exception, including
 * one thrown by a bus subscriber, is rethrown after all workers have joined.
 */
std::vector<TrialOutcome> runTrials(const SimulationConfig &config,
                                    std::size_t trials, unsigned threads,
                                    const EventBus<TrialEvent> *bus = nullptr);

} // namespace qkdsync::core
