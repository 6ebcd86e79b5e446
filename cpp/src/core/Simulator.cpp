#include "qkdsync/core/Simulator.h"
#include "qkdsync/analysis/CorrelationEngine.h"
#include "qkdsync/analysis/Preprocessor.h"
#include "qkdsync/analysis/StatisticsCalculator.h"
#include "qkdsync/metrics/Registry.h"
#include "qkdsync/sim/ChannelModel.h"
#include "qkdsync/sim/DetectionHandler.h"
#include "qkdsync/sim/StateGenerator.h"
#include <QDebug>
#include <algorithm>
#include <atomic>
#include <exception>
#include <mutex>
#include <random>
#include <thread>
#include <utility>

namespace qkdsync::core {

namespace {

std::uint64_t freshSeed() {
  std::random_device rd;
  return (static_cast<std::uint64_t>(rd()) << 32) ^ rd();
}

} // namespace

data::SimulationResult runSimulation(const SimulationConfig &config) {
  const std::uint64_t seed = config.seed ? *config.seed : freshSeed();
  auto rng = sim::makeRng(seed);
  return runSimulation(config, rng, seed);
}

data::SimulationResult runSimulation(const SimulationConfig &config,
                                     sim::Rng &rng, std::uint64_t seed) {
  const auto &src = config.source;
  const auto &ch = config.channel;
  const auto &proc = config.processing;

  data::SimulationResult result;
  result.config = config;
  result.seed = seed;

  result.states = sim::generateStates(src.signalPower, src.decoyPower,
                                      src.signalProbability, src.blockSize,
                                      rng);
  // The detection window below is sized from max_offset.
  analysis::checkSearchRange(proc.maxOffset, result.states.size());

  auto survivors = sim::applyChannel(result.states, ch.lossProbability,
                                     ch.syncOffsetTrue, ch.syncJitterStd, rng);

  // Room for the offset search on both sides of the block.
  const long long windowBins =
      static_cast<long long>(src.blockSize) + proc.maxOffset;
  const auto late = std::erase_if(survivors, [windowBins](const auto &ev) {
    return ev.timestampBin >= windowBins;
  });
  if (late > 0)
    qDebug("runSimulation: %zu arrivals after the window closed", late);
  result.detections = sim::recordDetections(std::move(survivors),
                                            ch.darkCountRate, windowBins, rng);

  const auto window = static_cast<std::size_t>(windowBins);
  if (result.detections.empty()) {
    qWarning("runSimulation: no detections (seed=%llu); reporting degenerate "
             "statistics",
             static_cast<unsigned long long>(seed));
    result.reference = analysis::referenceHistogram(result.states,
                                                    ch.timeBinWidth);
    result.detected = analysis::detectedHistogram({}, ch.timeBinWidth, window);
  } else {
    auto histograms = analysis::buildHistograms(
        result.states.size(), result.detections, ch.timeBinWidth,
        result.states, window);
    result.reference = std::move(histograms.reference);
    result.detected = std::move(histograms.detected);
  }

  result.correlation = analysis::correlate(result.reference, result.detected,
                                           proc.maxOffset,
                                           proc.syncThresholdSigma);
  result.statistics = analysis::computeStatistics(
      result.detections, result.correlation, result.states, ch.timeBinWidth,
      result.detected.size());

  result.timePoints.reserve(result.correlation.offsets.size());
  for (int k : result.correlation.offsets)
    result.timePoints.push_back(static_cast<double>(k) * ch.timeBinWidth);

  metrics::Registry::withDefaults().computeAll(result);

  qInfo("runSimulation seed=%llu counts=%llu peak=%d (true %d) sync=%s "
        "qber=%.4f",
        static_cast<unsigned long long>(seed),
        static_cast<unsigned long long>(result.statistics.totalCounts),
        result.correlation.peakOffset, ch.syncOffsetTrue,
        result.statistics.syncSuccess ? "yes" : "no", result.statistics.qber);
  return result;
}

std::vector<TrialOutcome> runTrials(const SimulationConfig &config,
                                    std::size_t trials, unsigned threads,
                                    const EventBus<TrialEvent> *bus) {
  std::vector<TrialOutcome> outcomes(trials);
  if (trials == 0)
    return outcomes;

  const std::uint64_t base = config.seed ? *config.seed : freshSeed();
  const unsigned workers = static_cast<unsigned>(
      std::clamp<std::size_t>(threads == 0 ? 1 : threads, 1, trials));

  std::atomic<std::size_t> next{0};
  std::mutex failureMutex;
  std::exception_ptr failure;
  auto keepFailure = [&](std::exception_ptr e) {
    std::scoped_lock lk(failureMutex);
    if (!failure)
      failure = std::move(e);
  };

  auto worker = [&]() {
    for (std::size_t i = next++; i < trials; i = next++) {
      auto &out = outcomes[i];
      out.seed = base + i;
      TrialEvent ev{i, trials, out.seed, false, false};
      try {
        auto rng = sim::makeRng(out.seed);
        out.result = runSimulation(config, rng, out.seed);
        ev.syncSuccess = out.result->statistics.syncSuccess;
      } catch (const SimulationError &e) {
        out.errorKind = e.kind();
        out.error = e.what();
        ev.failed = true;
      } catch (...) {
        keepFailure(std::current_exception());
        return;
      }
      if (!bus)
        continue;
      // A throwing subscriber stops this worker; the exception reaches the
      // caller after join.
      try {
        bus->publish(kTrialFinishedTopic, ev);
      } catch (...) {
        keepFailure(std::current_exception());
        return;
      }
    }
  };

  std::vector<std::thread> pool;
  pool.reserve(workers);
  for (unsigned w = 0; w < workers; ++w)
    pool.emplace_back(worker);
  for (auto &t : pool)
    t.join();

  if (failure)
    std::rethrow_exception(failure);
  return outcomes;
}

} // namespace qkdsync::core
