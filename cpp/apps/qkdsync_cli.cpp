#include "qkdsync/core/Simulator.h"
#include "qkdsync/io/ConfigIO.h"
#include "qkdsync/io/ResultExport.h"
#include "qkdsync/sim/ChannelModel.h"
#include <QCommandLineParser>
#include <QCoreApplication>
#include <QLoggingCategory>
#include <cstdio>
#include <iostream>
#include <vector>

namespace {

constexpr int kExitOk = 0;
constexpr int kExitIo = 1;
constexpr int kExitConfig = 2;

struct NumericOption {
  QCommandLineOption option;
  double *target;
};

struct IntOption {
  QCommandLineOption option;
  int *target;
};

void printSummary(const qkdsync::data::SimulationResult &r) {
  const auto &st = r.statistics;
  const auto &corr = r.correlation;
  std::printf("seed              %llu\n",
              static_cast<unsigned long long>(r.seed));
  std::printf("peak offset       %d (true %d)\n", corr.peakOffset,
              r.config.channel.syncOffsetTrue);
  std::printf("peak value        %.1f (floor %.2f +- %.2f, %.2f sigma)\n",
              corr.peakValue, corr.floorMean, corr.floorStdDev,
              corr.significance);
  std::printf("sync              %s\n", st.syncSuccess ? "success" : "FAILED");
  std::printf("total counts      %llu (signal %llu, decoy %llu, dark %llu)\n",
              static_cast<unsigned long long>(st.totalCounts),
              static_cast<unsigned long long>(st.signalCounts),
              static_cast<unsigned long long>(st.decoyCounts),
              static_cast<unsigned long long>(st.darkCounts));
  std::printf("mean count rate   %.4g cps\n", st.meanCountRate);
  std::printf("qber              %.4f\n", st.qber);
  for (const auto &[name, value] : r.metrics)
    std::printf("%-17s %.4g\n", name.c_str(), value);
  if (st.degenerate)
    std::printf("warning           no detections, statistics degenerate\n");
}

int runTrialsMode(const qkdsync::core::SimulationConfig &cfg,
                  std::size_t trials, unsigned threads) {
  using namespace qkdsync;
  core::EventBus<core::TrialEvent> bus;
  bus.subscribe(core::kTrialFinishedTopic, [](const core::TrialEvent &ev) {
    qInfo("trial %zu/%zu seed=%llu %s", ev.trial + 1, ev.total,
          static_cast<unsigned long long>(ev.seed),
          ev.failed ? "failed" : (ev.syncSuccess ? "sync" : "no sync"));
  });

  const auto outcomes = core::runTrials(cfg, trials, threads, &bus);

  std::size_t ok = 0, synced = 0, onTarget = 0;
  double qberSum = 0.0, countSum = 0.0;
  for (const auto &out : outcomes) {
    if (!out.result) {
      std::cerr << "seed " << out.seed << ": " << out.error << "\n";
      if (out.errorKind == core::ErrorKind::InvalidParameter)
        return kExitConfig;
      continue;
    }
    ++ok;
    const auto &r = *out.result;
    synced += r.statistics.syncSuccess ? 1 : 0;
    onTarget += r.correlation.peakOffset == cfg.channel.syncOffsetTrue ? 1 : 0;
    qberSum += r.statistics.qber;
    countSum += static_cast<double>(r.statistics.totalCounts);
  }
  const double n = ok ? static_cast<double>(ok) : 1.0;
  std::printf("trials            %zu (%zu completed)\n", trials, ok);
  std::printf("sync success      %.3f\n", synced / n);
  std::printf("peak on offset    %.3f\n", onTarget / n);
  std::printf("mean counts       %.2f\n", countSum / n);
  std::printf("mean qber         %.4f\n", qberSum / n);
  return kExitOk;
}

} // namespace

int main(int argc, char **argv) {
  QCoreApplication app(argc, argv);
  QCoreApplication::setApplicationName("qkdsync_cli");

  QCommandLineParser parser;
  parser.setApplicationDescription(
      "Decoy-state QKD link simulation with correlation clock recovery");
  parser.addHelpOption();

  QCommandLineOption configOpt({"c", "config"}, "Load parameters from JSON.",
                               "file");
  QCommandLineOption saveOpt("save-config",
                             "Write the effective parameters to JSON.",
                             "file");
  QCommandLineOption lossDbOpt("loss-db",
                               "Channel attenuation in dB (replaces --loss).",
                               "dB");
  QCommandLineOption seedOpt({"s", "seed"}, "Random seed.", "n");
  QCommandLineOption trialsOpt("trials", "Number of independent runs.", "n",
                               "1");
  QCommandLineOption threadsOpt("threads", "Worker threads for --trials.",
                                "n", "1");
  QCommandLineOption corrCsvOpt("correlation-csv",
                                "Export the correlation series.", "file");
  QCommandLineOption countsCsvOpt("counts-csv",
                                  "Export the detected count series.", "file");
  QCommandLineOption jsonOpt("json", "Export the full result as JSON.",
                             "file");
  QCommandLineOption verboseOpt({"v", "verbose"}, "Enable debug output.");

  qkdsync::core::SimulationConfig cfg;
  std::vector<NumericOption> numeric = {
      {{"signal-power", "Mean photons per signal pulse.", "mu"},
       &cfg.source.signalPower},
      {{"decoy-power", "Mean photons per decoy pulse.", "mu"},
       &cfg.source.decoyPower},
      {{"signal-prob", "Probability of a signal pulse.", "p"},
       &cfg.source.signalProbability},
      {{"loss", "Per-pulse loss probability of signal pulses.", "p"},
       &cfg.channel.lossProbability},
      {{"dark-count", "Mean dark counts per bin.", "rate"},
       &cfg.channel.darkCountRate},
      {{"time-bin", "Detector bin width in seconds.", "s"},
       &cfg.channel.timeBinWidth},
      {{"jitter", "Arrival jitter std dev in bins.", "bins"},
       &cfg.channel.syncJitterStd},
      {{"sync-sigma", "Sync threshold above the sidelobe floor.", "sigma"},
       &cfg.processing.syncThresholdSigma},
  };
  std::vector<IntOption> integral = {
      {{"block-size", "Pulses per block.", "n"}, &cfg.source.blockSize},
      {{"offset", "True clock offset in bins.", "bins"},
       &cfg.channel.syncOffsetTrue},
      {{"max-offset", "Offset search range in bins.", "bins"},
       &cfg.processing.maxOffset},
  };

  for (const auto &o : {configOpt, saveOpt, lossDbOpt, seedOpt, trialsOpt,
                        threadsOpt, corrCsvOpt, countsCsvOpt, jsonOpt,
                        verboseOpt})
    parser.addOption(o);
  for (const auto &o : numeric)
    parser.addOption(o.option);
  for (const auto &o : integral)
    parser.addOption(o.option);
  parser.process(app);

  if (!parser.isSet(verboseOpt))
    QLoggingCategory::setFilterRules("*.debug=false\ndefault.info=false");

  if (parser.isSet(configOpt)) {
    QString error;
    auto loaded = qkdsync::io::loadConfig(parser.value(configOpt), &error);
    if (!loaded) {
      std::cerr << "config: " << error.toStdString() << "\n";
      return kExitConfig;
    }
    cfg = *loaded;
  }

  // Command-line values override the file.
  for (const auto &o : numeric) {
    if (!parser.isSet(o.option))
      continue;
    bool ok = false;
    const double v = parser.value(o.option).toDouble(&ok);
    if (!ok) {
      std::cerr << "--" << o.option.names().front().toStdString()
                << ": not a number\n";
      return kExitConfig;
    }
    *o.target = v;
  }
  for (const auto &o : integral) {
    if (!parser.isSet(o.option))
      continue;
    bool ok = false;
    const int v = parser.value(o.option).toInt(&ok);
    if (!ok) {
      std::cerr << "--" << o.option.names().front().toStdString()
                << ": not an integer\n";
      return kExitConfig;
    }
    *o.target = v;
  }
  if (parser.isSet(seedOpt)) {
    bool ok = false;
    cfg.seed = parser.value(seedOpt).toULongLong(&ok);
    if (!ok) {
      std::cerr << "--seed: not an unsigned integer\n";
      return kExitConfig;
    }
  }

  bool trialsOk = false, threadsOk = false;
  const auto trials = parser.value(trialsOpt).toULongLong(&trialsOk);
  const auto threads = parser.value(threadsOpt).toUInt(&threadsOk);
  if (!trialsOk || trials == 0 || !threadsOk) {
    std::cerr << "--trials/--threads: expected positive integers\n";
    return kExitConfig;
  }

  try {
    if (parser.isSet(lossDbOpt)) {
      bool ok = false;
      const double db = parser.value(lossDbOpt).toDouble(&ok);
      if (!ok) {
        std::cerr << "--loss-db: not a number\n";
        return kExitConfig;
      }
      cfg.channel.lossProbability = qkdsync::sim::lossProbabilityFromDb(db);
    }

    if (parser.isSet(saveOpt)) {
      QString error;
      if (!qkdsync::io::saveConfig(cfg, parser.value(saveOpt), &error)) {
        std::cerr << error.toStdString() << "\n";
        return kExitIo;
      }
    }

    if (trials > 1)
      return runTrialsMode(cfg, static_cast<std::size_t>(trials), threads);

    const auto result = qkdsync::core::runSimulation(cfg);
    printSummary(result);

    QString error;
    if (parser.isSet(corrCsvOpt) &&
        !qkdsync::io::exportCorrelationCsv(result, parser.value(corrCsvOpt),
                                           &error)) {
      std::cerr << error.toStdString() << "\n";
      return kExitIo;
    }
    if (parser.isSet(countsCsvOpt) &&
        !qkdsync::io::exportCountsCsv(result, parser.value(countsCsvOpt),
                                      &error)) {
      std::cerr << error.toStdString() << "\n";
      return kExitIo;
    }
    if (parser.isSet(jsonOpt) &&
        !qkdsync::io::exportResultJson(result, parser.value(jsonOpt),
                                       &error)) {
      std::cerr << error.toStdString() << "\n";
      return kExitIo;
    }
  } catch (const qkdsync::core::SimulationError &e) {
    std::cerr << "[" << qkdsync::core::toString(e.kind()) << "] " << e.what()
              << "\n";
    return e.kind() == qkdsync::core::ErrorKind::InvalidParameter
               ? kExitConfig
               : kExitIo;
  }
  return kExitOk;
}
