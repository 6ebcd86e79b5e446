#include <QtTest/QtTest>
#include "TestSupport.h"
#include "qkdsync/sim/ChannelModel.h"
#include "qkdsync/sim/DetectionHandler.h"
#include "qkdsync/sim/StateGenerator.h"
#include <algorithm>
#include <cmath>
#include <utility>

using namespace qkdsync;

namespace {

data::PulseSequence uniformBlock(std::size_t n, double intensity) {
  data::PulseSequence states;
  for (std::size_t i = 0; i < n; ++i)
    states.push_back({i, intensity, true});
  return states;
}

} // namespace

class ChannelTest : public QObject {
  Q_OBJECT
private slots:
  void full_loss_yields_no_events() {
    for (std::uint64_t seed = 1; seed <= 5; ++seed) {
      auto rng = sim::makeRng(seed);
      const auto states = sim::generateStates(0.5, 0.1, 0.7, 2000, rng);
      QVERIFY(sim::applyChannel(states, 1.0, 5, 2.0, rng).empty());
    }
  }

  void zero_loss_preserves_every_pulse() {
    auto rng = sim::makeRng(8);
    const auto states = sim::generateStates(0.5, 0.1, 0.7, 1500, rng);
    const auto events = sim::applyChannel(states, 0.0, 7, 0.0, rng);
    QCOMPARE(events.size(), states.size());
    for (std::size_t i = 0; i < events.size(); ++i) {
      QCOMPARE(events[i].timestampBin, static_cast<long long>(i) + 7);
      QVERIFY(events[i].origin == (states[i].isSignal
                                       ? data::EventOrigin::Signal
                                       : data::EventOrigin::Decoy));
    }
  }

  void zero_loss_preserves_vacuum_decoys() {
    auto rng = sim::makeRng(12);
    const auto states = sim::generateStates(0.5, 0.0, 0.7, 1000, rng);
    const auto events = sim::applyChannel(states, 0.0, 0, 0.0, rng);
    QCOMPARE(events.size(), states.size());
    const auto decoys = std::count_if(
        events.begin(), events.end(),
        [](const auto &e) { return e.origin == data::EventOrigin::Decoy; });
    QVERIFY(decoys > 0);
    QCOMPARE(sim::survivalProbability(0.0, 0.5, 0.0), 1.0);
  }

  void arrivals_before_window_are_dropped() {
    auto rng = sim::makeRng(9);
    const auto events =
        sim::applyChannel(uniformBlock(100, 0.5), 0.0, -10, 0.0, rng);
    QCOMPARE(events.size(), std::size_t{90});
    QCOMPARE(events.front().timestampBin, 0LL);
    QCOMPARE(events.back().timestampBin, 89LL);
  }

  void signal_survival_matches_loss() {
    constexpr std::size_t n = 100000;
    auto rng = sim::makeRng(10);
    const auto events =
        sim::applyChannel(uniformBlock(n, 0.5), 0.9, 0, 0.0, rng);
    const double fraction = static_cast<double>(events.size()) / n;
    QVERIFY(std::abs(fraction - 0.1) < 5.0 * std::sqrt(0.1 * 0.9 / n));
  }

  void decoy_survival_follows_photon_number() {
    QCOMPARE(sim::survivalProbability(0.5, 0.5, 0.9), 0.1);
    QCOMPARE(sim::survivalProbability(0.1, 0.5, 0.9),
             1.0 - std::pow(0.9, 0.2));
    QCOMPARE(sim::survivalProbability(0.1, 0.5, 0.0), 1.0);
    QCOMPARE(sim::survivalProbability(0.1, 0.5, 1.0), 0.0);
    QCOMPARE(sim::survivalProbability(0.0, 0.5, 0.5), 0.0);
    QCOMPARE(sim::survivalProbability(0.0, 0.0, 0.25), 0.75);
  }

  void jitter_is_centred_with_requested_spread() {
    constexpr std::size_t n = 100000;
    auto rng = sim::makeRng(12);
    const auto events =
        sim::applyChannel(uniformBlock(n, 0.5), 0.0, 1000, 3.0, rng);
    QCOMPARE(events.size(), n);
    double sum = 0.0, sumSq = 0.0;
    for (std::size_t i = 0; i < n; ++i) {
      const double d =
          static_cast<double>(events[i].timestampBin) - 1000.0 - i;
      sum += d;
      sumSq += d * d;
    }
    const double mean = sum / n;
    const double sd = std::sqrt(sumSq / n - mean * mean);
    QVERIFY(std::abs(mean) < 0.05);
    QVERIFY(std::abs(sd - 3.0) < 0.1);
  }

  void loss_from_db() {
    QCOMPARE(sim::lossProbabilityFromDb(0.0), 0.0);
    QCOMPARE(sim::lossProbabilityFromDb(10.0), 0.9);
    QCOMPARE(sim::lossProbabilityFromDb(20.0), 0.99);
    QVERIFY(test::failsWith(core::ErrorKind::InvalidParameter,
                            [] { sim::lossProbabilityFromDb(-1.0); }));
  }

  void rejects_invalid_channel_parameters() {
    auto rng = sim::makeRng(1);
    const auto states = uniformBlock(10, 0.5);
    for (double loss : {-0.01, 1.01, std::nan("")}) {
      const auto f =
          test::failureOf([&] { sim::applyChannel(states, loss, 0, 0.0, rng); });
      QVERIFY(f && f->kind == core::ErrorKind::InvalidParameter);
      QCOMPARE(QString::fromStdString(f->component), QString("ChannelEffects"));
    }
    QVERIFY(test::failsWith(core::ErrorKind::InvalidParameter, [&] {
      sim::applyChannel(states, 0.5, 0, -1.0, rng);
    }));
  }

  void detections_are_sorted_and_complete() {
    auto rng = sim::makeRng(21);
    const auto states = sim::generateStates(0.5, 0.1, 0.7, 5000, rng);
    auto survivors = sim::applyChannel(states, 0.5, 3, 4.0, rng);
    const std::size_t survivorCount = survivors.size();
    const auto events =
        sim::recordDetections(std::move(survivors), 0.02, 5050, rng);

    QVERIFY(std::is_sorted(events.begin(), events.end(),
                           [](const auto &a, const auto &b) {
                             return a.timestampBin < b.timestampBin;
                           }));
    const auto dark = static_cast<std::size_t>(
        std::count_if(events.begin(), events.end(), [](const auto &e) {
          return e.origin == data::EventOrigin::Dark;
        }));
    QCOMPARE(events.size(), survivorCount + dark);
    for (const auto &e : events) {
      if (e.origin == data::EventOrigin::Dark)
        QVERIFY(e.timestampBin >= 0 && e.timestampBin < 5050);
    }
  }

  void dark_counts_follow_rate() {
    auto rng = sim::makeRng(33);
    const auto events = sim::recordDetections({}, 0.05, 100000, rng);
    // Poisson mean 5000, sd ~71.
    QVERIFY(std::abs(static_cast<double>(events.size()) - 5000.0) < 360.0);
  }

  void zero_dark_rate_only_sorts() {
    auto rng = sim::makeRng(34);
    data::DetectionRecord survivors = {{9, data::EventOrigin::Signal},
                                       {2, data::EventOrigin::Decoy},
                                       {2, data::EventOrigin::Signal},
                                       {5, data::EventOrigin::Signal}};
    const auto events = sim::recordDetections(survivors, 0.0, 10, rng);
    QCOMPARE(events.size(), std::size_t{4});
    QCOMPARE(events[0].timestampBin, 2LL);
    QCOMPARE(events[1].timestampBin, 2LL);
    QCOMPARE(events[2].timestampBin, 5LL);
    QCOMPARE(events[3].timestampBin, 9LL);
  }

  void rejects_invalid_detection_parameters() {
    auto rng = sim::makeRng(1);
    QVERIFY(test::failsWith(core::ErrorKind::InvalidParameter,
                            [&] { sim::recordDetections({}, -0.1, 10, rng); }));
    QVERIFY(test::failsWith(core::ErrorKind::InvalidParameter,
                            [&] { sim::recordDetections({}, 0.1, 0, rng); }));
  }
};

QTEST_APPLESS_MAIN(ChannelTest)
#include "channel_tests.moc"
