#include <QtTest/QtTest>
#include "TestSupport.h"
#include "qkdsync/analysis/Preprocessor.h"

using namespace qkdsync;

namespace {

data::PulseSequence pattern(std::initializer_list<bool> flags) {
  data::PulseSequence states;
  std::size_t i = 0;
  for (bool f : flags) {
    states.push_back({i, f ? 0.5 : 0.1, f});
    ++i;
  }
  return states;
}

} // namespace

class PreprocessorTest : public QObject {
  Q_OBJECT
private slots:
  void reference_is_signal_indicator() {
    const auto states = pattern({true, false, false, true, true});
    const data::DetectionRecord events = {{1, data::EventOrigin::Signal}};
    const auto h = analysis::buildHistograms(5, events, 1e-10, states);
    QCOMPARE(h.reference.counts, (std::vector<std::uint32_t>{1, 0, 0, 1, 1}));
    QCOMPARE(h.reference.binWidth, 1e-10);
  }

  void detected_counts_every_event_per_bin() {
    const auto states = pattern({true, true, true, true});
    const data::DetectionRecord events = {{0, data::EventOrigin::Dark},
                                          {3, data::EventOrigin::Signal},
                                          {3, data::EventOrigin::Dark},
                                          {6, data::EventOrigin::Decoy}};
    const auto h = analysis::buildHistograms(4, events, 2e-10, states);
    QCOMPARE(h.detected.counts,
             (std::vector<std::uint32_t>{1, 0, 0, 2, 0, 0, 1}));
    QCOMPARE(h.detected.total(), std::uint64_t{4});
    QCOMPARE(h.detected.timeOf(3), 6e-10);
  }

  void detected_length_covers_window() {
    const auto states = pattern({true, false, true});
    const data::DetectionRecord events = {{1, data::EventOrigin::Signal}};
    QCOMPARE(analysis::buildHistograms(3, events, 1.0, states).detected.size(),
             std::size_t{3});
    QCOMPARE(
        analysis::buildHistograms(3, events, 1.0, states, 8).detected.size(),
        std::size_t{8});
    const data::DetectionRecord late = {{11, data::EventOrigin::Dark}};
    QCOMPARE(analysis::buildHistograms(3, late, 1.0, states, 8).detected.size(),
             std::size_t{12});
  }

  void identical_input_identical_histograms() {
    const auto states = pattern({true, false, true, true, false, false});
    const data::DetectionRecord events = {{2, data::EventOrigin::Signal},
                                          {2, data::EventOrigin::Dark},
                                          {4, data::EventOrigin::Signal},
                                          {9, data::EventOrigin::Decoy}};
    const auto a = analysis::buildHistograms(6, events, 1e-10, states, 10);
    const auto b = analysis::buildHistograms(6, events, 1e-10, states, 10);
    QCOMPARE(a.reference.counts, b.reference.counts);
    QCOMPARE(a.detected.counts, b.detected.counts);
  }

  void empty_record_is_reported() {
    const auto states = pattern({true, false});
    const auto f = test::failureOf(
        [&] { analysis::buildHistograms(2, {}, 1e-10, states); });
    QVERIFY(f && f->kind == core::ErrorKind::EmptyInput);
    QCOMPARE(QString::fromStdString(f->component), QString("DataPreprocessor"));
  }

  void rejects_invalid_input() {
    const auto states = pattern({true, false});
    const data::DetectionRecord events = {{1, data::EventOrigin::Signal}};
    const data::DetectionRecord early = {{-1, data::EventOrigin::Signal}};
    using core::ErrorKind;
    QVERIFY(test::failsWith(ErrorKind::InvalidParameter, [&] {
      analysis::buildHistograms(2, events, 0.0, states);
    }));
    QVERIFY(test::failsWith(ErrorKind::InvalidParameter, [&] {
      analysis::buildHistograms(0, events, 1.0, {});
    }));
    QVERIFY(test::failsWith(ErrorKind::InvalidParameter, [&] {
      analysis::buildHistograms(3, events, 1.0, states);
    }));
    QVERIFY(test::failsWith(ErrorKind::InvalidParameter, [&] {
      analysis::buildHistograms(2, early, 1.0, states);
    }));
  }
};

QTEST_APPLESS_MAIN(PreprocessorTest)
#include "preprocessor_tests.moc"
