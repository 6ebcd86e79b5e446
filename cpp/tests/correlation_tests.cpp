#include <QtTest/QtTest>
#include "TestSupport.h"
#include "qkdsync/analysis/CorrelationEngine.h"

using namespace qkdsync;

namespace {

data::Histogram histogram(std::vector<std::uint32_t> counts) {
  data::Histogram h;
  h.binWidth = 1e-10;
  h.counts = std::move(counts);
  return h;
}

// detected[i + shift] = reference[i] wherever that bin exists.
data::Histogram shifted(const data::Histogram &ref, int shift,
                        std::size_t length) {
  data::Histogram det;
  det.binWidth = ref.binWidth;
  det.counts.assign(length, 0);
  for (std::size_t i = 0; i < ref.size(); ++i) {
    const long long b = static_cast<long long>(i) + shift;
    if (b >= 0 && b < static_cast<long long>(length))
      det.counts[static_cast<std::size_t>(b)] = ref.counts[i];
  }
  return det;
}

} // namespace

class CorrelationTest : public QObject {
  Q_OBJECT
private slots:
  void correlation_value_by_hand() {
    const auto ref = histogram({1, 0, 1, 1});
    const auto det = histogram({0, 2, 1, 0, 3, 1});
    // k=0: 1*0 + 1*1 + 1*0 = 1
    QCOMPARE(analysis::correlationAt(ref, det, 0), 1.0);
    // k=1: 1*2 + 1*0 + 1*3 = 5
    QCOMPARE(analysis::correlationAt(ref, det, 1), 5.0);
    // k=-1: i from 1: ref[2]*det[1] + ref[3]*det[2] = 2 + 1
    QCOMPARE(analysis::correlationAt(ref, det, -1), 3.0);
    // k=2: ref[0]*det[2] + ref[2]*det[4] + ref[3]*det[5] = 1 + 3 + 1
    QCOMPARE(analysis::correlationAt(ref, det, 2), 5.0);
  }

  void series_spans_offset_range() {
    const auto ref = test::randomPattern(64, 5);
    const auto det = shifted(ref, 0, 70);
    const auto r = analysis::correlate(ref, det, 6, 2.5);
    QCOMPARE(r.offsets.size(), std::size_t{13});
    QCOMPARE(r.correlationValues.size(), r.offsets.size());
    QCOMPARE(r.offsets.front(), -6);
    QCOMPARE(r.offsets.back(), 6);
    for (std::size_t i = 0; i < r.offsets.size(); ++i) {
      QCOMPARE(r.correlationValues[i],
               analysis::correlationAt(ref, det, r.offsets[i]));
    }
  }

  void recovers_noiseless_shift_data() {
    QTest::addColumn<int>("shift");
    for (int k : {0, 1, 5, -7, 13, 20, -20})
      QTest::newRow(qPrintable(QString("k=%1").arg(k))) << k;
  }

  void recovers_noiseless_shift() {
    QFETCH(int, shift);
    constexpr int maxOffset = 20;
    const auto ref = test::randomPattern(500, 1234);
    const auto det = shifted(ref, shift, ref.size() + maxOffset);
    const auto r = analysis::correlate(ref, det, maxOffset, 2.5);
    QCOMPARE(r.peakOffset, shift);
    QCOMPARE(r.peakValue, analysis::correlationAt(ref, det, shift));
    QVERIFY(r.syncSuccess);
    QVERIFY(r.significance > 2.5);
  }

  void symmetric_tie_prefers_negative_offset() {
    // Single reference pulse at 5; detections two bins early and late.
    const auto ref = histogram({0, 0, 0, 0, 0, 1, 0, 0, 0, 0, 0});
    const auto det = histogram({0, 0, 0, 1, 0, 0, 0, 1, 0, 0, 0});
    const auto r = analysis::correlate(ref, det, 4, 2.5);
    QCOMPARE(analysis::correlationAt(ref, det, -2), 1.0);
    QCOMPARE(analysis::correlationAt(ref, det, 2), 1.0);
    QCOMPARE(r.peakOffset, -2);
    QCOMPARE(r.peakValue, 1.0);
  }

  void tie_prefers_smallest_magnitude() {
    const auto ref = histogram({0, 0, 0, 0, 0, 1, 0, 0, 0, 0, 0});
    const auto det = histogram({0, 0, 1, 0, 0, 0, 1, 0, 0, 0, 0});
    // C(-3) == C(+1) == 1
    const auto r = analysis::correlate(ref, det, 4, 2.5);
    QCOMPARE(r.peakOffset, 1);
  }

  void flat_correlation_never_syncs() {
    const auto ref = test::randomPattern(100, 77);
    const auto det = histogram(std::vector<std::uint32_t>(120, 0));
    const auto r = analysis::correlate(ref, det, 10, 2.5);
    QCOMPARE(r.peakOffset, 0);
    QCOMPARE(r.peakValue, 0.0);
    QVERIFY(!r.syncSuccess);
  }

  void high_threshold_rejects_weak_peak() {
    const auto ref = test::randomPattern(500, 1234);
    const auto det = shifted(ref, 3, 520);
    const auto r = analysis::correlate(ref, det, 20, 1000.0);
    QCOMPARE(r.peakOffset, 3);
    QVERIFY(!r.syncSuccess);
  }

  void rejects_invalid_offsets_data() {
    QTest::addColumn<int>("maxOffset");
    QTest::addColumn<double>("sigma");
    QTest::newRow("zero") << 0 << 2.5;
    QTest::newRow("negative") << -3 << 2.5;
    QTest::newRow("reference bound") << 50 << 2.5;
    QTest::newRow("beyond") << 500 << 2.5;
    QTest::newRow("negative sigma") << 5 << -1.0;
  }

  void rejects_invalid_offsets() {
    QFETCH(int, maxOffset);
    QFETCH(double, sigma);
    const auto ref = test::randomPattern(50, 2);
    const auto det = shifted(ref, 0, 60);
    const auto f = test::failureOf(
        [&] { analysis::correlate(ref, det, maxOffset, sigma); });
    QVERIFY(f && f->kind == core::ErrorKind::InvalidParameter);
    QCOMPARE(QString::fromStdString(f->component),
             QString("CorrelationEngine"));
  }
};

QTEST_APPLESS_MAIN(CorrelationTest)
#include "correlation_tests.moc"
