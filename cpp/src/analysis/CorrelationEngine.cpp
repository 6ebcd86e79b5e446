#include "qkdsync/analysis/CorrelationEngine.h"
#include "qkdsync/core/Error.h"
#include <QDebug>
#include <algorithm>
#include <cmath>
#include <cstdint>
#include <cstdlib>

namespace qkdsync::analysis {

namespace {
constexpr const char *kComponent = "CorrelationEngine";

bool preferOffset(int candidate, double value, int best, double bestValue) {
  if (value != bestValue)
    return value > bestValue;
  if (std::abs(candidate) != std::abs(best))
    return std::abs(candidate) < std::abs(best);
  return candidate < best;
}
} // namespace

double correlationAt(const data::Histogram &reference,
                     const data::Histogram &detected, int offset) {
  const long long refN = static_cast<long long>(reference.size());
  const long long detN = static_cast<long long>(detected.size());
  const long long begin = std::max(0LL, -static_cast<long long>(offset));
  const long long end = std::min(refN, detN - offset);

  std::uint64_t sum = 0;
  for (long long i = begin; i < end; ++i) {
    const auto r = static_cast<std::size_t>(i);
    sum += static_cast<std::uint64_t>(reference.counts[r]) *
           detected.counts[static_cast<std::size_t>(i + offset)];
  }
  return static_cast<double>(sum);
}

void checkSearchRange(int maxOffset, std::size_t histogramLength) {
  core::require(maxOffset > 0, kComponent, "max_offset must be positive");
  core::require(static_cast<std::size_t>(maxOffset) < histogramLength,
                kComponent, "max_offset exceeds the histogram bounds");
}

data::CorrelationResult correlate(const data::Histogram &reference,
                                  const data::Histogram &detected,
                                  int maxOffset, double thresholdSigma) {
  checkSearchRange(maxOffset, reference.size());
  checkSearchRange(maxOffset, detected.size());
  core::require(std::isfinite(thresholdSigma) && thresholdSigma >= 0.0,
                kComponent, "sync threshold must be a finite value >= 0");

  data::CorrelationResult result;
  const auto count = static_cast<std::size_t>(2 * maxOffset + 1);
  result.offsets.reserve(count);
  result.correlationValues.reserve(count);

  std::size_t peakIdx = 0;
  for (int k = -maxOffset; k <= maxOffset; ++k) {
    const double c = correlationAt(reference, detected, k);
    result.offsets.push_back(k);
    result.correlationValues.push_back(c);
    if (result.offsets.size() == 1 ||
        preferOffset(k, c, result.offsets[peakIdx],
                     result.correlationValues[peakIdx]))
      peakIdx = result.offsets.size() - 1;
  }
  result.peakOffset = result.offsets[peakIdx];
  result.peakValue = result.correlationValues[peakIdx];

  // Sidelobe floor over every offset except the peak.
  double sum = 0.0;
  double sumSq = 0.0;
  for (std::size_t i = 0; i < count; ++i) {
    if (i == peakIdx)
      continue;
    sum += result.correlationValues[i];
    sumSq += result.correlationValues[i] * result.correlationValues[i];
  }
  const double n = static_cast<double>(count - 1);
  result.floorMean = sum / n;
  result.floorStdDev =
      std::sqrt(std::max(0.0, sumSq / n - result.floorMean * result.floorMean));

  const double excess = result.peakValue - result.floorMean;
  if (result.floorStdDev > 0.0) {
    result.significance = excess / result.floorStdDev;
    result.syncSuccess = result.peakValue > 0.0 &&
                         excess > thresholdSigma * result.floorStdDev;
  } else {
    result.syncSuccess = result.peakValue > 0.0 && excess > 0.0;
  }

  qDebug("correlate: peak offset=%d value=%.1f floor=%.2f+-%.2f sig=%.2f "
         "sync=%s",
         result.peakOffset, result.peakValue, result.floorMean,
         result.floorStdDev, result.significance,
         result.syncSuccess ? "yes" : "no");
  return result;
}

} // namespace qkdsync::analysis
