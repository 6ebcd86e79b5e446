#pragma once

#include <cstddef>
#include <cstdint>
#include <vector>

namespace qkdsync::data {

/**
 * @brief Fixed-length count series over detector time bins.
 *
 * counts[b] belongs to the interval [b * binWidth, (b + 1) * binWidth)
 * measured from the opening of the detection window. Bin 0 of the reference
 * histogram is pulse 0; bin 0 of the detected histogram is the first
 * detector bin, so a pulse sent at index i with clock offset k lands in
 * detected bin i + k.
 */
struct Histogram {
  std::vector<std::uint32_t> counts;
  double binWidth{1.0}; ///< Seconds per bin.

  std::size_t size() const { return counts.size(); }
  bool empty() const { return counts.empty(); }
  double timeOf(std::size_t bin) const {
    return static_cast<double>(bin) * binWidth;
  }
  std::uint64_t total() const {
    std::uint64_t sum = 0;
    for (auto c : counts)
      sum += c;
    return sum;
  }
};

} // namespace qkdsync::data
