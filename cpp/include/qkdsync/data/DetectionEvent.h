#pragma once

#include <vector>

namespace qkdsync::data {

enum class EventOrigin { Signal, Decoy, Dark };

const char *toString(EventOrigin origin);

/**
 * @brief A single click on the receiver's detector.
 *
 * timestampBin is the detector time bin in which the click was recorded.
 * Dark events carry no relation to any transmitted pulse.
 */
struct DetectionEvent {
  long long timestampBin{0};
  EventOrigin origin{EventOrigin::Dark};
};

/// Time-ordered (non-decreasing timestampBin) once produced by
/// sim::recordDetections.
using DetectionRecord = std::vector<DetectionEvent>;

} // namespace qkdsync::data
