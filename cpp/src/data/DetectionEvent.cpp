#include "qkdsync/data/DetectionEvent.h"

namespace qkdsync::data {

const char *toString(EventOrigin origin) {
  switch (origin) {
  case EventOrigin::Signal:
    return "signal";
  case EventOrigin::Decoy:
    return "decoy";
  case EventOrigin::Dark:
    return "dark";
  }
  return "unknown";
}

} // namespace qkdsync::data
