#include "qkdsync/core/Error.h"
#include <utility>

namespace qkdsync::core {

const char *toString(ErrorKind kind) {
  switch (kind) {
  case ErrorKind::InvalidParameter:
    return "InvalidParameter";
  case ErrorKind::EmptyInput:
    return "EmptyInput";
  case ErrorKind::DegenerateStatistics:
    return "DegenerateStatistics";
  }
  return "Unknown";
}

SimulationError::SimulationError(ErrorKind kind, std::string component,
                                 const std::string &message)
    : std::runtime_error(component + ": " + message), kind_(kind),
      component_(std::move(component)) {}

void require(bool cond, const char *component, const std::string &message) {
  if (!cond)
    throw SimulationError(ErrorKind::InvalidParameter, component, message);
}

} // namespace qkdsync::core
