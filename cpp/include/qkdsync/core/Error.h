#pragma once

#include <stdexcept>
#include <string>

namespace qkdsync::core {

enum class ErrorKind {
  InvalidParameter, ///< Out-of-range or malformed numeric input.
  EmptyInput,       ///< Nothing to correlate.
  DegenerateStatistics ///< Zero counts; reported on the result, never thrown.
};

const char *toString(ErrorKind kind);

/**
 * @brief Failure raised at the entry of a pipeline stage.
 *
 * what() reads "<component>: <message>" so front ends can print it as is.
 */
class SimulationError : public std::runtime_error {
public:
  SimulationError(ErrorKind kind, std::string component,
                  const std::string &message);

  ErrorKind kind() const noexcept { return kind_; }
  const std::string &component() const noexcept { return component_; }

private:
  ErrorKind kind_;
  std::string component_;
};

/// Throws InvalidParameter for component unless cond holds.
void require(bool cond, const char *component, const std::string &message);

} // namespace qkdsync::core
