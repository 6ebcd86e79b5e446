#pragma once

#include "qkdsync/core/Error.h"
#include "qkdsync/data/Histogram.h"
#include <cstdint>
#include <optional>
#include <random>
#include <string>

namespace qkdsync::test {

struct Failure {
  core::ErrorKind kind;
  std::string component;
};

/// Runs fn and reports the SimulationError it raised, if any.
template <typename Fn>
std::optional<Failure> failureOf(Fn &&fn) {
  try {
    fn();
  } catch (const core::SimulationError &e) {
    return Failure{e.kind(), e.component()};
  }
  return std::nullopt;
}

template <typename Fn>
bool failsWith(core::ErrorKind kind, Fn &&fn) {
  const auto f = failureOf(std::forward<Fn>(fn));
  return f && f->kind == kind;
}

/// Pseudo-random 0/1 pattern that is identical on every standard library
/// (engine output is specified, distributions are not).
inline data::Histogram randomPattern(std::size_t length, std::uint32_t seed) {
  std::mt19937 gen(seed);
  data::Histogram h;
  h.binWidth = 1e-10;
  h.counts.reserve(length);
  for (std::size_t i = 0; i < length; ++i)
    h.counts.push_back((gen() >> 7) & 1u);
  return h;
}

} // namespace qkdsync::test
