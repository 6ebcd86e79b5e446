#pragma once

#include <cstdint>
#include <random>

namespace qkdsync::sim {

// Every stochastic stage draws from a generator owned by the run. Never share
// one instance between concurrently executing runs.
using Rng = std::mt19937_64;

inline Rng makeRng(std::uint64_t seed) { return Rng{seed}; }

} // namespace qkdsync::sim
