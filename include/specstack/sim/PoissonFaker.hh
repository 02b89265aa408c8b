#pragma once
#include <cstdint>
#include <random>

#include "specstack/spectrum/BinnedSpectrum.hh"

namespace specstack {

/// One Poisson draw per bin with the bin content as mean.
/// Bins with a non-positive or non-finite mean get 0.
BinnedSpectrum PoissonSample(const BinnedSpectrum& mean, std::mt19937_64& rng);

// Seeded generator shared by the simulation steps of one run.
class PoissonFaker {
public:
  explicit PoissonFaker(std::uint64_t seed) : rng_(seed) {}

  std::mt19937_64& rng() { return rng_; }

private:
  std::mt19937_64 rng_;
};

} // namespace specstack
