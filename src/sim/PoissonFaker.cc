#include "specstack/sim/PoissonFaker.hh"

#include <cmath>

namespace specstack {

BinnedSpectrum PoissonSample(const BinnedSpectrum& mean, std::mt19937_64& rng) {
  BinnedSpectrum out(mean.axis(), mean.unit());
  for (std::size_t i = 0; i < mean.nbin(); ++i) {
    const double mu = mean[i];
    if (!(mu > 0.0) || !std::isfinite(mu)) continue;
    std::poisson_distribution<long long> pois(mu);
    out.set(i, static_cast<double>(pois(rng)));
  }
  return out;
}

} // namespace specstack
