#include "specstack/model/TemporalModel.hh"
#include "specstack/gti/GoodTimeIntervals.hh"

#include <cmath>
#include <stdexcept>

namespace specstack {

double ConstantTemporalModel::Integral(const GoodTimeIntervals& gti) const {
  return gti.TimeSum() > 0.0 ? 1.0 : 0.0;
}

ExpDecayTemporalModel::ExpDecayTemporalModel(double t0_s, double t_ref_s)
: t0_s_(t0_s), t_ref_s_(t_ref_s)
{
  if (!(t0_s_ > 0.0)) throw std::invalid_argument("ExpDecayTemporalModel: t0 must be > 0");
}

double ExpDecayTemporalModel::Integral(const GoodTimeIntervals& gti) const {
  const double total = gti.TimeSum();
  if (total <= 0.0) return 0.0;

  double acc = 0.0;
  for (const auto& iv : gti.intervals()) {
    acc += t0_s_ * (std::exp(-(iv.start_s - t_ref_s_) / t0_s_) -
                    std::exp(-(iv.stop_s  - t_ref_s_) / t0_s_));
  }
  return acc / total;
}

} // namespace specstack
