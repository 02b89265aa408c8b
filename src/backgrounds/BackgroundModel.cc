#include "specstack/backgrounds/BackgroundModel.hh"
#include "specstack/spectrum/SpectrumMask.hh"

#include <algorithm>
#include <cmath>
#include <stdexcept>
#include <utility>

namespace specstack {

BackgroundModel::BackgroundModel(BinnedSpectrum templ, double norm, double tilt,
                                 double reference_TeV)
: template_(std::move(templ))
{
  if (!(reference_TeV > 0.0))
    throw std::invalid_argument("BackgroundModel: reference must be > 0");
  pars_ = {
    {"norm",      norm,          "",    false},
    {"tilt",      tilt,          "",    true},
    {"reference", reference_TeV, "TeV", true},
  };
}

BinnedSpectrum BackgroundModel::Evaluate() const {
  BinnedSpectrum out(template_);
  const EnergyAxis& ax = template_.axis();
  const double n = norm(), t = tilt(), ref = reference();
  for (std::size_t k = 0; k < ax.nbin(); ++k) {
    const double w = (t == 0.0) ? 1.0 : std::pow(ax.center(k) / ref, -t);
    out.set(k, template_[k] * n * w);
  }
  return out;
}

std::size_t BackgroundModel::NFreeParameters() const noexcept {
  return static_cast<std::size_t>(
      std::count_if(pars_.begin(), pars_.end(), [](const Parameter& p) { return !p.frozen; }));
}

void BackgroundModel::Stack(const BackgroundModel& other, const SpectrumMask& other_weights) {
  BinnedSpectrum merged = Evaluate();
  merged.Stack(other.Evaluate(), other_weights);
  template_ = std::move(merged);
  set_norm(1.0);
  set_tilt(0.0);
}

void BackgroundModel::ApplyMask(const SpectrumMask& mask) {
  template_ *= mask;
}

BackgroundModel BackgroundModel::ResampleAxis(const EnergyAxis& new_axis,
                                              const SpectrumMask& weights) const {
  // resampling acts on the evaluated counts; the result carries norm 1, tilt 0
  return BackgroundModel(Evaluate().ResampleAxis(new_axis, weights), 1.0, 0.0, reference());
}

BackgroundModel BackgroundModel::SliceByIdx(std::size_t start, std::size_t stop) const {
  return BackgroundModel(template_.SliceByIdx(start, stop), norm(), tilt(), reference());
}

} // namespace specstack
