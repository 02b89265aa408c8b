#include "specstack/model/SpectralModel.hh"

#include <algorithm>
#include <cmath>
#include <stdexcept>

namespace specstack {

double SpectralModel::Integral(double emin_TeV, double emax_TeV) const {
  if (!(emin_TeV > 0.0) || !(emax_TeV > emin_TeV)) return 0.0;

  // trapezoid in u = ln E:  int f dE = int f(E) E du
  const int n = std::max(1, n_integration_steps_);
  const double u0 = std::log(emin_TeV);
  const double du = (std::log(emax_TeV) - u0) / n;
  double acc = 0.0;
  for (int i = 0; i <= n; ++i) {
    const double E = std::exp(u0 + i * du);
    const double w = (i == 0 || i == n) ? 0.5 : 1.0;
    acc += w * Evaluate(E) * E;
  }
  return acc * du;
}

Parameter& SpectralModel::parameter(const std::string& name) {
  for (auto& p : pars_) if (p.name == name) return p;
  throw std::invalid_argument("SpectralModel: no parameter named '" + name + "'");
}

const Parameter& SpectralModel::parameter(const std::string& name) const {
  for (const auto& p : pars_) if (p.name == name) return p;
  throw std::invalid_argument("SpectralModel: no parameter named '" + name + "'");
}

std::size_t SpectralModel::NFreeParameters() const noexcept {
  return static_cast<std::size_t>(
      std::count_if(pars_.begin(), pars_.end(), [](const Parameter& p) { return !p.frozen; }));
}

std::vector<double> SpectralModel::ParameterValues() const {
  std::vector<double> v;
  v.reserve(pars_.size());
  for (const auto& p : pars_) v.push_back(p.value);
  return v;
}

PowerLawSpectralModel::PowerLawSpectralModel(double index, double amplitude, double reference) {
  if (!(reference > 0.0)) throw std::invalid_argument("PowerLawSpectralModel: reference must be > 0");
  pars_ = {
    {"index",     index,     "",              false},
    {"amplitude", amplitude, "cm-2 s-1 TeV-1", false},
    {"reference", reference, "TeV",           true},
  };
}

double PowerLawSpectralModel::Evaluate(double E_TeV) const {
  const double index = pars_[0].value;
  const double amp   = pars_[1].value;
  const double ref   = pars_[2].value;
  return amp * std::pow(E_TeV / ref, -index);
}

double PowerLawSpectralModel::Integral(double emin_TeV, double emax_TeV) const {
  if (!(emin_TeV > 0.0) || !(emax_TeV > emin_TeV)) return 0.0;
  const double index = pars_[0].value;
  const double amp   = pars_[1].value;
  const double ref   = pars_[2].value;

  if (std::fabs(index - 1.0) < 1e-10)
    return amp * ref * std::log(emax_TeV / emin_TeV);

  const double g = 1.0 - index;
  return amp * ref / g * (std::pow(emax_TeV / ref, g) - std::pow(emin_TeV / ref, g));
}

} // namespace specstack
