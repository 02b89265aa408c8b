#pragma once
#include <cstddef>
#include <string>
#include <vector>

#include "specstack/model/Parameter.hh"

namespace specstack {

/**
 * Differential photon flux dN/dE [cm-2 s-1 TeV-1] as a function of true
 * energy [TeV], with a mutable parameter list read by the fitting engine.
 */
class SpectralModel {
public:
  virtual ~SpectralModel() = default;

  virtual double Evaluate(double E_TeV) const = 0;

  /// Integral of Evaluate over [emin, emax]. Default: trapezoid rule in
  /// log(E) with a fixed number of sub-steps.
  virtual double Integral(double emin_TeV, double emax_TeV) const;

  virtual std::string type() const = 0;

  std::vector<Parameter>& parameters() noexcept { return pars_; }
  const std::vector<Parameter>& parameters() const noexcept { return pars_; }

  Parameter& parameter(const std::string& name);
  const Parameter& parameter(const std::string& name) const;

  std::size_t NParameters() const noexcept { return pars_.size(); }
  std::size_t NFreeParameters() const noexcept;

  /// Current parameter values in declaration order.
  std::vector<double> ParameterValues() const;

protected:
  std::vector<Parameter> pars_;
  int n_integration_steps_ = 64;
};

// dN/dE = amplitude * (E / reference)^(-index)
class PowerLawSpectralModel : public SpectralModel {
public:
  PowerLawSpectralModel(double index = 2.0,
                        double amplitude_cm2_s_TeV = 1e-12,
                        double reference_TeV = 1.0);

  double Evaluate(double E_TeV) const override;
  double Integral(double emin_TeV, double emax_TeV) const override;
  std::string type() const override { return "powerlaw"; }
};

} // namespace specstack
