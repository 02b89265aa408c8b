#pragma once
#include <cstddef>
#include <string>
#include <vector>

#include "specstack/model/Parameter.hh"
#include "specstack/spectrum/BinnedSpectrum.hh"

namespace specstack {

class SpectrumMask;

// Predicted background counts in reco energy for a Cash dataset:
//   B[k] = template[k] * norm * (E_k / reference)^(-tilt)
// with E_k the log centre of bin k. Owned by value by its dataset.
class BackgroundModel {
public:
  explicit BackgroundModel(BinnedSpectrum templ,
                           double norm = 1.0, double tilt = 0.0,
                           double reference_TeV = 1.0);

  BinnedSpectrum Evaluate() const;

  const BinnedSpectrum& spectrum_template() const noexcept { return template_; }
  const EnergyAxis& axis() const noexcept { return template_.axis(); }

  double norm() const noexcept { return pars_[0].value; }
  double tilt() const noexcept { return pars_[1].value; }
  double reference() const noexcept { return pars_[2].value; }
  void set_norm(double v) { pars_[0].value = v; }
  void set_tilt(double v) { pars_[1].value = v; }

  const std::vector<Parameter>& parameters() const noexcept { return pars_; }
  std::size_t NParameters() const noexcept { return pars_.size(); }
  std::size_t NFreeParameters() const noexcept;

  /**
   * Fold another background into this one. The template becomes the sum of
   * both evaluated backgrounds (the other weighted by other_weights, usually
   * its safe mask) and norm / tilt are reset to 1 / 0.
   */
  void Stack(const BackgroundModel& other, const SpectrumMask& other_weights);

  /// Restrict the current template to the bins set in mask (others -> 0).
  void ApplyMask(const SpectrumMask& mask);

  BackgroundModel ResampleAxis(const EnergyAxis& new_axis, const SpectrumMask& weights) const;
  BackgroundModel SliceByIdx(std::size_t start, std::size_t stop) const;

private:
  BinnedSpectrum         template_;
  std::vector<Parameter> pars_;   // norm, tilt, reference
};

} // namespace specstack
