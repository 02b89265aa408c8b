#pragma once
#include <cstddef>
#include <optional>

#include "specstack/response/EDispKernel.hh"
#include "specstack/spectrum/BinnedSpectrum.hh"

namespace specstack {

class SpectrumMask;

/**
 * Instrument response of one dataset: exposure (effective area x time,
 * cm2 s) on the true-energy axis, an optional livetime and an optional
 * energy dispersion kernel sharing the true-energy axis.
 *
 * Without a kernel the true and reconstructed axes must coincide and the
 * projection is the identity.
 */
class ResponseKernel {
public:
  explicit ResponseKernel(BinnedSpectrum exposure,
                          std::optional<EDispKernel> edisp = std::nullopt,
                          std::optional<double> livetime_s = std::nullopt);

  const BinnedSpectrum& exposure() const noexcept { return exposure_; }
  const std::optional<EDispKernel>& edisp() const noexcept { return edisp_; }
  const std::optional<double>& livetime() const noexcept { return livetime_s_; }
  const EnergyAxis& e_true() const noexcept { return exposure_.axis(); }

  void set_edisp(std::optional<EDispKernel> k);

  /// The kernel, or the identity when none is set and the axes allow it.
  EDispKernel KernelOrIdentity(const EnergyAxis& e_reco) const;

  /// Project true-energy predicted counts onto e_reco.
  BinnedSpectrum FoldToReco(const BinnedSpectrum& npred_true, const EnergyAxis& e_reco) const;

  /// Throws std::invalid_argument if Stack(other, ...) on e_reco would fail.
  void CheckStackable(const ResponseKernel& other, const EnergyAxis& e_reco) const;

  /**
   * Merge another response into this one.
   *
   *   exposure  = exp_1 + exp_2
   *   livetime  = t_1 + t_2
   *   edisp[l,k] = sum_j edisp_j[l,k] * exp_j[l] * mask_j[k] / sum_j exp_j[l]
   *
   * Rows with zero total exposure are left at zero. Nothing is modified
   * when the responses cannot be stacked.
   */
  void Stack(const ResponseKernel& other, const SpectrumMask& self_mask,
             const SpectrumMask& other_mask);

  ResponseKernel ResampleRecoAxis(const EnergyAxis& new_reco, const SpectrumMask& weights) const;
  ResponseKernel SliceRecoByIdx(std::size_t start, std::size_t stop) const;

private:
  BinnedSpectrum             exposure_;
  std::optional<EDispKernel> edisp_;
  std::optional<double>      livetime_s_;
};

} // namespace specstack
