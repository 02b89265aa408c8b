#pragma once
#include <cstddef>
#include <memory>
#include <vector>

#include "specstack/axis/EnergyAxis.hh"

class TH2D;

namespace specstack {

class BinnedSpectrum;
class SpectrumMask;

/**
 * Energy dispersion matrix P(reco bin k | true bin l), stored in a TH2D
 * with x = true energy and y = reconstructed energy.
 *
 * Entries are non-negative and each true-energy row sums to <= 1
 * (photons may migrate outside the reco axis).
 */
class EDispKernel {
public:
  EDispKernel(const EnergyAxis& e_true, const EnergyAxis& e_reco);
  ~EDispKernel();

  EDispKernel(const EDispKernel& other);
  EDispKernel& operator=(const EDispKernel& other);
  EDispKernel(EDispKernel&& other) noexcept;
  EDispKernel& operator=(EDispKernel&& other) noexcept;

  /// Each true bin maps into the reco bin containing its centre.
  static EDispKernel FromDiagonalResponse(const EnergyAxis& e_true, const EnergyAxis& e_reco);

  /// Log-normal migration: ln(E_reco / E_true) ~ N(bias, sigma).
  static EDispKernel FromGauss(const EnergyAxis& e_true, const EnergyAxis& e_reco,
                               double sigma, double bias = 0.0);

  /// Adopts the contents of a TH2D (x = true, y = reco).
  static EDispKernel FromTH2D(const TH2D& h);

  const EnergyAxis& e_true() const noexcept { return e_true_; }
  const EnergyAxis& e_reco() const noexcept { return e_reco_; }

  double operator()(std::size_t itrue, std::size_t ireco) const;
  void set(std::size_t itrue, std::size_t ireco, double p);

  const TH2D& hist() const { return *h_; }

  /// Sum over reco bins for one true-energy row.
  double RowSum(std::size_t itrue) const;

  /// Project true-energy counts onto the reco axis.
  BinnedSpectrum Apply(const BinnedSpectrum& npred_true) const;

  /// Sum reco columns into the bins of new_reco, dropping masked-out columns.
  EDispKernel ResampleRecoAxis(const EnergyAxis& new_reco, const SpectrumMask& weights) const;

  EDispKernel SliceRecoByIdx(std::size_t start, std::size_t stop) const;

private:
  EnergyAxis            e_true_;
  EnergyAxis            e_reco_;
  std::unique_ptr<TH2D> h_;
};

} // namespace specstack
