#pragma once
#include <cstddef>
#include <vector>

#include "specstack/axis/EnergyAxis.hh"

namespace specstack {

class BinnedSpectrum;

// Boolean per-bin flag; true = bin included in the analysis.
class SpectrumMask {
public:
  SpectrumMask(EnergyAxis axis, std::vector<bool> data);

  static SpectrumMask Full(const EnergyAxis& axis)  { return SpectrumMask(axis, std::vector<bool>(axis.nbin(), true)); }
  static SpectrumMask Empty(const EnergyAxis& axis) { return SpectrumMask(axis, std::vector<bool>(axis.nbin(), false)); }

  /// Throws std::invalid_argument unless every bin holds exactly 0 or 1.
  static SpectrumMask FromSpectrum(const BinnedSpectrum& s);

  const EnergyAxis& axis() const noexcept { return axis_; }
  std::size_t nbin() const noexcept { return data_.size(); }
  bool operator[](std::size_t i) const { return data_[i]; }
  bool at(std::size_t i) const { return data_.at(i); }
  void set(std::size_t i, bool v) { data_.at(i) = v; }
  const std::vector<bool>& data() const noexcept { return data_; }

  bool Any() const;
  std::size_t Count() const;

  SpectrumMask And(const SpectrumMask& other) const;
  SpectrumMask Or(const SpectrumMask& other) const;
  SpectrumMask Not() const;

  /// Logical OR over the fine bins making up each bin of new_axis.
  SpectrumMask ResampleAxis(const EnergyAxis& new_axis) const;
  SpectrumMask SliceByIdx(std::size_t start, std::size_t stop) const;

  /// 0/1 weights as a dimensionless spectrum.
  BinnedSpectrum AsWeights() const;

private:
  void check_axis_(const SpectrumMask& other) const;

  EnergyAxis axis_;
  std::vector<bool> data_;
};

} // namespace specstack
