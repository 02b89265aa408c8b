#pragma once
#include <cstddef>
#include <memory>
#include <string>
#include <vector>

#include "specstack/axis/EnergyAxis.hh"

class TH1D;

namespace specstack {

class SpectrumMask;

/**
 * 1-D array of values indexed by an EnergyAxis (counts, exposure,
 * acceptance, ...), backed by a ROOT TH1D.
 *
 * Indices are 0-based; the histogram's under/overflow bins are unused.
 * All bin-by-bin operations require compatible axes and throw
 * std::invalid_argument otherwise. Addition and subtraction also require
 * equal units.
 */
class BinnedSpectrum {
public:
  explicit BinnedSpectrum(const EnergyAxis& axis, std::string unit = "", double fill = 0.0);
  BinnedSpectrum(const EnergyAxis& axis, const std::vector<double>& values, std::string unit = "");
  ~BinnedSpectrum();

  BinnedSpectrum(const BinnedSpectrum& other);
  BinnedSpectrum& operator=(const BinnedSpectrum& other);
  BinnedSpectrum(BinnedSpectrum&& other) noexcept;
  BinnedSpectrum& operator=(BinnedSpectrum&& other) noexcept;

  /// Wraps a copy of an existing histogram; its bin edges become the axis.
  static BinnedSpectrum FromTH1D(const TH1D& h, std::string unit = "",
                                 const std::string& axis_name = "energy");

  const EnergyAxis& axis() const noexcept { return axis_; }
  const std::string& unit() const noexcept { return unit_; }
  void set_unit(std::string u) { unit_ = std::move(u); }
  std::size_t nbin() const noexcept { return axis_.nbin(); }

  double operator[](std::size_t i) const;
  double at(std::size_t i) const;
  void set(std::size_t i, double v);
  std::vector<double> values() const;

  const TH1D& hist() const { return *h_; }
  TH1D& hist() { return *h_; }

  bool IsCompatible(const BinnedSpectrum& other) const noexcept { return axis_.IsCompatible(other.axis_); }

  double Sum() const;
  double Sum(const SpectrumMask& mask) const;

  BinnedSpectrum& operator+=(const BinnedSpectrum& other);
  BinnedSpectrum& operator-=(const BinnedSpectrum& other);
  BinnedSpectrum& operator*=(const BinnedSpectrum& other);
  BinnedSpectrum& operator/=(const BinnedSpectrum& other);   // x/0 follows IEEE rules
  BinnedSpectrum& operator*=(double c);
  BinnedSpectrum& operator/=(double c);
  BinnedSpectrum& operator*=(const SpectrumMask& mask);      // zero outside the mask

  /// this += other * weights (weights = 1 everywhere if omitted)
  void Stack(const BinnedSpectrum& other);
  void Stack(const BinnedSpectrum& other, const SpectrumMask& weights);

  /// Sum the bins of this spectrum into the (coarser) bins of new_axis.
  BinnedSpectrum ResampleAxis(const EnergyAxis& new_axis) const;
  BinnedSpectrum ResampleAxis(const EnergyAxis& new_axis, const SpectrumMask& weights) const;

  BinnedSpectrum SliceByIdx(std::size_t start, std::size_t stop) const;

  /// Replace NaN and +-Inf with 0.
  void NanToNum();

private:
  void check_axis_(const EnergyAxis& other, const char* where) const;

  EnergyAxis            axis_;
  std::string           unit_;
  std::unique_ptr<TH1D> h_;
};

BinnedSpectrum operator+(BinnedSpectrum a, const BinnedSpectrum& b);
BinnedSpectrum operator-(BinnedSpectrum a, const BinnedSpectrum& b);
BinnedSpectrum operator*(BinnedSpectrum a, const BinnedSpectrum& b);
BinnedSpectrum operator/(BinnedSpectrum a, const BinnedSpectrum& b);
BinnedSpectrum operator*(BinnedSpectrum a, double c);
BinnedSpectrum operator*(double c, BinnedSpectrum a);
BinnedSpectrum operator/(BinnedSpectrum a, double c);
BinnedSpectrum operator*(BinnedSpectrum a, const SpectrumMask& mask);

} // namespace specstack
