#include "specstack/spectrum/SpectrumMask.hh"
#include "specstack/spectrum/BinnedSpectrum.hh"

#include <algorithm>
#include <stdexcept>
#include <utility>

namespace specstack {

SpectrumMask::SpectrumMask(EnergyAxis axis, std::vector<bool> data)
: axis_(std::move(axis)), data_(std::move(data))
{
  if (data_.size() != axis_.nbin())
    throw std::invalid_argument("SpectrumMask: data size does not match axis");
}

SpectrumMask SpectrumMask::FromSpectrum(const BinnedSpectrum& s) {
  std::vector<bool> d(s.nbin());
  for (std::size_t i = 0; i < s.nbin(); ++i) {
    const double v = s[i];
    if (v != 0.0 && v != 1.0)
      throw std::invalid_argument("SpectrumMask: mask data must have dtype bool");
    d[i] = (v == 1.0);
  }
  return SpectrumMask(s.axis(), std::move(d));
}

bool SpectrumMask::Any() const {
  return std::any_of(data_.begin(), data_.end(), [](bool b) { return b; });
}

std::size_t SpectrumMask::Count() const {
  return static_cast<std::size_t>(std::count(data_.begin(), data_.end(), true));
}

void SpectrumMask::check_axis_(const SpectrumMask& other) const {
  if (!axis_.IsCompatible(other.axis_))
    throw std::invalid_argument("SpectrumMask: incompatible energy axes");
}

SpectrumMask SpectrumMask::And(const SpectrumMask& other) const {
  check_axis_(other);
  std::vector<bool> d(nbin());
  for (std::size_t i = 0; i < nbin(); ++i) d[i] = data_[i] && other.data_[i];
  return SpectrumMask(axis_, std::move(d));
}

SpectrumMask SpectrumMask::Or(const SpectrumMask& other) const {
  check_axis_(other);
  std::vector<bool> d(nbin());
  for (std::size_t i = 0; i < nbin(); ++i) d[i] = data_[i] || other.data_[i];
  return SpectrumMask(axis_, std::move(d));
}

SpectrumMask SpectrumMask::Not() const {
  std::vector<bool> d(nbin());
  for (std::size_t i = 0; i < nbin(); ++i) d[i] = !data_[i];
  return SpectrumMask(axis_, std::move(d));
}

SpectrumMask SpectrumMask::ResampleAxis(const EnergyAxis& new_axis) const {
  const auto groups = axis_.GroupIndices(new_axis);
  std::vector<bool> d(new_axis.nbin(), false);
  for (std::size_t i = 0; i < nbin(); ++i) {
    if (data_[i]) d[groups[i]] = true;
  }
  return SpectrumMask(new_axis, std::move(d));
}

SpectrumMask SpectrumMask::SliceByIdx(std::size_t start, std::size_t stop) const {
  EnergyAxis ax = axis_.Slice(start, stop);
  std::vector<bool> d(data_.begin() + start, data_.begin() + stop);
  return SpectrumMask(std::move(ax), std::move(d));
}

BinnedSpectrum SpectrumMask::AsWeights() const {
  BinnedSpectrum w(axis_, "");
  for (std::size_t i = 0; i < nbin(); ++i) w.set(i, data_[i] ? 1.0 : 0.0);
  return w;
}

} // namespace specstack
