#pragma once
#include <cstddef>
#include <string>
#include <vector>

namespace specstack {

/**
 * Immutable sequence of contiguous energy bin edges (TeV).
 *
 * N+1 strictly increasing edges define N bins. Two axes are compatible
 * when their edges match exactly; the name ("energy" for reconstructed,
 * "energy_true" for true energy) is informative only.
 */
class EnergyAxis {
public:
  EnergyAxis(std::vector<double> edges_TeV, std::string name = "energy");

  /// Log-spaced axis with nbin bins between emin and emax.
  static EnergyAxis FromEnergyBounds(double emin_TeV, double emax_TeV, int nbin,
                                     const std::string& name = "energy");

  std::size_t nbin() const noexcept { return edges_.size() - 1; }
  const std::vector<double>& edges() const noexcept { return edges_; }
  const std::string& name() const noexcept { return name_; }
  const std::string& unit() const noexcept { return unit_; }

  double lo(std::size_t i) const { return edges_.at(i); }
  double hi(std::size_t i) const { return edges_.at(i + 1); }
  double center(std::size_t i) const;   // geometric centre
  double width(std::size_t i) const { return hi(i) - lo(i); }
  double emin() const noexcept { return edges_.front(); }
  double emax() const noexcept { return edges_.back(); }

  /// Bin index containing e, or -1 outside [emin, emax).
  int FindBin(double e_TeV) const;

  bool IsCompatible(const EnergyAxis& other) const noexcept { return edges_ == other.edges_; }

  /// Single bin spanning the full axis.
  EnergyAxis Squash() const;

  /// Bins [start, stop).
  EnergyAxis Slice(std::size_t start, std::size_t stop) const;

  EnergyAxis Copy(const std::string& name) const;

  /// For every bin of this axis the index of the coarse bin containing it.
  /// Each coarse bin must be a union of consecutive bins of this axis.
  std::vector<std::size_t> GroupIndices(const EnergyAxis& coarse) const;

private:
  std::vector<double> edges_;
  std::string name_;
  std::string unit_ = "TeV";
};

inline bool operator==(const EnergyAxis& a, const EnergyAxis& b) { return a.IsCompatible(b); }
inline bool operator!=(const EnergyAxis& a, const EnergyAxis& b) { return !a.IsCompatible(b); }

} // namespace specstack
