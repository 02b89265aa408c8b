#pragma once
#include <string>
#include <vector>

namespace specstack {

/// Tabulated differential flux (E [TeV], dN/dE [cm-2 s-1 TeV-1]).
class FluxTable {
public:
  FluxTable() = default;

  /// Load a 2-column CSV with a single header row; comments (#) are ignored.
  /// Columns: E_TeV, dnde. Energies must be strictly increasing.
  /// Returns true on success.
  bool LoadCSV(const std::string& path);

  const std::vector<double>& E() const noexcept { return E_TeV_; }
  const std::vector<double>& dnde() const noexcept { return dnde_; }
  bool empty() const noexcept { return E_TeV_.empty(); }

  /// Log-log interpolation (linear where a bracketing value is not
  /// positive); 0 outside the tabulated range.
  double Interpolate(double E_TeV) const;

private:
  std::vector<double> E_TeV_;
  std::vector<double> dnde_;
};

} // namespace specstack
