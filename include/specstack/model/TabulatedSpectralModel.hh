#pragma once
#include <memory>
#include <string>

#include "specstack/model/SpectralModel.hh"

namespace specstack {

class FluxTable;

// Tabulated dN/dE scaled by a free "norm" parameter.
class TabulatedSpectralModel : public SpectralModel {
public:
  TabulatedSpectralModel();
  ~TabulatedSpectralModel() override;

  /// Throws std::runtime_error if the table cannot be read.
  explicit TabulatedSpectralModel(const std::string& csv_path);

  double Evaluate(double E_TeV) const override;
  std::string type() const override { return "table"; }

  const std::string& path() const noexcept { return path_; }

private:
  std::string                path_;
  std::unique_ptr<FluxTable> table_;
};

} // namespace specstack
