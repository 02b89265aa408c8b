#include "specstack/model/TabulatedSpectralModel.hh"
#include "specstack/io/FluxTable.hh"

#include <stdexcept>

namespace specstack {

TabulatedSpectralModel::TabulatedSpectralModel()
: table_(std::make_unique<FluxTable>())
{
  pars_ = {{"norm", 1.0, "", false}};
}

TabulatedSpectralModel::~TabulatedSpectralModel() = default;

TabulatedSpectralModel::TabulatedSpectralModel(const std::string& csv_path)
: TabulatedSpectralModel()
{
  path_ = csv_path;
  if (!table_->LoadCSV(csv_path))
    throw std::runtime_error("TabulatedSpectralModel: cannot read flux table " + csv_path);
}

double TabulatedSpectralModel::Evaluate(double E_TeV) const {
  return pars_[0].value * table_->Interpolate(E_TeV);
}

} // namespace specstack
