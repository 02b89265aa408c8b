#pragma once
#include <memory>
#include <stdexcept>
#include <string>
#include <utility>

#include "specstack/model/SpectralModel.hh"
#include "specstack/model/TemporalModel.hh"

namespace specstack {

// One photon source: spectral shape plus an optional time profile.
class SourceModel {
public:
  SourceModel(std::string name, std::shared_ptr<SpectralModel> spectral,
              std::shared_ptr<TemporalModel> temporal = nullptr)
  : name_(std::move(name)), spectral_(std::move(spectral)), temporal_(std::move(temporal))
  {
    if (!spectral_) throw std::invalid_argument("SourceModel: spectral model is required");
  }

  const std::string& name() const noexcept { return name_; }
  SpectralModel& spectral() { return *spectral_; }
  const SpectralModel& spectral() const { return *spectral_; }
  const TemporalModel* temporal() const noexcept { return temporal_.get(); }

private:
  std::string                    name_;
  std::shared_ptr<SpectralModel> spectral_;
  std::shared_ptr<TemporalModel> temporal_;
};

} // namespace specstack
