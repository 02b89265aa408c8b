#include "specstack/response/SpectrumEvaluator.hh"
#include "specstack/gti/GoodTimeIntervals.hh"
#include "specstack/model/SourceModel.hh"
#include "specstack/response/ResponseKernel.hh"

#include <stdexcept>
#include <utility>

namespace specstack {

SpectrumEvaluator::SpectrumEvaluator(std::shared_ptr<SourceModel> model)
: model_(std::move(model))
{
  if (!model_) throw std::invalid_argument("SpectrumEvaluator: null model");
}

BinnedSpectrum SpectrumEvaluator::ComputeNpredTrue(const ResponseKernel& response,
                                                   const GoodTimeIntervals* gti) const {
  const BinnedSpectrum& exposure = response.exposure();
  const EnergyAxis& e_true = exposure.axis();
  const SpectralModel& spec = model_->spectral();

  BinnedSpectrum npred(e_true, "");
  for (std::size_t l = 0; l < e_true.nbin(); ++l) {
    const double aeff_t = exposure[l];
    if (aeff_t == 0.0) continue;
    npred.set(l, spec.Integral(e_true.lo(l), e_true.hi(l)) * aeff_t);
  }

  if (model_->temporal() && gti) npred *= model_->temporal()->Integral(*gti);
  return npred;
}

BinnedSpectrum SpectrumEvaluator::ComputeNpred(const ResponseKernel& response,
                                               const EnergyAxis& e_reco,
                                               const GoodTimeIntervals* gti) {
  const std::vector<double> pars = model_->spectral().ParameterValues();
  if (cached_npred_ && pars == cached_pars_ && cached_npred_->axis().IsCompatible(e_reco))
    return *cached_npred_;

  BinnedSpectrum npred = response.FoldToReco(ComputeNpredTrue(response, gti), e_reco);
  cached_pars_ = pars;
  cached_npred_ = npred;
  return npred;
}

} // namespace specstack
