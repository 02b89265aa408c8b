#pragma once
#include <memory>
#include <optional>
#include <vector>

#include "specstack/spectrum/BinnedSpectrum.hh"

namespace specstack {

class GoodTimeIntervals;
class ResponseKernel;
class SourceModel;

/**
 * Forward-folds one source model through a response:
 *
 *   npred_true[l] = int_{bin l} dN/dE dE * exposure[l]  (* temporal weight)
 *   npred[k]      = sum_l npred_true[l] * edisp[l,k]
 *
 * The last result is cached together with the parameter values it was
 * computed with and reused while they are unchanged. The owner must call
 * Reset() whenever the response or the time intervals change.
 */
class SpectrumEvaluator {
public:
  explicit SpectrumEvaluator(std::shared_ptr<SourceModel> model);

  BinnedSpectrum ComputeNpred(const ResponseKernel& response,
                              const EnergyAxis& e_reco,
                              const GoodTimeIntervals* gti = nullptr);

  /// Predicted counts per true-energy bin, before dispersion.
  BinnedSpectrum ComputeNpredTrue(const ResponseKernel& response,
                                  const GoodTimeIntervals* gti = nullptr) const;

  void Reset() { cached_npred_.reset(); cached_pars_.clear(); }
  bool HasCache() const noexcept { return cached_npred_.has_value(); }

  const SourceModel& model() const { return *model_; }

private:
  std::shared_ptr<SourceModel>  model_;
  std::vector<double>           cached_pars_;
  std::optional<BinnedSpectrum> cached_npred_;
};

} // namespace specstack
