#include "specstack/response/ResponseKernel.hh"
#include "specstack/spectrum/SpectrumMask.hh"

#include <stdexcept>
#include <utility>

namespace specstack {

ResponseKernel::ResponseKernel(BinnedSpectrum exposure,
                               std::optional<EDispKernel> edisp,
                               std::optional<double> livetime_s)
: exposure_(std::move(exposure)), livetime_s_(livetime_s)
{
  set_edisp(std::move(edisp));
}

void ResponseKernel::set_edisp(std::optional<EDispKernel> k) {
  if (k && !k->e_true().IsCompatible(exposure_.axis()))
    throw std::invalid_argument("ResponseKernel: exposure and edisp must share the true-energy axis");
  edisp_ = std::move(k);
}

EDispKernel ResponseKernel::KernelOrIdentity(const EnergyAxis& e_reco) const {
  if (edisp_) {
    if (!edisp_->e_reco().IsCompatible(e_reco))
      throw std::invalid_argument("ResponseKernel: edisp reco axis does not match the counts axis");
    return *edisp_;
  }
  if (!e_true().IsCompatible(e_reco))
    throw std::invalid_argument("ResponseKernel: no edisp and true/reco axes differ");
  return EDispKernel::FromDiagonalResponse(e_true(), e_reco);
}

BinnedSpectrum ResponseKernel::FoldToReco(const BinnedSpectrum& npred_true,
                                          const EnergyAxis& e_reco) const {
  if (edisp_) {
    if (!edisp_->e_reco().IsCompatible(e_reco))
      throw std::invalid_argument("ResponseKernel: edisp reco axis does not match the counts axis");
    return edisp_->Apply(npred_true);
  }
  if (!e_true().IsCompatible(e_reco))
    throw std::invalid_argument("ResponseKernel: no edisp and true/reco axes differ");
  return BinnedSpectrum(e_reco, npred_true.values(), npred_true.unit());
}

void ResponseKernel::CheckStackable(const ResponseKernel& other, const EnergyAxis& e_reco) const {
  if (!e_true().IsCompatible(other.e_true()))
    throw std::invalid_argument("ResponseKernel::Stack: true-energy axes differ");
  if (exposure_.unit() != other.exposure_.unit())
    throw std::invalid_argument("ResponseKernel::Stack: exposure units differ");
  if (!edisp_ && !other.edisp_) return;

  // a missing kernel is replaced by the identity, which needs matching axes
  for (const ResponseKernel* r : {this, &other}) {
    if (r->edisp_ ? !r->edisp_->e_reco().IsCompatible(e_reco)
                  : !r->e_true().IsCompatible(e_reco)) {
      throw std::invalid_argument(
          "ResponseKernel::Stack: a response without edisp needs identical true and reco axes");
    }
  }
}

void ResponseKernel::Stack(const ResponseKernel& other, const SpectrumMask& self_mask,
                           const SpectrumMask& other_mask) {
  if (!self_mask.axis().IsCompatible(other_mask.axis()))
    throw std::invalid_argument("ResponseKernel::Stack: reco axes differ");
  CheckStackable(other, self_mask.axis());

  if (edisp_ || other.edisp_) {
    const EnergyAxis& e_reco = self_mask.axis();
    const EDispKernel k1 = KernelOrIdentity(e_reco);
    const EDispKernel k2 = other.KernelOrIdentity(e_reco);

    EDispKernel stacked(e_true(), e_reco);
    for (std::size_t l = 0; l < e_true().nbin(); ++l) {
      const double w1 = exposure_[l];
      const double w2 = other.exposure_[l];
      const double norm = w1 + w2;
      if (norm <= 0.0) continue;
      for (std::size_t r = 0; r < e_reco.nbin(); ++r) {
        double num = 0.0;
        if (self_mask[r])  num += k1(l, r) * w1;
        if (other_mask[r]) num += k2(l, r) * w2;
        if (num != 0.0) stacked.set(l, r, num / norm);
      }
    }
    edisp_ = std::move(stacked);
  }

  exposure_ += other.exposure_;

  if (livetime_s_ || other.livetime_s_)
    livetime_s_ = livetime_s_.value_or(0.0) + other.livetime_s_.value_or(0.0);
}

ResponseKernel ResponseKernel::ResampleRecoAxis(const EnergyAxis& new_reco,
                                                const SpectrumMask& weights) const {
  EDispKernel k = KernelOrIdentity(weights.axis());
  return ResponseKernel(exposure_, k.ResampleRecoAxis(new_reco, weights), livetime_s_);
}

ResponseKernel ResponseKernel::SliceRecoByIdx(std::size_t start, std::size_t stop) const {
  if (!edisp_) {
    // identity projection: the true axis is the reco axis and is sliced along
    return ResponseKernel(exposure_.SliceByIdx(start, stop), std::nullopt, livetime_s_);
  }
  return ResponseKernel(exposure_, edisp_->SliceRecoByIdx(start, stop), livetime_s_);
}

} // namespace specstack
