#include "specstack/datasets/SpectrumDatasetOnOff.hh"
#include "specstack/sim/PoissonFaker.hh"
#include "specstack/stats/CountsStatistic.hh"
#include "specstack/stats/WStatStatistic.hh"

#include <iomanip>
#include <sstream>
#include <stdexcept>
#include <utility>

namespace specstack {

SpectrumDatasetOnOff::SpectrumDatasetOnOff(std::string name)
: SpectrumDataset(std::move(name))
{}

SpectrumDatasetOnOff SpectrumDatasetOnOff::Create(const EnergyAxis& e_reco,
                                                  const std::optional<EnergyAxis>& e_true,
                                                  const std::string& name,
                                                  const std::string& reference_time) {
  SpectrumDataset ds = SpectrumDataset::Create(e_reco, e_true, name, reference_time);
  ds.set_background_model(std::nullopt);
  return FromSpectrumDataset(ds, BinnedSpectrum(e_reco, "", 1.0), BinnedSpectrum(e_reco, "", 1.0),
                             BinnedSpectrum(e_reco));
}

SpectrumDatasetOnOff SpectrumDatasetOnOff::FromSpectrumDataset(const SpectrumDataset& dataset,
                                                               const BinnedSpectrum& acceptance,
                                                               const BinnedSpectrum& acceptance_off,
                                                               std::optional<BinnedSpectrum> counts_off) {
  if (!counts_off && dataset.background_model()) {
    BinnedSpectrum alpha = acceptance / acceptance_off;
    alpha.NanToNum();
    const BinnedSpectrum bkg = dataset.background_model()->Evaluate();
    BinnedSpectrum off(alpha.axis());
    for (std::size_t k = 0; k < alpha.nbin(); ++k) {
      if (alpha[k] > 0.0) off.set(k, bkg[k] / alpha[k]);
    }
    counts_off = std::move(off);
  }

  SpectrumDatasetOnOff out(dataset.name());
  out.counts_   = dataset.counts();
  out.response_ = dataset.response();
  if (dataset.HasMaskSafe()) out.mask_safe_ = dataset.mask_safe();
  out.mask_fit_   = dataset.mask_fit();
  out.gti_        = dataset.gti();
  out.meta_table_ = dataset.meta_table();
  out.models_     = dataset.models();

  out.set_counts_off(std::move(counts_off));
  out.set_acceptance(acceptance);
  out.set_acceptance_off(acceptance_off);
  return out;
}

SpectrumDatasetOnOff SpectrumDatasetOnOff::FromSpectrumDataset(const SpectrumDataset& dataset,
                                                               double acceptance, double acceptance_off,
                                                               std::optional<BinnedSpectrum> counts_off) {
  const EnergyAxis& ax = dataset.AnalysisAxis();
  return FromSpectrumDataset(dataset, BinnedSpectrum(ax, "", acceptance),
                             BinnedSpectrum(ax, "", acceptance_off), std::move(counts_off));
}

SpectrumDataset SpectrumDatasetOnOff::ToSpectrumDataset(const std::string& name) const {
  require_(counts_off_, "counts_off");

  SpectrumDataset out(name);
  out.set_counts(counts_);
  out.set_response(response_);
  out.set_mask_safe(mask_safe_);
  out.set_mask_fit(mask_fit_);
  out.set_gti(gti_);
  out.set_meta_table(meta_table_);
  out.models() = models_;
  out.set_background_model(BackgroundModel(CountsOffNormalised()));
  return out;
}

// ---- contents --------------------------------------------------------------

bool SpectrumDatasetOnOff::HasAnalysisAxis_() const noexcept {
  return counts_.has_value() || counts_off_.has_value() ||
         acceptance_.has_value() || acceptance_off_.has_value();
}

const EnergyAxis& SpectrumDatasetOnOff::AnalysisAxis() const {
  if (counts_)         return counts_->axis();
  if (counts_off_)     return counts_off_->axis();
  if (acceptance_)     return acceptance_->axis();
  if (acceptance_off_) return acceptance_off_->axis();
  throw std::runtime_error(
      "Either 'counts', 'counts_off', 'acceptance' or 'acceptance_off' must be defined.");
}

void SpectrumDatasetOnOff::require_(const std::optional<BinnedSpectrum>& s, const char* what) const {
  if (!s) throw std::runtime_error(tag() + " '" + name_ + "': no " + what + " defined");
}

void SpectrumDatasetOnOff::set_counts_off(std::optional<BinnedSpectrum> c) {
  if (c) check_reco_axis_(c->axis(), "counts_off");
  counts_off_ = std::move(c);
}

void SpectrumDatasetOnOff::set_acceptance(std::optional<BinnedSpectrum> a) {
  if (a) check_reco_axis_(a->axis(), "acceptance");
  acceptance_ = std::move(a);
}

void SpectrumDatasetOnOff::set_acceptance(double a) {
  acceptance_ = BinnedSpectrum(AnalysisAxis(), "", a);
}

void SpectrumDatasetOnOff::set_acceptance_off(std::optional<BinnedSpectrum> a) {
  if (a) check_reco_axis_(a->axis(), "acceptance_off");
  acceptance_off_ = std::move(a);
}

void SpectrumDatasetOnOff::set_acceptance_off(double a) {
  acceptance_off_ = BinnedSpectrum(AnalysisAxis(), "", a);
}

// ---- predictions -----------------------------------------------------------

BinnedSpectrum SpectrumDatasetOnOff::Alpha() const {
  require_(acceptance_, "acceptance");
  require_(acceptance_off_, "acceptance_off");
  BinnedSpectrum alpha = *acceptance_ / *acceptance_off_;
  alpha.NanToNum();
  return alpha;
}

BinnedSpectrum SpectrumDatasetOnOff::CountsOffNormalised() const {
  require_(counts_off_, "counts_off");
  return Alpha() * *counts_off_;
}

BinnedSpectrum SpectrumDatasetOnOff::Background() const {
  require_(counts_, "counts");
  require_(counts_off_, "counts_off");

  const BinnedSpectrum alpha = Alpha();
  const stats::WStatStatistic wstat;
  const std::vector<double> mu_bkg = wstat.MuBkgArray(counts_->values(), counts_off_->values(),
                                                      alpha.values(), NpredSig().values());
  BinnedSpectrum bkg(AnalysisAxis());
  for (std::size_t k = 0; k < bkg.nbin(); ++k) bkg.set(k, alpha[k] * mu_bkg[k]);
  return bkg;
}

BinnedSpectrum SpectrumDatasetOnOff::Npred() const {
  return NpredSig() + Background();
}

BinnedSpectrum SpectrumDatasetOnOff::Excess() const {
  require_(counts_, "counts");
  return *counts_ - CountsOffNormalised();
}

std::vector<double> SpectrumDatasetOnOff::StatArray() const {
  require_(counts_, "counts");
  require_(counts_off_, "counts_off");
  const stats::WStatStatistic wstat;
  return wstat.EvaluateArray(counts_->values(), counts_off_->values(),
                             Alpha().values(), NpredSig().values());
}

// ---- stacking --------------------------------------------------------------

bool SpectrumDatasetOnOff::CanEvaluate_() const noexcept {
  return counts_.has_value() && counts_off_.has_value() &&
         acceptance_.has_value() && acceptance_off_.has_value() &&
         (models_.empty() || response_.has_value());
}

bool SpectrumDatasetOnOff::IsStackable() const {
  return counts_off_.has_value() && acceptance_.has_value() && acceptance_off_.has_value();
}

void SpectrumDatasetOnOff::CheckStackVariant_(const SpectrumDataset& other_base) const {
  const auto& other = dynamic_cast<const SpectrumDatasetOnOff&>(other_base);
  if (counts_off_->unit() != other.counts_off_->unit()) {
    throw std::invalid_argument(tag() + "::Stack: counts_off units differ");
  }
}

void SpectrumDatasetOnOff::StackVariant_(const SpectrumDataset& other_base,
                                         const SpectrumMask& self_mask,
                                         const SpectrumMask& other_mask) {
  const auto& other = dynamic_cast<const SpectrumDatasetOnOff&>(other_base);
  const EnergyAxis& ax = AnalysisAxis();

  BinnedSpectrum total_off(ax);
  total_off.Stack(*counts_off_, self_mask);
  total_off.Stack(*other.counts_off_, other_mask);

  const BinnedSpectrum self_alpha  = Alpha();
  const BinnedSpectrum other_alpha = other.Alpha();

  BinnedSpectrum total_alpha(ax);
  total_alpha.Stack(self_alpha * *counts_off_, self_mask);
  total_alpha.Stack(other_alpha * *other.counts_off_, other_mask);

  double average_alpha = 0.0;
  const double sum_off = total_off.Sum();
  if (sum_off > 0.0) {
    average_alpha = total_alpha.Sum() / sum_off;
  } else {
    // no off counts anywhere: plain mean of the safe-range alphas
    double acc = 0.0;
    std::size_t n = 0;
    for (std::size_t k = 0; k < ax.nbin(); ++k) {
      if (self_mask[k])  { acc += self_alpha[k];  ++n; }
      if (other_mask[k]) { acc += other_alpha[k]; ++n; }
    }
    if (n > 0) average_alpha = acc / n;
  }

  BinnedSpectrum acceptance_off(ax);
  for (std::size_t k = 0; k < ax.nbin(); ++k) {
    if (total_off[k] == 0.0) {
      acceptance_off.set(k, average_alpha > 0.0 ? 1.0 / average_alpha : 0.0);
    } else if (total_alpha[k] != 0.0) {
      acceptance_off.set(k, total_off[k] / total_alpha[k]);
    }
  }

  acceptance_     = BinnedSpectrum(ax, "", 1.0);
  acceptance_off_ = std::move(acceptance_off);

  *counts_off_ *= self_mask;
  counts_off_->Stack(*other.counts_off_, other_mask);
}

SpectrumDatasetOnOff Merged(const SpectrumDatasetOnOff& a, const SpectrumDatasetOnOff& b) {
  SpectrumDatasetOnOff out(a);
  out.Stack(b);
  return out;
}

// ---- simulation ------------------------------------------------------------

void SpectrumDatasetOnOff::Fake(const BackgroundModel& background_model, std::mt19937_64& rng) {
  const BinnedSpectrum bkg = background_model.Evaluate();

  BinnedSpectrum counts = PoissonSample(NpredSig(), rng);
  counts += PoissonSample(bkg, rng);

  const BinnedSpectrum alpha = Alpha();
  BinnedSpectrum mean_off(alpha.axis());
  for (std::size_t k = 0; k < alpha.nbin(); ++k) {
    if (alpha[k] > 0.0) mean_off.set(k, bkg[k] / alpha[k]);
  }

  counts_     = std::move(counts);
  counts_off_ = PoissonSample(mean_off, rng);
}

void SpectrumDatasetOnOff::Fake(const BackgroundModel& background_model, std::uint64_t seed) {
  std::mt19937_64 rng(seed);
  Fake(background_model, rng);
}

// ---- rebinning -------------------------------------------------------------

SpectrumDatasetOnOff SpectrumDatasetOnOff::ResampleEnergyAxis(const EnergyAxis& new_axis,
                                                              const std::string& name) const {
  SpectrumDatasetOnOff out(name);
  ResampleCommon_(out, new_axis);

  const SpectrumMask safe = mask_safe();
  if (counts_off_) out.counts_off_ = counts_off_->ResampleAxis(new_axis, safe);

  if (acceptance_ && acceptance_off_ && counts_off_) {
    const BinnedSpectrum alpha = Alpha();
    const BinnedSpectrum acc = acceptance_->ResampleAxis(new_axis, safe);
    const BinnedSpectrum bkg = (alpha * *counts_off_).ResampleAxis(new_axis, safe);
    const BinnedSpectrum& off = *out.counts_off_;

    // mean alpha per coarse bin, over its safe constituents (all if none is safe)
    const auto groups = AnalysisAxis().GroupIndices(new_axis);
    std::vector<double> sum_safe(new_axis.nbin(), 0.0), sum_all(new_axis.nbin(), 0.0);
    std::vector<std::size_t> n_safe(new_axis.nbin(), 0), n_all(new_axis.nbin(), 0);
    for (std::size_t i = 0; i < groups.size(); ++i) {
      sum_all[groups[i]] += alpha[i];
      ++n_all[groups[i]];
      if (safe[i]) { sum_safe[groups[i]] += alpha[i]; ++n_safe[groups[i]]; }
    }

    BinnedSpectrum acc_off(new_axis);
    for (std::size_t k = 0; k < new_axis.nbin(); ++k) {
      if (off[k] > 0.0) {
        if (bkg[k] > 0.0) acc_off.set(k, acc[k] * off[k] / bkg[k]);
        continue;
      }
      const double mean_alpha = n_safe[k] > 0 ? sum_safe[k] / n_safe[k]
                                              : (n_all[k] > 0 ? sum_all[k] / n_all[k] : 0.0);
      if (mean_alpha > 0.0) acc_off.set(k, acc[k] / mean_alpha);
    }
    out.acceptance_     = acc;
    out.acceptance_off_ = std::move(acc_off);
  } else {
    if (acceptance_)     out.acceptance_     = acceptance_->ResampleAxis(new_axis, safe);
    if (acceptance_off_) out.acceptance_off_ = acceptance_off_->ResampleAxis(new_axis, safe);
  }
  return out;
}

SpectrumDatasetOnOff SpectrumDatasetOnOff::ToImage(const std::string& name) const {
  return ResampleEnergyAxis(AnalysisAxis().Squash(), name);
}

SpectrumDatasetOnOff SpectrumDatasetOnOff::SliceByIdx(std::size_t start, std::size_t stop,
                                                      const std::string& name) const {
  SpectrumDatasetOnOff out(name);
  SliceCommon_(out, start, stop);
  if (counts_off_)     out.counts_off_     = counts_off_->SliceByIdx(start, stop);
  if (acceptance_)     out.acceptance_     = acceptance_->SliceByIdx(start, stop);
  if (acceptance_off_) out.acceptance_off_ = acceptance_off_->SliceByIdx(start, stop);
  return out;
}

// ---- reporting -------------------------------------------------------------

DatasetInfo SpectrumDatasetOnOff::Info(bool in_safe_range) const {
  DatasetInfo info = SpectrumDataset::Info(in_safe_range);
  const SpectrumMask mask = in_safe_range ? mask_safe() : SpectrumMask::Full(AnalysisAxis());

  // acceptances are reported for the first bin
  info.a_on = acceptance_ ? (*acceptance_)[0] : 1.0;
  if (counts_off_) {
    info.n_off = counts_off_->Sum(mask);
    info.a_off = acceptance_off_ ? (*acceptance_off_)[0] : 1.0;
  } else {
    info.n_off = 0.0;
    info.a_off = 1.0;
  }

  const double alpha0 = (acceptance_ && acceptance_off_) ? Alpha()[0] : 0.0;
  info.alpha = alpha0;

  if (CanEvaluate_()) info.background = Background().Sum(mask);
  if (counts_ && counts_off_ && acceptance_ && acceptance_off_) info.excess = Excess().Sum(mask);
  info.significance = stats::WStatCountsStatistic(info.n_on, *info.n_off, alpha0).Significance();

  if (info.livetime_s && *info.livetime_s > 0.0) {
    info.background_rate = info.background / *info.livetime_s;
    info.gamma_rate      = info.excess / *info.livetime_s;
  }
  return info;
}

std::string SpectrumDatasetOnOff::ToString() const {
  std::ostringstream os;
  os << SpectrumDataset::ToString() << "\n";

  auto line = [&os](const std::string& label, double v) {
    os << "  " << std::left << std::setw(32) << label << ": "
       << std::fixed << std::setprecision(0) << v << "\n";
  };
  line("Total counts_off", counts_off_ ? counts_off_->Sum() : 0.0);
  line("Acceptance", acceptance_ ? acceptance_->Sum() : 0.0);
  line("Acceptance off", acceptance_off_ ? acceptance_off_->Sum() : 0.0);
  return os.str();
}

} // namespace specstack
