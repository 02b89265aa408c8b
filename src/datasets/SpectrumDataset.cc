#include "specstack/datasets/SpectrumDataset.hh"
#include "specstack/sim/PoissonFaker.hh"
#include "specstack/stats/CashStatistic.hh"
#include "specstack/stats/CountsStatistic.hh"

#include <algorithm>
#include <cmath>
#include <iomanip>
#include <limits>
#include <sstream>
#include <stdexcept>

namespace specstack {

std::string MakeDatasetName(const std::string& name) {
  if (!name.empty()) return name;
  static std::mt19937_64 rng{std::random_device{}()};
  std::uniform_int_distribution<std::uint32_t> dist;
  std::ostringstream os;
  os << std::hex << std::setw(8) << std::setfill('0') << dist(rng);
  return os.str();
}

SpectrumDataset::SpectrumDataset(std::string name)
: name_(MakeDatasetName(name))
{}

SpectrumDataset SpectrumDataset::Create(const EnergyAxis& e_reco,
                                        const std::optional<EnergyAxis>& e_true,
                                        const std::string& name,
                                        const std::string& reference_time) {
  const EnergyAxis et = e_true ? *e_true : e_reco.Copy("energy_true");

  SpectrumDataset ds(name);
  ds.counts_ = BinnedSpectrum(e_reco);
  ds.background_model_ = BackgroundModel(BinnedSpectrum(e_reco));
  ds.response_ = ResponseKernel(BinnedSpectrum(et, "cm2 s"),
                                EDispKernel::FromDiagonalResponse(et, e_reco));
  ds.mask_safe_ = SpectrumMask::Empty(e_reco);
  ds.gti_ = GoodTimeIntervals(reference_time);
  return ds;
}

// ---- contents ------------------------------------------------------------

bool SpectrumDataset::HasAnalysisAxis_() const noexcept {
  return counts_.has_value() || background_model_.has_value();
}

bool SpectrumDataset::HasBackground_() const noexcept {
  return background_model_.has_value();
}

bool SpectrumDataset::CanEvaluate_() const noexcept {
  return counts_.has_value() && (!models_.empty() || background_model_.has_value()) &&
         (models_.empty() || response_.has_value());
}

const EnergyAxis& SpectrumDataset::AnalysisAxis() const {
  if (counts_) return counts_->axis();
  if (background_model_) return background_model_->axis();
  throw std::runtime_error("Either 'counts' or 'background_model' must be defined.");
}

void SpectrumDataset::check_reco_axis_(const EnergyAxis& axis, const char* what) const {
  if (HasAnalysisAxis_() && !AnalysisAxis().IsCompatible(axis)) {
    throw std::invalid_argument(tag() + ": " + what + " axis does not match the reco energy axis");
  }
}

void SpectrumDataset::set_counts(std::optional<BinnedSpectrum> c) {
  if (c) check_reco_axis_(c->axis(), "counts");
  counts_ = std::move(c);
}

void SpectrumDataset::set_response(std::optional<ResponseKernel> r) {
  if (r && r->edisp()) check_reco_axis_(r->edisp()->e_reco(), "edisp reco");
  response_ = std::move(r);
  ClearEvaluators_();
}

SpectrumMask SpectrumDataset::mask_safe() const {
  if (mask_safe_) return *mask_safe_;
  return SpectrumMask::Full(AnalysisAxis());
}

void SpectrumDataset::set_mask_safe(std::optional<SpectrumMask> m) {
  if (m) check_reco_axis_(m->axis(), "mask_safe");
  mask_safe_ = std::move(m);
}

void SpectrumDataset::set_mask_fit(std::optional<SpectrumMask> m) {
  if (m) check_reco_axis_(m->axis(), "mask_fit");
  mask_fit_ = std::move(m);
}

void SpectrumDataset::set_background_model(std::optional<BackgroundModel> b) {
  if (b && counts_ && !counts_->axis().IsCompatible(b->axis())) {
    throw std::invalid_argument(tag() + ": background model axis does not match the counts axis");
  }
  background_model_ = std::move(b);
}

void SpectrumDataset::set_gti(std::optional<GoodTimeIntervals> g) {
  gti_ = std::move(g);
  ClearEvaluators_();
}

// ---- predictions -----------------------------------------------------------

std::map<ModelHandle, SpectrumEvaluator>& SpectrumDataset::evaluators_for_models_() const {
  if (evaluators_revision_ && *evaluators_revision_ == models_.revision()) return evaluators_;

  for (auto it = evaluators_.begin(); it != evaluators_.end();) {
    if (models_.Contains(it->first)) ++it;
    else it = evaluators_.erase(it);
  }
  for (ModelHandle h : models_.handles()) {
    if (evaluators_.count(h) == 0) evaluators_.emplace(h, SpectrumEvaluator(models_.Shared(h)));
  }
  evaluators_revision_ = models_.revision();
  return evaluators_;
}

BinnedSpectrum SpectrumDataset::NpredSig() const {
  const EnergyAxis& ax = AnalysisAxis();
  BinnedSpectrum total(ax);
  if (models_.empty()) return total;
  if (!response_) throw std::runtime_error(tag() + " '" + name_ + "': source models need a response");

  const GoodTimeIntervals* gti = gti_ ? &*gti_ : nullptr;
  for (auto& kv : evaluators_for_models_()) {
    total += kv.second.ComputeNpred(*response_, ax, gti);
  }
  return total;
}

BinnedSpectrum SpectrumDataset::NpredSig(ModelHandle h) const {
  if (!models_.Contains(h)) {
    throw std::out_of_range(tag() + " '" + name_ + "': unknown model handle " + std::to_string(h));
  }
  if (!response_) throw std::runtime_error(tag() + " '" + name_ + "': source models need a response");
  const GoodTimeIntervals* gti = gti_ ? &*gti_ : nullptr;
  return evaluators_for_models_().at(h).ComputeNpred(*response_, AnalysisAxis(), gti);
}

BinnedSpectrum SpectrumDataset::Background() const {
  if (!background_model_) {
    throw std::runtime_error(tag() + " '" + name_ + "': no background model defined");
  }
  return background_model_->Evaluate();
}

BinnedSpectrum SpectrumDataset::Npred() const {
  BinnedSpectrum npred = NpredSig();
  if (background_model_) npred += background_model_->Evaluate();
  return npred;
}

BinnedSpectrum SpectrumDataset::Excess() const {
  if (!counts_) throw std::runtime_error(tag() + " '" + name_ + "': no counts defined");
  return *counts_ - Background();
}

std::vector<double> SpectrumDataset::StatArray() const {
  if (!counts_) throw std::runtime_error(tag() + " '" + name_ + "': no counts defined");
  const stats::CashStatistic cash;
  return cash.EvaluateArray(counts_->values(), Npred().values());
}

SpectrumMask SpectrumDataset::Mask() const {
  SpectrumMask m = mask_safe();
  if (mask_fit_) m = m.And(*mask_fit_);
  return m;
}

double SpectrumDataset::StatSum() const {
  const std::vector<double> stat = StatArray();
  const SpectrumMask m = Mask();
  if (m.nbin() != stat.size()) {
    throw std::invalid_argument(tag() + "::StatSum: mask and statistic sizes differ");
  }
  double sum = 0.0;
  for (std::size_t i = 0; i < stat.size(); ++i) if (m[i]) sum += stat[i];
  return sum;
}

BinnedSpectrum SpectrumDataset::Residuals(const std::string& method) const {
  if (!counts_) throw std::runtime_error(tag() + " '" + name_ + "': no counts defined");
  const BinnedSpectrum npred = Npred();
  BinnedSpectrum res = *counts_ - npred;

  if (method == "diff") return res;

  if (method == "diff/model") {
    res /= npred;
  } else if (method == "diff/sqrt(model)") {
    for (std::size_t i = 0; i < res.nbin(); ++i) res.set(i, res[i] / std::sqrt(npred[i]));
  } else {
    throw std::invalid_argument("Invalid method: " + method +
                                " for computing residuals (diff, diff/model, diff/sqrt(model))");
  }
  res.NanToNum();
  return res;
}

std::optional<std::pair<double, double>> SpectrumDataset::EnergyRange() const {
  const SpectrumMask m = mask_safe();
  if (!m.Any()) return std::nullopt;

  const EnergyAxis& ax = m.axis();
  double emin = std::numeric_limits<double>::max();
  double emax = std::numeric_limits<double>::lowest();
  for (std::size_t i = 0; i < ax.nbin(); ++i) {
    if (!m[i]) continue;
    emin = std::min(emin, ax.lo(i));
    emax = std::max(emax, ax.hi(i));
  }
  return std::make_pair(emin, emax);
}

std::optional<double> SpectrumDataset::Livetime() const {
  if (gti_ && !gti_->empty()) return gti_->TimeSum();
  if (response_) return response_->livetime();
  return std::nullopt;
}

// ---- stacking --------------------------------------------------------------

bool SpectrumDataset::IsStackable() const {
  return counts_.has_value();
}

void SpectrumDataset::Stack(const SpectrumDataset& other) {
  if (stat_type() != other.stat_type()) {
    throw std::invalid_argument("Incompatible types for " + tag() + " stacking");
  }
  if (!IsStackable() || !other.IsStackable()) {
    throw std::invalid_argument("Cannot stack incomplete " + tag() + " datasets");
  }
  if (!AnalysisAxis().IsCompatible(other.AnalysisAxis())) {
    throw std::invalid_argument(tag() + "::Stack: reco energy axes differ");
  }
  if (response_ && other.response_) response_->CheckStackable(*other.response_, AnalysisAxis());
  if (counts_ && other.counts_ && counts_->unit() != other.counts_->unit()) {
    throw std::invalid_argument(tag() + "::Stack: counts units differ");
  }
  CheckStackVariant_(other);

  // masks as they were before stacking; every step below weights with them
  const SpectrumMask self_mask  = mask_safe();
  const SpectrumMask other_mask = other.mask_safe();

  StackVariant_(other, self_mask, other_mask);

  if (counts_ && other.counts_) {
    *counts_ *= self_mask;
    counts_->Stack(*other.counts_, other_mask);
  } else if (counts_) {
    *counts_ *= self_mask;
  } else if (other.counts_) {
    counts_ = *other.counts_ * other_mask;
  }

  if (response_ && other.response_) response_->Stack(*other.response_, self_mask, other_mask);

  mask_safe_ = self_mask.Or(other_mask);

  if (mask_fit_ && other.mask_fit_) mask_fit_ = mask_fit_->And(*other.mask_fit_);
  else if (other.mask_fit_)         mask_fit_ = other.mask_fit_;

  if (gti_ && other.gti_) {
    gti_->Stack(*other.gti_);
    gti_ = gti_->Union();
  } else if (other.gti_) {
    gti_ = other.gti_;
  }

  if (meta_table_ && other.meta_table_) meta_table_->Join(*other.meta_table_);
  else if (other.meta_table_)           meta_table_ = other.meta_table_;

  ClearEvaluators_();
}

void SpectrumDataset::CheckStackVariant_(const SpectrumDataset& other) const {
  if (background_model_ && other.background_model_ &&
      !background_model_->axis().IsCompatible(other.background_model_->axis())) {
    throw std::invalid_argument(tag() + "::Stack: background model axes differ");
  }
}

void SpectrumDataset::StackVariant_(const SpectrumDataset& other,
                                    const SpectrumMask& self_mask,
                                    const SpectrumMask& other_mask) {
  if (background_model_ && other.background_model_) {
    background_model_->ApplyMask(self_mask);
    background_model_->Stack(*other.background_model_, other_mask);
  } else if (background_model_) {
    background_model_->ApplyMask(self_mask);
  } else if (other.background_model_) {
    background_model_ = BackgroundModel(other.background_model_->Evaluate() * other_mask);
  }
}

SpectrumDataset Merged(const SpectrumDataset& a, const SpectrumDataset& b) {
  if (a.stat_type() != stats::StatType::Cash) {
    throw std::invalid_argument("Merged: " + a.tag() + " passed as a SpectrumDataset");
  }
  SpectrumDataset out(a);
  out.Stack(b);
  return out;
}

// ---- simulation ------------------------------------------------------------

void SpectrumDataset::Fake(std::mt19937_64& rng) {
  counts_ = PoissonSample(Npred(), rng);
}

void SpectrumDataset::Fake(std::uint64_t seed) {
  std::mt19937_64 rng(seed);
  Fake(rng);
}

// ---- rebinning -------------------------------------------------------------

void SpectrumDataset::ResampleCommon_(SpectrumDataset& out, const EnergyAxis& new_axis) const {
  const SpectrumMask safe = mask_safe();

  if (counts_)   out.counts_   = counts_->ResampleAxis(new_axis, safe);
  if (response_) out.response_ = response_->ResampleRecoAxis(new_axis, safe);
  out.mask_safe_  = safe.ResampleAxis(new_axis);
  out.gti_        = gti_;
  out.meta_table_ = meta_table_;
  out.models_     = models_;
}

void SpectrumDataset::SliceCommon_(SpectrumDataset& out, std::size_t start, std::size_t stop) const {
  if (counts_)    out.counts_    = counts_->SliceByIdx(start, stop);
  if (response_)  out.response_  = response_->SliceRecoByIdx(start, stop);
  if (mask_safe_) out.mask_safe_ = mask_safe_->SliceByIdx(start, stop);
  if (mask_fit_)  out.mask_fit_  = mask_fit_->SliceByIdx(start, stop);
  out.gti_        = gti_;
  out.meta_table_ = meta_table_;
  out.models_     = models_;
}

void SpectrumDataset::require_cash_(const char* what) const {
  if (stat_type() != stats::StatType::Cash) {
    throw std::invalid_argument(tag() + ": SpectrumDataset::" + what +
                                " would drop the " + stats::ToString(stat_type()) + " content");
  }
}

SpectrumDataset SpectrumDataset::ResampleEnergyAxis(const EnergyAxis& new_axis,
                                                    const std::string& name) const {
  require_cash_("ResampleEnergyAxis");
  SpectrumDataset out(name);
  ResampleCommon_(out, new_axis);
  if (background_model_) {
    out.background_model_ = background_model_->ResampleAxis(new_axis, mask_safe());
  }
  return out;
}

SpectrumDataset SpectrumDataset::ToImage(const std::string& name) const {
  require_cash_("ToImage");
  return ResampleEnergyAxis(AnalysisAxis().Squash(), name);
}

SpectrumDataset SpectrumDataset::SliceByIdx(std::size_t start, std::size_t stop,
                                            const std::string& name) const {
  require_cash_("SliceByIdx");
  SpectrumDataset out(name);
  SliceCommon_(out, start, stop);
  if (background_model_) out.background_model_ = background_model_->SliceByIdx(start, stop);
  return out;
}

// ---- reporting -------------------------------------------------------------

DatasetInfo SpectrumDataset::Info(bool in_safe_range) const {
  const SpectrumMask mask = in_safe_range ? mask_safe() : SpectrumMask::Full(AnalysisAxis());

  DatasetInfo info;
  info.name = name_;
  info.livetime_s = Livetime();
  info.n_on = counts_ ? counts_->Sum(mask) : 0.0;
  info.background = background_model_ ? background_model_->Evaluate().Sum(mask) : 0.0;
  info.excess = info.n_on - info.background;
  info.significance = stats::CashCountsStatistic(info.n_on, info.background).Significance();

  if (info.livetime_s && *info.livetime_s > 0.0) {
    info.background_rate = info.background / *info.livetime_s;
    info.gamma_rate      = info.excess / *info.livetime_s;
  }
  return info;
}

namespace {

std::string fmt_line(const std::string& label, const std::string& value) {
  std::ostringstream os;
  os << "  " << std::left << std::setw(32) << label << ": " << value << "\n";
  return os.str();
}

std::string fmt_num(double v, int precision, bool scientific = false) {
  std::ostringstream os;
  if (scientific) os << std::scientific;
  else            os << std::fixed;
  os << std::setprecision(precision) << v;
  return os.str();
}

} // namespace

std::string SpectrumDataset::ToString() const {
  const double nan = std::numeric_limits<double>::quiet_NaN();
  const std::string t = tag();

  std::ostringstream os;
  os << t << "\n" << std::string(t.size(), '-') << "\n\n";
  os << fmt_line("Name", name_) << "\n";

  os << fmt_line("Total counts", fmt_num(counts_ ? counts_->Sum() : nan, 0));
  double npred = nan;
  if (CanEvaluate_()) npred = Npred().Sum();
  os << fmt_line("Total predicted counts", fmt_num(npred, 2));
  os << fmt_line("Total background counts",
                 fmt_num(HasBackground_() ? Background().Sum() : nan, 2)) << "\n";

  double exp_min = nan, exp_max = nan;
  std::string exp_unit;
  if (response_) {
    const BinnedSpectrum& exposure = response_->exposure();
    for (std::size_t i = 0; i < exposure.nbin(); ++i) {
      const double v = exposure[i];
      if (v <= 0.0) continue;
      exp_min = std::isnan(exp_min) ? v : std::min(exp_min, v);
      exp_max = std::isnan(exp_max) ? v : std::max(exp_max, v);
    }
    if (!std::isnan(exp_min)) exp_unit = " " + exposure.unit();
  }
  os << fmt_line("Exposure min", fmt_num(exp_min, 2, true) + exp_unit);
  os << fmt_line("Exposure max", fmt_num(exp_max, 2, true) + exp_unit) << "\n";

  const std::size_t n_bins = counts_ ? counts_->nbin() : 0;
  const std::size_t n_fit_bins = HasAnalysisAxis_() ? Mask().Count() : 0;
  os << fmt_line("Number of total bins", std::to_string(n_bins));
  os << fmt_line("Number of fit bins", std::to_string(n_fit_bins)) << "\n";

  os << fmt_line("Fit statistic type", stats::ToString(stat_type()));
  double stat = nan;
  if (CanEvaluate_()) stat = StatSum();
  os << fmt_line("Fit statistic value (-2 log(L))", fmt_num(stat, 2)) << "\n";

  std::size_t n_pars = models_.NParameters();
  std::size_t n_free = models_.NFreeParameters();
  if (background_model_) {
    n_pars += background_model_->NParameters();
    n_free += background_model_->NFreeParameters();
  }
  os << fmt_line("Number of parameters", std::to_string(n_pars));
  os << fmt_line("Number of free parameters", std::to_string(n_free));

  for (ModelHandle h : models_.handles()) {
    const SourceModel& m = models_.Get(h);
    os << "\n  Component " << h << ": " << m.name() << " (" << m.spectral().type() << ")\n";
    for (const auto& p : m.spectral().parameters()) {
      os << "    " << std::left << std::setw(12) << p.name << ": " << p.value
         << (p.unit.empty() ? "" : " " + p.unit) << (p.frozen ? " (frozen)" : "") << "\n";
    }
  }
  return os.str();
}

} // namespace specstack
