#pragma once
#include <cstdint>
#include <map>
#include <optional>
#include <random>
#include <string>
#include <utility>
#include <vector>

#include "specstack/backgrounds/BackgroundModel.hh"
#include "specstack/datasets/DatasetInfo.hh"
#include "specstack/datasets/MetaTable.hh"
#include "specstack/gti/GoodTimeIntervals.hh"
#include "specstack/model/ModelCollection.hh"
#include "specstack/response/ResponseKernel.hh"
#include "specstack/response/SpectrumEvaluator.hh"
#include "specstack/spectrum/BinnedSpectrum.hh"
#include "specstack/spectrum/SpectrumMask.hh"
#include "specstack/stats/StatType.hh"

namespace specstack {

/// Random 8-character hex name, or `name` itself if not empty.
std::string MakeDatasetName(const std::string& name = "");

/**
 * 1-D spectral dataset analysed with the Cash statistic.
 *
 * Holds observed counts on the reconstructed-energy axis, the instrument
 * response, a safe mask (all true if never set), an optional fit mask, an
 * optional background model and the source models whose predicted counts
 * are forward-folded through the response.
 *
 * Stack() merges another dataset of the same kind into this one in place.
 * The common steps live here; the kind-specific accumulation is delegated
 * to StackVariant_(), which SpectrumDatasetOnOff overrides.
 */
class SpectrumDataset {
public:
  explicit SpectrumDataset(std::string name = "");
  virtual ~SpectrumDataset() = default;

  SpectrumDataset(const SpectrumDataset&) = default;
  SpectrumDataset& operator=(const SpectrumDataset&) = default;
  SpectrumDataset(SpectrumDataset&&) = default;
  SpectrumDataset& operator=(SpectrumDataset&&) = default;

  /**
   * Empty dataset with the correct geometry: zero counts, zero background
   * template, zero exposure, diagonal energy dispersion, safe mask false in
   * every bin and no time intervals. e_true defaults to a copy of e_reco.
   */
  static SpectrumDataset Create(const EnergyAxis& e_reco,
                                const std::optional<EnergyAxis>& e_true = std::nullopt,
                                const std::string& name = "",
                                const std::string& reference_time = "2000-01-01");

  const std::string& name() const noexcept { return name_; }
  virtual stats::StatType stat_type() const { return stats::StatType::Cash; }
  virtual std::string tag() const { return "SpectrumDataset"; }

  // ---- contents --------------------------------------------------------
  const std::optional<BinnedSpectrum>& counts() const noexcept { return counts_; }
  void set_counts(std::optional<BinnedSpectrum> c);

  const std::optional<ResponseKernel>& response() const noexcept { return response_; }
  void set_response(std::optional<ResponseKernel> r);

  /// The stored safe mask, or all-true over the analysis axis.
  SpectrumMask mask_safe() const;
  bool HasMaskSafe() const noexcept { return mask_safe_.has_value(); }
  void set_mask_safe(std::optional<SpectrumMask> m);

  const std::optional<SpectrumMask>& mask_fit() const noexcept { return mask_fit_; }
  void set_mask_fit(std::optional<SpectrumMask> m);

  const std::optional<BackgroundModel>& background_model() const noexcept { return background_model_; }
  std::optional<BackgroundModel>& background_model() noexcept { return background_model_; }
  void set_background_model(std::optional<BackgroundModel> b);

  const std::optional<GoodTimeIntervals>& gti() const noexcept { return gti_; }
  void set_gti(std::optional<GoodTimeIntervals> g);

  const std::optional<MetaTable>& meta_table() const noexcept { return meta_table_; }
  void set_meta_table(std::optional<MetaTable> t) { meta_table_ = std::move(t); }

  ModelCollection& models() noexcept { return models_; }
  const ModelCollection& models() const noexcept { return models_; }

  /// Reco axis every per-bin array of this dataset shares.
  virtual const EnergyAxis& AnalysisAxis() const;

  // ---- predictions and statistic ---------------------------------------
  /// Summed forward-folded counts of all source models (zero if none).
  BinnedSpectrum NpredSig() const;
  BinnedSpectrum NpredSig(ModelHandle h) const;

  /// Predicted background counts.
  virtual BinnedSpectrum Background() const;

  /// Total predicted counts.
  virtual BinnedSpectrum Npred() const;

  virtual BinnedSpectrum Excess() const;

  /// Per-bin fit statistic over the full axis.
  virtual std::vector<double> StatArray() const;

  /// Sum of StatArray over Mask().
  double StatSum() const;

  /// Safe mask AND fit mask (when set).
  SpectrumMask Mask() const;

  /// "diff", "diff/model" or "diff/sqrt(model)"; x/0 gives 0.
  BinnedSpectrum Residuals(const std::string& method = "diff") const;

  /// [emin, emax] of the safe bins, nullopt if none is safe.
  std::optional<std::pair<double, double>> EnergyRange() const;

  /// Livetime from the time intervals, else from the response.
  std::optional<double> Livetime() const;

  // ---- stacking and rebinning ------------------------------------------
  virtual bool IsStackable() const;

  /// Merge other into this dataset. Counts outside each dataset's safe
  /// mask are lost; the stacked safe mask is the OR of both. All checks run
  /// before the first change, so a throwing call leaves this unchanged.
  void Stack(const SpectrumDataset& other);

  /// Replace counts with a Poisson realisation of Npred().
  void Fake(std::mt19937_64& rng);
  void Fake(std::uint64_t seed);

  /// These return a Cash dataset. Derived kinds hide them with versions
  /// returning their own type; calling the Cash versions on another kind
  /// (through a base reference) throws std::invalid_argument.
  SpectrumDataset ResampleEnergyAxis(const EnergyAxis& new_axis, const std::string& name = "") const;
  SpectrumDataset ToImage(const std::string& name = "") const;
  SpectrumDataset SliceByIdx(std::size_t start, std::size_t stop, const std::string& name = "") const;

  // ---- reporting -------------------------------------------------------
  virtual DatasetInfo Info(bool in_safe_range = true) const;
  virtual std::string ToString() const;

protected:
  /// Throws std::invalid_argument if StackVariant_(other, ...) would fail.
  virtual void CheckStackVariant_(const SpectrumDataset& other) const;

  /// Kind-specific part of Stack, called before counts and masks are merged.
  virtual void StackVariant_(const SpectrumDataset& other,
                             const SpectrumMask& self_mask,
                             const SpectrumMask& other_mask);

  /// Fill the parts of out shared by every dataset kind when rebinning.
  void ResampleCommon_(SpectrumDataset& out, const EnergyAxis& new_axis) const;
  void SliceCommon_(SpectrumDataset& out, std::size_t start, std::size_t stop) const;

  void require_cash_(const char* what) const;

  void ClearEvaluators_() { evaluators_.clear(); evaluators_revision_.reset(); }

  /// Throws std::invalid_argument if axis differs from an already defined analysis axis.
  void check_reco_axis_(const EnergyAxis& axis, const char* what) const;
  virtual bool HasAnalysisAxis_() const noexcept;
  /// True when StatArray() has every input it needs.
  virtual bool CanEvaluate_() const noexcept;
  virtual bool HasBackground_() const noexcept;

  std::map<ModelHandle, SpectrumEvaluator>& evaluators_for_models_() const;

  std::string                      name_;
  std::optional<BinnedSpectrum>    counts_;
  std::optional<ResponseKernel>    response_;
  std::optional<SpectrumMask>      mask_safe_;
  std::optional<SpectrumMask>      mask_fit_;
  std::optional<BackgroundModel>   background_model_;
  std::optional<GoodTimeIntervals> gti_;
  std::optional<MetaTable>         meta_table_;
  ModelCollection                  models_;

private:
  mutable std::map<ModelHandle, SpectrumEvaluator> evaluators_;
  mutable std::optional<std::uint64_t>             evaluators_revision_;
};

/// Copy of a stacked with b. Throws std::invalid_argument unless a is a Cash
/// dataset; on/off datasets have their own overload.
SpectrumDataset Merged(const SpectrumDataset& a, const SpectrumDataset& b);

} // namespace specstack
