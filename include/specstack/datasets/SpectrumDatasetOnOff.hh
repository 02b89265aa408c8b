#pragma once
#include <cstdint>
#include <optional>
#include <random>
#include <string>

#include "specstack/datasets/SpectrumDataset.hh"

namespace specstack {

/**
 * Spectral dataset with the background measured in an off region and
 * profiled out with the WStat statistic.
 *
 * On top of SpectrumDataset it holds the off counts and the on/off
 * acceptances (relative background efficiencies), all on the reco axis.
 * alpha = acceptance / acceptance_off, 0 where acceptance_off is 0.
 */
class SpectrumDatasetOnOff : public SpectrumDataset {
public:
  explicit SpectrumDatasetOnOff(std::string name = "");

  /// Empty dataset: as SpectrumDataset::Create plus zero off counts and
  /// acceptances of 1.
  static SpectrumDatasetOnOff Create(const EnergyAxis& e_reco,
                                     const std::optional<EnergyAxis>& e_true = std::nullopt,
                                     const std::string& name = "",
                                     const std::string& reference_time = "2000-01-01");

  /**
   * On/off dataset sharing counts, response, masks, time intervals, models
   * and name with dataset. Without counts_off and with a background model on
   * dataset, the off counts are derived as background / alpha (0 where
   * alpha is 0).
   */
  static SpectrumDatasetOnOff FromSpectrumDataset(const SpectrumDataset& dataset,
                                                  const BinnedSpectrum& acceptance,
                                                  const BinnedSpectrum& acceptance_off,
                                                  std::optional<BinnedSpectrum> counts_off = std::nullopt);
  static SpectrumDatasetOnOff FromSpectrumDataset(const SpectrumDataset& dataset,
                                                  double acceptance, double acceptance_off,
                                                  std::optional<BinnedSpectrum> counts_off = std::nullopt);

  /// Cash dataset whose background model template is alpha * counts_off.
  SpectrumDataset ToSpectrumDataset(const std::string& name = "") const;

  stats::StatType stat_type() const override { return stats::StatType::WStat; }
  std::string tag() const override { return "SpectrumDatasetOnOff"; }

  const std::optional<BinnedSpectrum>& counts_off() const noexcept { return counts_off_; }
  void set_counts_off(std::optional<BinnedSpectrum> c);

  const std::optional<BinnedSpectrum>& acceptance() const noexcept { return acceptance_; }
  void set_acceptance(std::optional<BinnedSpectrum> a);
  void set_acceptance(double a);   // broadcast over the analysis axis

  const std::optional<BinnedSpectrum>& acceptance_off() const noexcept { return acceptance_off_; }
  void set_acceptance_off(std::optional<BinnedSpectrum> a);
  void set_acceptance_off(double a);

  const EnergyAxis& AnalysisAxis() const override;

  BinnedSpectrum Alpha() const;
  /// alpha * counts_off
  BinnedSpectrum CountsOffNormalised() const;

  /// alpha * mu_bkg with mu_bkg the WStat profile background.
  BinnedSpectrum Background() const override;
  BinnedSpectrum Npred() const override;
  /// counts - alpha * counts_off
  BinnedSpectrum Excess() const override;
  std::vector<double> StatArray() const override;

  bool IsStackable() const override;

  /**
   * Overwrite counts and counts_off with a simulation:
   *   counts     = Pois(npred_sig) + Pois(bkg)
   *   counts_off = Pois(bkg / alpha)
   * with bkg the evaluated background model. Bins with alpha = 0 get no
   * off counts.
   */
  void Fake(const BackgroundModel& background_model, std::mt19937_64& rng);
  void Fake(const BackgroundModel& background_model, std::uint64_t seed);

  SpectrumDatasetOnOff ResampleEnergyAxis(const EnergyAxis& new_axis, const std::string& name = "") const;
  SpectrumDatasetOnOff ToImage(const std::string& name = "") const;
  SpectrumDatasetOnOff SliceByIdx(std::size_t start, std::size_t stop, const std::string& name = "") const;

  DatasetInfo Info(bool in_safe_range = true) const override;
  std::string ToString() const override;

protected:
  /**
   * Re-derives the acceptances from the masked off counts of both datasets:
   *
   *   total_off[k]   = sum_j n_off_jk m_jk
   *   total_alpha[k] = sum_j alpha_jk n_off_jk m_jk
   *   acceptance     = 1
   *   acceptance_off = total_off / total_alpha
   *
   * so that the stacked alpha is the off-count weighted mean of the inputs.
   * Bins without off counts use 1 / average_alpha, the ratio of the summed
   * totals (or the mean alpha of both safe ranges when there are no off
   * counts at all). The off counts are then stacked with the mask rule.
   */
  void StackVariant_(const SpectrumDataset& other,
                     const SpectrumMask& self_mask,
                     const SpectrumMask& other_mask) override;
  void CheckStackVariant_(const SpectrumDataset& other) const override;

  bool HasAnalysisAxis_() const noexcept override;
  bool CanEvaluate_() const noexcept override;
  bool HasBackground_() const noexcept override { return CanEvaluate_(); }

private:
  void require_(const std::optional<BinnedSpectrum>& s, const char* what) const;

  std::optional<BinnedSpectrum> counts_off_;
  std::optional<BinnedSpectrum> acceptance_;
  std::optional<BinnedSpectrum> acceptance_off_;
};

SpectrumDatasetOnOff Merged(const SpectrumDatasetOnOff& a, const SpectrumDatasetOnOff& b);

} // namespace specstack
