#pragma once
#include <string>

namespace specstack {

class GoodTimeIntervals;

/**
 * Time profile of a source, normalised so that a constant source has
 * weight 1. Integral() returns the mean profile value over the good time
 * intervals, the factor by which forward-folded counts are scaled.
 */
class TemporalModel {
public:
  virtual ~TemporalModel() = default;
  virtual double Integral(const GoodTimeIntervals& gti) const = 0;
  virtual std::string type() const = 0;
};

class ConstantTemporalModel : public TemporalModel {
public:
  double Integral(const GoodTimeIntervals& gti) const override;
  std::string type() const override { return "constant"; }
};

// f(t) = exp(-(t - t_ref) / t0)
class ExpDecayTemporalModel : public TemporalModel {
public:
  ExpDecayTemporalModel(double t0_s, double t_ref_s = 0.0);

  double Integral(const GoodTimeIntervals& gti) const override;
  std::string type() const override { return "expdecay"; }

  double t0() const noexcept { return t0_s_; }
  double t_ref() const noexcept { return t_ref_s_; }

private:
  double t0_s_;
  double t_ref_s_;
};

} // namespace specstack
