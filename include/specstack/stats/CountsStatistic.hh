#pragma once

namespace specstack::stats {

/**
 * Summed-counts significance estimators used for dataset summaries.
 *
 * TS is the difference between the statistic of the background-only
 * hypothesis and the best-fit one; the signed significance is
 * sign(excess) * sqrt(TS).
 */
class CountsStatistic {
public:
  virtual ~CountsStatistic() = default;

  virtual double NSig() const = 0;
  virtual double NBkg() const = 0;
  virtual double TS() const = 0;

  double Excess() const { return NSig(); }
  double Significance() const;
};

// n_on observed counts on top of a known background expectation mu_bkg.
class CashCountsStatistic : public CountsStatistic {
public:
  CashCountsStatistic(double n_on, double mu_bkg) : n_on_(n_on), mu_bkg_(mu_bkg) {}

  double NSig() const override { return n_on_ - mu_bkg_; }
  double NBkg() const override { return mu_bkg_; }
  double TS() const override;

private:
  double n_on_;
  double mu_bkg_;
};

// On/off counts; TS is equivalent to Li & Ma (1983) eq. 17.
class WStatCountsStatistic : public CountsStatistic {
public:
  WStatCountsStatistic(double n_on, double n_off, double alpha)
  : n_on_(n_on), n_off_(n_off), alpha_(alpha) {}

  double NSig() const override { return n_on_ - NBkg(); }
  double NBkg() const override { return alpha_ * n_off_; }
  double TS() const override;

private:
  double n_on_;
  double n_off_;
  double alpha_;
};

} // namespace specstack::stats
