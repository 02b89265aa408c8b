#pragma once

#include <vector>

namespace specstack::stats {

/**
 * Cash statistic for Poisson data with a known model prediction.
 *
 *   C_i = 2 [ mu_i - n_i + n_i ln(n_i / mu_i) ]
 *
 * with n_i ln(n_i / mu_i) = 0 for n_i = 0. Predictions below the truncation
 * value (including mu_i <= 0) are raised to it before evaluation, so an
 * observed count with zero prediction gives a large but finite penalty and
 * an empty bin with zero prediction contributes exactly 0.
 *
 * Unlike the usual -2 ln L this form is shifted so that a perfect prediction
 * (n_i == mu_i) gives C_i = 0.
 */
class CashStatistic {
public:
  static constexpr double kTruncationValue = 1e-25;

  double EvaluateBin(double n, double mu) const noexcept;

  std::vector<double> EvaluateArray(const std::vector<double>& data,
                                    const std::vector<double>& model) const;

  double EvaluateSum(const std::vector<double>& data,
                     const std::vector<double>& model) const;
};

} // namespace specstack::stats
