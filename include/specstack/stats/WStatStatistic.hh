#pragma once

#include <vector>

namespace specstack::stats {

/**
 * WStat: Poisson on/off likelihood with the background rate profiled out.
 *
 * Inputs per bin are the on counts n_on, the off counts n_off, the exposure
 * ratio alpha = a_on / a_off and the predicted signal mu_sig. The profile
 * background mu_bkg (in off-region units) maximises
 *   L = Pois(n_on | mu_sig + alpha mu_bkg) * Pois(n_off | mu_bkg)
 * and is obtained in closed form:
 *
 *   C = alpha (n_on + n_off) - (1 + alpha) mu_sig
 *   D = sqrt(C^2 + 4 alpha (1 + alpha) n_off mu_sig)
 *   mu_bkg = (C + D) / (2 alpha (1 + alpha))
 *
 * The statistic is the corresponding likelihood ratio against the saturated
 * model:
 *
 *   W = 2 [ mu_sig + (1 + alpha) mu_bkg
 *           - n_on ln(mu_sig + alpha mu_bkg) - n_off ln(mu_bkg)
 *           - n_on (1 - ln n_on) - n_off (1 - ln n_off) ]
 *
 * Every n ln(.) term is 0 for n = 0. A NaN result is replaced by 0 and an
 * infinite one by the largest finite double of the same sign.
 */
class WStatStatistic {
public:
  /// Profile background in off-region units.
  double MuBkg(double n_on, double n_off, double alpha, double mu_sig) const noexcept;

  double EvaluateBin(double n_on, double n_off, double alpha, double mu_sig) const noexcept;

  std::vector<double> MuBkgArray(const std::vector<double>& n_on,
                                 const std::vector<double>& n_off,
                                 const std::vector<double>& alpha,
                                 const std::vector<double>& mu_sig) const;

  std::vector<double> EvaluateArray(const std::vector<double>& n_on,
                                    const std::vector<double>& n_off,
                                    const std::vector<double>& alpha,
                                    const std::vector<double>& mu_sig) const;

  double EvaluateSum(const std::vector<double>& n_on,
                     const std::vector<double>& n_off,
                     const std::vector<double>& alpha,
                     const std::vector<double>& mu_sig) const;
};

} // namespace specstack::stats
