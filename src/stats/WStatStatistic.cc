#include "specstack/stats/WStatStatistic.hh"

#include <algorithm>
#include <cmath>
#include <limits>
#include <stdexcept>
#include <string>

namespace specstack::stats {

namespace {

// n * ln(x), 0 for n == 0
inline double n_log(double n, double x) {
  return n == 0.0 ? 0.0 : n * std::log(x);
}

inline double nan_to_num(double v) {
  if (std::isnan(v)) return 0.0;
  if (std::isinf(v)) return v > 0.0 ? std::numeric_limits<double>::max()
                                    : std::numeric_limits<double>::lowest();
  return v;
}

void check_sizes(std::size_t n, const std::vector<double>& a,
                 const std::vector<double>& b, const std::vector<double>& c,
                 const char* where) {
  if (a.size() != n || b.size() != n || c.size() != n) {
    throw std::invalid_argument(std::string(where) + ": size mismatch");
  }
}

} // namespace

double WStatStatistic::MuBkg(double n_on, double n_off, double alpha,
                             double mu_sig) const noexcept {
  if (alpha == 0.0) return n_off;
  if (n_on == 0.0) return n_off / (1.0 + alpha);
  if (n_off == 0.0) return std::max(0.0, n_on / (1.0 + alpha) - mu_sig / alpha);

  const double C = alpha * (n_on + n_off) - (1.0 + alpha) * mu_sig;
  const double D = std::sqrt(C * C + 4.0 * alpha * (1.0 + alpha) * n_off * mu_sig);
  return (C + D) / (2.0 * alpha * (1.0 + alpha));
}

double WStatStatistic::EvaluateBin(double n_on, double n_off, double alpha,
                                   double mu_sig) const noexcept {
  const double mu_bkg = MuBkg(n_on, n_off, alpha, mu_sig);

  double w = mu_sig + (1.0 + alpha) * mu_bkg;
  w -= n_log(n_on, mu_sig + alpha * mu_bkg);
  w -= n_log(n_off, mu_bkg);
  w -= n_on - n_log(n_on, n_on);
  w -= n_off - n_log(n_off, n_off);
  return nan_to_num(2.0 * w);
}

std::vector<double> WStatStatistic::MuBkgArray(const std::vector<double>& n_on,
                                               const std::vector<double>& n_off,
                                               const std::vector<double>& alpha,
                                               const std::vector<double>& mu_sig) const {
  check_sizes(n_on.size(), n_off, alpha, mu_sig, "WStatStatistic::MuBkgArray");
  std::vector<double> out(n_on.size());
  for (std::size_t i = 0; i < out.size(); ++i)
    out[i] = nan_to_num(MuBkg(n_on[i], n_off[i], alpha[i], mu_sig[i]));
  return out;
}

std::vector<double> WStatStatistic::EvaluateArray(const std::vector<double>& n_on,
                                                  const std::vector<double>& n_off,
                                                  const std::vector<double>& alpha,
                                                  const std::vector<double>& mu_sig) const {
  check_sizes(n_on.size(), n_off, alpha, mu_sig, "WStatStatistic::EvaluateArray");
  std::vector<double> out(n_on.size());
  for (std::size_t i = 0; i < out.size(); ++i)
    out[i] = EvaluateBin(n_on[i], n_off[i], alpha[i], mu_sig[i]);
  return out;
}

double WStatStatistic::EvaluateSum(const std::vector<double>& n_on,
                                   const std::vector<double>& n_off,
                                   const std::vector<double>& alpha,
                                   const std::vector<double>& mu_sig) const {
  double sum = 0.0;
  for (double w : EvaluateArray(n_on, n_off, alpha, mu_sig)) sum += w;
  return sum;
}

} // namespace specstack::stats
