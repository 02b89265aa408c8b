#include "specstack/stats/CashStatistic.hh"

#include <cmath>
#include <stdexcept>

namespace specstack::stats {

double CashStatistic::EvaluateBin(double n, double mu) const noexcept {
  if (n <= 0.0 && mu <= 0.0) return 0.0;
  if (!(mu > kTruncationValue)) mu = kTruncationValue;
  double c = mu - n;
  if (n > 0.0) c += n * std::log(n / mu);
  return 2.0 * c;
}

std::vector<double> CashStatistic::EvaluateArray(const std::vector<double>& data,
                                                 const std::vector<double>& model) const {
  if (data.size() != model.size()) {
    throw std::invalid_argument("CashStatistic::EvaluateArray: data/model size mismatch");
  }
  std::vector<double> out(data.size());
  for (std::size_t i = 0; i < data.size(); ++i) out[i] = EvaluateBin(data[i], model[i]);
  return out;
}

double CashStatistic::EvaluateSum(const std::vector<double>& data,
                                  const std::vector<double>& model) const {
  double sum = 0.0;
  for (double c : EvaluateArray(data, model)) sum += c;
  return sum;
}

} // namespace specstack::stats
