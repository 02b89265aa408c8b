#include "specstack/stats/CountsStatistic.hh"
#include "specstack/stats/CashStatistic.hh"
#include "specstack/stats/WStatStatistic.hh"

#include <algorithm>
#include <cmath>

namespace specstack::stats {

double CountsStatistic::Significance() const {
  const double ts = std::max(0.0, TS());
  const double s = std::sqrt(ts);
  return NSig() < 0.0 ? -s : s;
}

double CashCountsStatistic::TS() const {
  const CashStatistic cash;
  const double stat_null = cash.EvaluateBin(n_on_, mu_bkg_);
  const double stat_max  = cash.EvaluateBin(n_on_, n_on_);
  return stat_null - stat_max;
}

double WStatCountsStatistic::TS() const {
  const WStatStatistic wstat;
  const double stat_null = wstat.EvaluateBin(n_on_, n_off_, alpha_, 0.0);
  const double stat_max  = wstat.EvaluateBin(n_on_, n_off_, alpha_, NSig());
  return stat_null - stat_max;
}

} // namespace specstack::stats
