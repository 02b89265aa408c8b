#pragma once
#include <optional>
#include <string>

namespace specstack {

// Summary numbers of a dataset, summed over energy.
struct DatasetInfo {
  std::string           name;
  std::optional<double> livetime_s;
  double                n_on         = 0.0;
  double                background   = 0.0;
  double                excess       = 0.0;
  double                significance = 0.0;
  std::optional<double> background_rate;   // per second, needs livetime
  std::optional<double> gamma_rate;

  // on/off only
  std::optional<double> n_off;
  std::optional<double> a_on;
  std::optional<double> a_off;
  std::optional<double> alpha;
};

} // namespace specstack
