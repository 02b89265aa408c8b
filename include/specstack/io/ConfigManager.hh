#pragma once
#include <cstdint>
#include <optional>
#include <string>
#include <vector>

#include <nlohmann/json.hpp>

#include "specstack/axis/EnergyAxis.hh"

namespace specstack {

struct RunHeader {
  std::string label;
  std::string outdir;
  uint64_t    rng_seed  = 12345;
  int         verbosity = 1;     // 0=silent, 1=summary, 2+=debug
};

struct AxisJSON {
  double emin_TeV = 0.1;
  double emax_TeV = 100.0;
  int    nbin     = 20;

  EnergyAxis Build(const std::string& name) const {
    return EnergyAxis::FromEnergyBounds(emin_TeV, emax_TeV, nbin, name);
  }
};

struct AxesJSON {
  AxisJSON                e_reco;
  std::optional<AxisJSON> e_true;   // defaults to e_reco
};

struct EDispJSON {
  double sigma = 0.1;   // width of ln(E_reco / E_true)
  double bias  = 0.0;
};

struct ObservationJSON {
  std::string name;
  double      livetime_s            = 3600.0;
  double      aeff_cm2              = 1e9;     // flat effective area
  double      acceptance            = 1.0;
  double      acceptance_off        = 5.0;
  double      background_rate_per_s = 0.01;    // summed over the reco axis, on region
  double      e_threshold_TeV       = 0.0;     // safe range starts at the first bin above
  double      tstart_s              = 0.0;
  std::optional<EDispJSON> edisp;              // diagonal response if absent
};

struct SourceJSON {
  std::string type = "powerlaw";   // "powerlaw" | "table"
  std::string name = "source";
  double      index         = 2.0;
  double      amplitude     = 1e-12;   // cm-2 s-1 TeV-1
  double      reference_TeV = 1.0;
  std::string table_path;              // CSV E_TeV,dnde for "table"
  double      norm          = 1.0;
};

struct StackingJSON {
  std::vector<std::string> inputs;     // pha file paths
  std::string              output_name = "stacked";
  std::optional<int>       resample_nbin;
};

class ConfigManager {
public:
  explicit ConfigManager(std::string path);
  void parse();

  const RunHeader&                    run()          const noexcept { return run_; }
  const AxesJSON&                     axes()         const noexcept { return axes_; }
  const std::vector<ObservationJSON>& observations() const noexcept { return observations_; }
  const SourceJSON&                   source()       const noexcept { return source_; }
  const StackingJSON&                 stacking()     const noexcept { return stacking_; }

private:
  std::string                  path_;
  RunHeader                    run_;
  AxesJSON                     axes_;
  std::vector<ObservationJSON> observations_;
  SourceJSON                   source_;
  StackingJSON                 stacking_;

  void parse_run_(const nlohmann::json& j);
  void parse_axes_(const nlohmann::json& j);
  void parse_observations_(const nlohmann::json& j);
  void parse_source_(const nlohmann::json& j);
  void parse_stacking_(const nlohmann::json& j);
};

} // namespace specstack
