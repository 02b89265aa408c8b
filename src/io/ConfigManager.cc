#include "specstack/io/ConfigManager.hh"
#include <fstream>
#include <stdexcept>
#include <utility>

#include <nlohmann/json.hpp>

namespace specstack {

ConfigManager::ConfigManager(std::string path) : path_(std::move(path)) {}

void ConfigManager::parse() {
  std::ifstream in(path_);
  if (!in) throw std::runtime_error("Cannot open config: " + path_);
  nlohmann::json j;
  in >> j;

  parse_run_(j.at("run"));
  if (j.contains("axes"))         parse_axes_(j.at("axes"));
  if (j.contains("observations")) parse_observations_(j.at("observations"));
  if (j.contains("source"))       parse_source_(j.at("source"));
  if (j.contains("stacking"))     parse_stacking_(j.at("stacking"));
}

void ConfigManager::parse_run_(const nlohmann::json& j) {
  run_.label     = j.value("label", std::string{});
  run_.outdir    = j.value("outdir", std::string{"."});
  run_.rng_seed  = j.value("rng_seed", 12345ULL);
  run_.verbosity = j.value("verbosity", 1);
}

static AxisJSON parse_axis(const nlohmann::json& j) {
  AxisJSON a;
  a.emin_TeV = j.value("emin_TeV", 0.1);
  a.emax_TeV = j.value("emax_TeV", 100.0);
  a.nbin     = j.value("nbin", 20);
  if (!(a.emin_TeV > 0.0) || !(a.emax_TeV > a.emin_TeV) || a.nbin < 1)
    throw std::invalid_argument("axes: need 0 < emin_TeV < emax_TeV and nbin >= 1");
  return a;
}

void ConfigManager::parse_axes_(const nlohmann::json& j) {
  if (j.contains("e_reco")) axes_.e_reco = parse_axis(j.at("e_reco"));
  if (j.contains("e_true")) axes_.e_true = parse_axis(j.at("e_true"));
}

void ConfigManager::parse_observations_(const nlohmann::json& j) {
  if (!j.is_array()) throw std::invalid_argument("observations must be a list");

  observations_.clear();
  for (const auto& jo : j) {
    ObservationJSON o;
    o.name                  = jo.at("name").get<std::string>();
    o.livetime_s            = jo.value("livetime_s", 3600.0);
    o.aeff_cm2              = jo.value("aeff_cm2", 1e9);
    o.acceptance            = jo.value("acceptance", 1.0);
    o.acceptance_off        = jo.value("acceptance_off", 5.0);
    o.background_rate_per_s = jo.value("background_rate_per_s", 0.01);
    o.e_threshold_TeV       = jo.value("e_threshold_TeV", 0.0);
    o.tstart_s              = jo.value("tstart_s", 0.0);
    if (jo.contains("edisp") && !jo.at("edisp").is_null()) {
      const auto& je = jo.at("edisp");
      EDispJSON e;
      e.sigma = je.value("sigma", 0.1);
      e.bias  = je.value("bias", 0.0);
      o.edisp = e;
    }
    if (o.livetime_s <= 0.0)
      throw std::invalid_argument("observation " + o.name + ": livetime_s must be > 0");
    observations_.push_back(o);
  }
}

void ConfigManager::parse_source_(const nlohmann::json& j) {
  source_.type          = j.value("type", std::string("powerlaw"));
  source_.name          = j.value("name", std::string("source"));
  source_.index         = j.value("index", 2.0);
  source_.amplitude     = j.value("amplitude", 1e-12);
  source_.reference_TeV = j.value("reference_TeV", 1.0);
  source_.table_path    = j.value("table_path", std::string{});
  source_.norm          = j.value("norm", 1.0);

  if (source_.type != "powerlaw" && source_.type != "table")
    throw std::invalid_argument("source.type must be powerlaw/table");
  if (source_.type == "table" && source_.table_path.empty())
    throw std::invalid_argument("source.type=table needs source.table_path");
}

void ConfigManager::parse_stacking_(const nlohmann::json& j) {
  if (j.contains("inputs")) stacking_.inputs = j.at("inputs").get<std::vector<std::string>>();
  stacking_.output_name = j.value("output_name", std::string("stacked"));
  if (j.contains("resample_nbin") && !j.at("resample_nbin").is_null())
    stacking_.resample_nbin = j.at("resample_nbin").get<int>();
}

} // namespace specstack
