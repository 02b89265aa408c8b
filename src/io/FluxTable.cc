#include "specstack/io/FluxTable.hh"

#include <algorithm>
#include <cctype>
#include <cmath>
#include <fstream>
#include <functional>
#include <sstream>
#include <string>

namespace specstack {

namespace {

// Strip a trailing "#" comment; true if anything but blanks remains.
bool strip_comment(std::string& line) {
  const auto hash = line.find('#');
  if (hash != std::string::npos) line.erase(hash);
  return std::any_of(line.begin(), line.end(),
                     [](unsigned char c) { return !std::isspace(c); });
}

// First two numeric fields of a row, separated by commas and/or blanks.
bool read_row(std::string line, double& e, double& v) {
  std::replace(line.begin(), line.end(), ',', ' ');
  std::istringstream ss(line);
  return static_cast<bool>(ss >> e >> v);
}

} // namespace

bool FluxTable::LoadCSV(const std::string& path) {
  E_TeV_.clear();
  dnde_.clear();

  std::ifstream in(path);
  if (!in) return false;

  std::string line;
  bool header_done = false;
  while (std::getline(in, line)) {
    if (!strip_comment(line)) continue;
    if (!header_done) { header_done = true; continue; }
    double e = 0.0, v = 0.0;
    if (!read_row(line, e, v)) continue;
    E_TeV_.push_back(e);
    dnde_.push_back(v);
  }
  if (E_TeV_.size() < 2) return false;
  // energies must be strictly increasing
  return std::adjacent_find(E_TeV_.begin(), E_TeV_.end(),
                            std::greater_equal<double>()) == E_TeV_.end();
}

double FluxTable::Interpolate(double E_TeV) const {
  if (E_TeV_.size() < 2) return 0.0;
  if (E_TeV < E_TeV_.front() || E_TeV > E_TeV_.back()) return 0.0;

  auto it = std::upper_bound(E_TeV_.begin(), E_TeV_.end(), E_TeV);
  size_t hi = std::min(static_cast<size_t>(it - E_TeV_.begin()), E_TeV_.size() - 1);
  size_t lo = hi - 1;

  const double x0 = E_TeV_[lo], x1 = E_TeV_[hi];
  const double y0 = dnde_[lo],  y1 = dnde_[hi];
  if (y0 <= 0.0 || y1 <= 0.0 || x0 <= 0.0) {
    const double t = (E_TeV - x0) / (x1 - x0);
    return std::max(0.0, y0 + t * (y1 - y0));
  }
  const double t = std::log(E_TeV / x0) / std::log(x1 / x0);
  return std::exp(std::log(y0) + t * (std::log(y1) - std::log(y0)));
}

} // namespace specstack
