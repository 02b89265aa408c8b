#include "specstack/axis/EnergyAxis.hh"

#include <algorithm>
#include <cmath>
#include <stdexcept>
#include <utility>

namespace specstack {

namespace {

inline bool same_edge(double a, double b) {
  return std::fabs(a - b) <= 1e-9 * std::max(std::fabs(a), std::fabs(b));
}

} // namespace

EnergyAxis::EnergyAxis(std::vector<double> edges_TeV, std::string name)
: edges_(std::move(edges_TeV)), name_(std::move(name))
{
  if (edges_.size() < 2)
    throw std::invalid_argument("EnergyAxis: need at least two edges");
  for (std::size_t i = 1; i < edges_.size(); ++i) {
    if (!(edges_[i] > edges_[i-1]))
      throw std::invalid_argument("EnergyAxis: edges must be strictly increasing");
  }
}

EnergyAxis EnergyAxis::FromEnergyBounds(double emin_TeV, double emax_TeV, int nbin,
                                        const std::string& name) {
  if (nbin <= 0) throw std::invalid_argument("EnergyAxis: nbin must be > 0");
  if (!(emin_TeV > 0.0) || !(emax_TeV > emin_TeV))
    throw std::invalid_argument("EnergyAxis: need 0 < emin < emax");

  std::vector<double> edges(static_cast<std::size_t>(nbin) + 1);
  const double lmin = std::log10(emin_TeV);
  const double step = (std::log10(emax_TeV) - lmin) / nbin;
  for (int i = 0; i <= nbin; ++i) edges[i] = std::pow(10.0, lmin + i * step);
  // pin the ends so that squashed / sliced axes line up exactly
  edges.front() = emin_TeV;
  edges.back()  = emax_TeV;
  return EnergyAxis(std::move(edges), name);
}

double EnergyAxis::center(std::size_t i) const {
  return std::sqrt(lo(i) * hi(i));
}

int EnergyAxis::FindBin(double e_TeV) const {
  if (e_TeV < edges_.front() || e_TeV >= edges_.back()) return -1;
  auto it = std::upper_bound(edges_.begin(), edges_.end(), e_TeV);
  return static_cast<int>(it - edges_.begin()) - 1;
}

EnergyAxis EnergyAxis::Squash() const {
  return EnergyAxis({edges_.front(), edges_.back()}, name_);
}

EnergyAxis EnergyAxis::Slice(std::size_t start, std::size_t stop) const {
  if (stop > nbin() || start >= stop)
    throw std::invalid_argument("EnergyAxis::Slice: bad bin range");
  std::vector<double> e(edges_.begin() + start, edges_.begin() + stop + 1);
  return EnergyAxis(std::move(e), name_);
}

EnergyAxis EnergyAxis::Copy(const std::string& name) const {
  return EnergyAxis(edges_, name);
}

std::vector<std::size_t> EnergyAxis::GroupIndices(const EnergyAxis& coarse) const {
  const auto& ce = coarse.edges();
  if (!same_edge(ce.front(), edges_.front()) || !same_edge(ce.back(), edges_.back()))
    throw std::invalid_argument("EnergyAxis::GroupIndices: axes do not span the same range");

  std::vector<std::size_t> idx(nbin());
  std::size_t k = 0;  // current coarse bin
  for (std::size_t i = 0; i < nbin(); ++i) {
    if (k + 1 < ce.size() - 1 && same_edge(edges_[i], ce[k + 1])) ++k;
    idx[i] = k;
  }

  // every coarse edge must be hit exactly
  for (std::size_t c = 1; c + 1 < ce.size(); ++c) {
    const bool found = std::any_of(edges_.begin(), edges_.end(),
                                   [&](double e) { return same_edge(e, ce[c]); });
    if (!found)
      throw std::invalid_argument("EnergyAxis::GroupIndices: coarse edge is not a fine edge");
  }
  return idx;
}

} // namespace specstack
