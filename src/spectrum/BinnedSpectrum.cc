#include "specstack/spectrum/BinnedSpectrum.hh"
#include "specstack/spectrum/SpectrumMask.hh"

#include <TH1D.h>

#include <atomic>
#include <cmath>
#include <stdexcept>
#include <string>
#include <utility>

namespace specstack {

namespace {

std::string next_hist_name() {
  static std::atomic<unsigned long> counter{0};
  return "specstack_h" + std::to_string(counter++);
}

std::unique_ptr<TH1D> make_hist(const EnergyAxis& axis) {
  const auto& e = axis.edges();
  auto h = std::make_unique<TH1D>(next_hist_name().c_str(), ";E [TeV];",
                                  static_cast<int>(axis.nbin()), e.data());
  h->SetDirectory(nullptr);
  return h;
}

std::unique_ptr<TH1D> clone_hist(const TH1D& src) {
  auto h = std::unique_ptr<TH1D>(static_cast<TH1D*>(src.Clone(next_hist_name().c_str())));
  h->SetDirectory(nullptr);
  return h;
}

// unit of a product / quotient; "" is dimensionless
std::string product_unit(const std::string& a, const std::string& b) {
  if (a.empty()) return b;
  if (b.empty()) return a;
  return a + " " + b;
}

std::string quotient_unit(const std::string& a, const std::string& b) {
  if (a == b) return "";
  if (b.empty()) return a;
  return (a.empty() ? std::string("1") : a) + " / " + b;
}

} // namespace

BinnedSpectrum::BinnedSpectrum(const EnergyAxis& axis, std::string unit, double fill)
: axis_(axis), unit_(std::move(unit)), h_(make_hist(axis_))
{
  if (fill != 0.0) {
    for (std::size_t i = 0; i < nbin(); ++i) h_->SetBinContent(static_cast<int>(i) + 1, fill);
  }
}

BinnedSpectrum::BinnedSpectrum(const EnergyAxis& axis, const std::vector<double>& values,
                               std::string unit)
: axis_(axis), unit_(std::move(unit)), h_(make_hist(axis_))
{
  if (values.size() != nbin())
    throw std::invalid_argument("BinnedSpectrum: value count does not match axis");
  for (std::size_t i = 0; i < nbin(); ++i) h_->SetBinContent(static_cast<int>(i) + 1, values[i]);
}

BinnedSpectrum::~BinnedSpectrum() = default;

BinnedSpectrum::BinnedSpectrum(const BinnedSpectrum& other)
: axis_(other.axis_), unit_(other.unit_), h_(clone_hist(*other.h_)) {}

BinnedSpectrum& BinnedSpectrum::operator=(const BinnedSpectrum& other) {
  if (this != &other) {
    axis_ = other.axis_;
    unit_ = other.unit_;
    h_ = clone_hist(*other.h_);
  }
  return *this;
}

BinnedSpectrum::BinnedSpectrum(BinnedSpectrum&& other) noexcept = default;
BinnedSpectrum& BinnedSpectrum::operator=(BinnedSpectrum&& other) noexcept = default;

BinnedSpectrum BinnedSpectrum::FromTH1D(const TH1D& h, std::string unit,
                                        const std::string& axis_name) {
  const int nb = h.GetNbinsX();
  std::vector<double> edges(static_cast<std::size_t>(nb) + 1);
  for (int i = 1; i <= nb; ++i) edges[i-1] = h.GetXaxis()->GetBinLowEdge(i);
  edges[nb] = h.GetXaxis()->GetBinUpEdge(nb);

  BinnedSpectrum s(EnergyAxis(std::move(edges), axis_name), std::move(unit));
  for (int i = 1; i <= nb; ++i) s.h_->SetBinContent(i, h.GetBinContent(i));
  return s;
}

double BinnedSpectrum::operator[](std::size_t i) const {
  return h_->GetBinContent(static_cast<int>(i) + 1);
}

double BinnedSpectrum::at(std::size_t i) const {
  if (i >= nbin()) throw std::out_of_range("BinnedSpectrum::at: bin out of range");
  return (*this)[i];
}

void BinnedSpectrum::set(std::size_t i, double v) {
  if (i >= nbin()) throw std::out_of_range("BinnedSpectrum::set: bin out of range");
  h_->SetBinContent(static_cast<int>(i) + 1, v);
}

std::vector<double> BinnedSpectrum::values() const {
  std::vector<double> v(nbin());
  for (std::size_t i = 0; i < nbin(); ++i) v[i] = (*this)[i];
  return v;
}

void BinnedSpectrum::check_axis_(const EnergyAxis& other, const char* where) const {
  if (!axis_.IsCompatible(other))
    throw std::invalid_argument(std::string("BinnedSpectrum::") + where + ": incompatible energy axes");
}

double BinnedSpectrum::Sum() const {
  double s = 0.0;
  for (std::size_t i = 0; i < nbin(); ++i) s += (*this)[i];
  return s;
}

double BinnedSpectrum::Sum(const SpectrumMask& mask) const {
  check_axis_(mask.axis(), "Sum");
  double s = 0.0;
  for (std::size_t i = 0; i < nbin(); ++i) if (mask[i]) s += (*this)[i];
  return s;
}

BinnedSpectrum& BinnedSpectrum::operator+=(const BinnedSpectrum& other) {
  check_axis_(other.axis_, "operator+=");
  if (unit_ != other.unit_)
    throw std::invalid_argument("BinnedSpectrum::operator+=: unit mismatch ('" + unit_ + "' vs '" + other.unit_ + "')");
  for (std::size_t i = 0; i < nbin(); ++i) set(i, (*this)[i] + other[i]);
  return *this;
}

BinnedSpectrum& BinnedSpectrum::operator-=(const BinnedSpectrum& other) {
  check_axis_(other.axis_, "operator-=");
  if (unit_ != other.unit_)
    throw std::invalid_argument("BinnedSpectrum::operator-=: unit mismatch ('" + unit_ + "' vs '" + other.unit_ + "')");
  for (std::size_t i = 0; i < nbin(); ++i) set(i, (*this)[i] - other[i]);
  return *this;
}

BinnedSpectrum& BinnedSpectrum::operator*=(const BinnedSpectrum& other) {
  check_axis_(other.axis_, "operator*=");
  for (std::size_t i = 0; i < nbin(); ++i) set(i, (*this)[i] * other[i]);
  unit_ = product_unit(unit_, other.unit_);
  return *this;
}

BinnedSpectrum& BinnedSpectrum::operator/=(const BinnedSpectrum& other) {
  check_axis_(other.axis_, "operator/=");
  for (std::size_t i = 0; i < nbin(); ++i) set(i, (*this)[i] / other[i]);
  unit_ = quotient_unit(unit_, other.unit_);
  return *this;
}

BinnedSpectrum& BinnedSpectrum::operator*=(double c) {
  for (std::size_t i = 0; i < nbin(); ++i) set(i, (*this)[i] * c);
  return *this;
}

BinnedSpectrum& BinnedSpectrum::operator/=(double c) {
  for (std::size_t i = 0; i < nbin(); ++i) set(i, (*this)[i] / c);
  return *this;
}

BinnedSpectrum& BinnedSpectrum::operator*=(const SpectrumMask& mask) {
  check_axis_(mask.axis(), "operator*=");
  for (std::size_t i = 0; i < nbin(); ++i) if (!mask[i]) set(i, 0.0);
  return *this;
}

void BinnedSpectrum::Stack(const BinnedSpectrum& other) {
  *this += other;
}

void BinnedSpectrum::Stack(const BinnedSpectrum& other, const SpectrumMask& weights) {
  check_axis_(other.axis_, "Stack");
  check_axis_(weights.axis(), "Stack");
  if (unit_ != other.unit_)
    throw std::invalid_argument("BinnedSpectrum::Stack: unit mismatch ('" + unit_ + "' vs '" + other.unit_ + "')");
  for (std::size_t i = 0; i < nbin(); ++i) {
    if (weights[i]) set(i, (*this)[i] + other[i]);
  }
}

BinnedSpectrum BinnedSpectrum::ResampleAxis(const EnergyAxis& new_axis) const {
  return ResampleAxis(new_axis, SpectrumMask::Full(axis_));
}

BinnedSpectrum BinnedSpectrum::ResampleAxis(const EnergyAxis& new_axis,
                                            const SpectrumMask& weights) const {
  check_axis_(weights.axis(), "ResampleAxis");
  const auto groups = axis_.GroupIndices(new_axis);
  BinnedSpectrum out(new_axis, unit_);
  for (std::size_t i = 0; i < nbin(); ++i) {
    if (!weights[i]) continue;
    out.set(groups[i], out[groups[i]] + (*this)[i]);
  }
  return out;
}

BinnedSpectrum BinnedSpectrum::SliceByIdx(std::size_t start, std::size_t stop) const {
  BinnedSpectrum out(axis_.Slice(start, stop), unit_);
  for (std::size_t i = start; i < stop; ++i) out.set(i - start, (*this)[i]);
  return out;
}

void BinnedSpectrum::NanToNum() {
  for (std::size_t i = 0; i < nbin(); ++i) {
    if (!std::isfinite((*this)[i])) set(i, 0.0);
  }
}

BinnedSpectrum operator+(BinnedSpectrum a, const BinnedSpectrum& b) { a += b; return a; }
BinnedSpectrum operator-(BinnedSpectrum a, const BinnedSpectrum& b) { a -= b; return a; }
BinnedSpectrum operator*(BinnedSpectrum a, const BinnedSpectrum& b) { a *= b; return a; }
BinnedSpectrum operator/(BinnedSpectrum a, const BinnedSpectrum& b) { a /= b; return a; }
BinnedSpectrum operator*(BinnedSpectrum a, double c) { a *= c; return a; }
BinnedSpectrum operator*(double c, BinnedSpectrum a) { a *= c; return a; }
BinnedSpectrum operator/(BinnedSpectrum a, double c) { a /= c; return a; }
BinnedSpectrum operator*(BinnedSpectrum a, const SpectrumMask& mask) { a *= mask; return a; }

} // namespace specstack
