#include "specstack/response/EDispKernel.hh"
#include "specstack/spectrum/BinnedSpectrum.hh"
#include "specstack/spectrum/SpectrumMask.hh"

#include <TH2D.h>

#include <algorithm>
#include <atomic>
#include <cmath>
#include <stdexcept>
#include <string>
#include <utility>

namespace specstack {

namespace {

std::string next_matrix_name() {
  static std::atomic<unsigned long> counter{0};
  return "specstack_edisp" + std::to_string(counter++);
}

std::unique_ptr<TH2D> make_matrix(const EnergyAxis& e_true, const EnergyAxis& e_reco) {
  auto h = std::make_unique<TH2D>(next_matrix_name().c_str(),
                                  "Energy dispersion;E_{true} [TeV];E_{reco} [TeV]",
                                  static_cast<int>(e_true.nbin()), e_true.edges().data(),
                                  static_cast<int>(e_reco.nbin()), e_reco.edges().data());
  h->SetDirectory(nullptr);
  return h;
}

std::unique_ptr<TH2D> clone_matrix(const TH2D& src) {
  auto h = std::unique_ptr<TH2D>(static_cast<TH2D*>(src.Clone(next_matrix_name().c_str())));
  h->SetDirectory(nullptr);
  return h;
}

std::vector<double> axis_edges(const TAxis& ax) {
  const int nb = ax.GetNbins();
  std::vector<double> e(static_cast<std::size_t>(nb) + 1);
  for (int i = 1; i <= nb; ++i) e[i-1] = ax.GetBinLowEdge(i);
  e[nb] = ax.GetBinUpEdge(nb);
  return e;
}

double normal_cdf(double x) {
  return 0.5 * (1.0 + std::erf(x / std::sqrt(2.0)));
}

} // namespace

EDispKernel::EDispKernel(const EnergyAxis& e_true, const EnergyAxis& e_reco)
: e_true_(e_true), e_reco_(e_reco), h_(make_matrix(e_true_, e_reco_)) {}

EDispKernel::~EDispKernel() = default;

EDispKernel::EDispKernel(const EDispKernel& other)
: e_true_(other.e_true_), e_reco_(other.e_reco_), h_(clone_matrix(*other.h_)) {}

EDispKernel& EDispKernel::operator=(const EDispKernel& other) {
  if (this != &other) {
    e_true_ = other.e_true_;
    e_reco_ = other.e_reco_;
    h_ = clone_matrix(*other.h_);
  }
  return *this;
}

EDispKernel::EDispKernel(EDispKernel&& other) noexcept = default;
EDispKernel& EDispKernel::operator=(EDispKernel&& other) noexcept = default;

EDispKernel EDispKernel::FromDiagonalResponse(const EnergyAxis& e_true, const EnergyAxis& e_reco) {
  EDispKernel k(e_true, e_reco);
  for (std::size_t l = 0; l < e_true.nbin(); ++l) {
    const int ireco = e_reco.FindBin(e_true.center(l));
    if (ireco >= 0) k.set(l, static_cast<std::size_t>(ireco), 1.0);
  }
  return k;
}

EDispKernel EDispKernel::FromGauss(const EnergyAxis& e_true, const EnergyAxis& e_reco,
                                   double sigma, double bias) {
  if (!(sigma > 0.0)) throw std::invalid_argument("EDispKernel::FromGauss: sigma must be > 0");

  EDispKernel k(e_true, e_reco);
  for (std::size_t l = 0; l < e_true.nbin(); ++l) {
    const double E = e_true.center(l);
    for (std::size_t r = 0; r < e_reco.nbin(); ++r) {
      const double z1 = (std::log(e_reco.lo(r) / E) - bias) / sigma;
      const double z2 = (std::log(e_reco.hi(r) / E) - bias) / sigma;
      const double p = std::max(0.0, normal_cdf(z2) - normal_cdf(z1));
      // truncate the tails, they only cost bins
      if (p > 1e-12) k.set(l, r, p);
    }
  }
  return k;
}

EDispKernel EDispKernel::FromTH2D(const TH2D& h) {
  EDispKernel k(EnergyAxis(axis_edges(*h.GetXaxis()), "energy_true"),
                EnergyAxis(axis_edges(*h.GetYaxis()), "energy"));
  for (std::size_t l = 0; l < k.e_true_.nbin(); ++l) {
    for (std::size_t r = 0; r < k.e_reco_.nbin(); ++r) {
      const double p = h.GetBinContent(static_cast<int>(l) + 1, static_cast<int>(r) + 1);
      if (p < 0.0) throw std::invalid_argument("EDispKernel: negative matrix entry");
      k.set(l, r, p);
    }
  }
  return k;
}

double EDispKernel::operator()(std::size_t itrue, std::size_t ireco) const {
  return h_->GetBinContent(static_cast<int>(itrue) + 1, static_cast<int>(ireco) + 1);
}

void EDispKernel::set(std::size_t itrue, std::size_t ireco, double p) {
  if (itrue >= e_true_.nbin() || ireco >= e_reco_.nbin())
    throw std::out_of_range("EDispKernel::set: bin out of range");
  h_->SetBinContent(static_cast<int>(itrue) + 1, static_cast<int>(ireco) + 1, p);
}

double EDispKernel::RowSum(std::size_t itrue) const {
  double s = 0.0;
  for (std::size_t r = 0; r < e_reco_.nbin(); ++r) s += (*this)(itrue, r);
  return s;
}

BinnedSpectrum EDispKernel::Apply(const BinnedSpectrum& npred_true) const {
  if (!npred_true.axis().IsCompatible(e_true_))
    throw std::invalid_argument("EDispKernel::Apply: input is not on the true-energy axis");

  std::vector<double> out(e_reco_.nbin(), 0.0);
  for (std::size_t l = 0; l < e_true_.nbin(); ++l) {
    const double n = npred_true[l];
    if (n == 0.0) continue;
    for (std::size_t r = 0; r < e_reco_.nbin(); ++r) out[r] += n * (*this)(l, r);
  }
  return BinnedSpectrum(e_reco_, out, npred_true.unit());
}

EDispKernel EDispKernel::ResampleRecoAxis(const EnergyAxis& new_reco,
                                          const SpectrumMask& weights) const {
  if (!weights.axis().IsCompatible(e_reco_))
    throw std::invalid_argument("EDispKernel::ResampleRecoAxis: mask is not on the reco axis");
  const auto groups = e_reco_.GroupIndices(new_reco);

  EDispKernel out(e_true_, new_reco);
  for (std::size_t l = 0; l < e_true_.nbin(); ++l) {
    for (std::size_t r = 0; r < e_reco_.nbin(); ++r) {
      if (!weights[r]) continue;
      out.set(l, groups[r], out(l, groups[r]) + (*this)(l, r));
    }
  }
  return out;
}

EDispKernel EDispKernel::SliceRecoByIdx(std::size_t start, std::size_t stop) const {
  EDispKernel out(e_true_, e_reco_.Slice(start, stop));
  for (std::size_t l = 0; l < e_true_.nbin(); ++l) {
    for (std::size_t r = start; r < stop; ++r) out.set(l, r - start, (*this)(l, r));
  }
  return out;
}

} // namespace specstack
