#include "specstack/io/DatasetRootIO.hh"

#include <filesystem>
#include <iostream>
#include <memory>
#include <optional>
#include <stdexcept>
#include <vector>

#include <TFile.h>
#include <TH1D.h>
#include <TH2D.h>
#include <TNamed.h>
#include <TParameter.h>
#include <TVectorD.h>

namespace specstack {

namespace fs = std::filesystem;

namespace {

std::unique_ptr<TFile> open_file(const fs::path& path, const char* mode) {
  std::unique_ptr<TFile> f(TFile::Open(path.string().c_str(), mode));
  if (!f || f->IsZombie()) {
    throw std::runtime_error(std::string("DatasetRootIO: cannot open ") + path.string());
  }
  return f;
}

// Histograms stay owned by the file; the copy made here outlives it.
BinnedSpectrum read_spectrum(TFile& f, const char* key, const std::string& unit,
                             const std::string& axis_name) {
  auto* h = dynamic_cast<TH1D*>(f.Get(key));
  if (!h) {
    throw std::runtime_error(std::string("DatasetRootIO: '") + key + "' not found in " + f.GetName());
  }
  return BinnedSpectrum::FromTH1D(*h, unit, axis_name);
}

// Non-histogram objects read from a file belong to the caller.
template <typename T>
std::unique_ptr<T> read_object(TFile& f, const char* key) {
  std::unique_ptr<T> obj(dynamic_cast<T*>(f.Get(key)));
  if (!obj) {
    throw std::runtime_error(std::string("DatasetRootIO: '") + key + "' not found in " + f.GetName());
  }
  return obj;
}

double read_livetime(TFile& f) {
  return read_object<TParameter<double>>(f, "livetime")->GetVal();
}

void check_writable(const fs::path& p, bool overwrite) {
  if (!overwrite && fs::exists(p)) {
    throw std::runtime_error("DatasetRootIO: " + p.string() + " exists and overwrite is false");
  }
}

void write_livetime(double livetime_s) {
  TParameter<double> lt("livetime", livetime_s);
  lt.Write();
}

} // namespace

void DatasetRootIO::Write(const SpectrumDatasetOnOff& ds, const std::string& outdir,
                          bool overwrite) const {
  const std::string& name = ds.name();
  const std::optional<double> livetime = ds.Livetime();
  if (!livetime) {
    throw std::runtime_error("DatasetRootIO: dataset '" + name + "' has no livetime, cannot write");
  }
  if (!ds.counts()) throw std::runtime_error("DatasetRootIO: dataset '" + name + "' has no counts");
  if (!ds.response()) throw std::runtime_error("DatasetRootIO: dataset '" + name + "' has no response");

  const fs::path dir(outdir.empty() ? "." : outdir);
  fs::create_directories(dir);

  const fs::path pha = dir / PhaFileName(name);
  const fs::path bkg = dir / BkgFileName(name);
  const fs::path arf = dir / ArfFileName(name);
  const fs::path rmf = dir / RmfFileName(name);
  for (const auto& p : {pha, bkg, arf, rmf}) check_writable(p, overwrite);

  // ---- pha
  {
    auto f = open_file(pha, "RECREATE");
    ds.counts()->hist().Write("counts");

    const SpectrumMask safe = ds.mask_safe();
    BinnedSpectrum quality(safe.axis());
    for (std::size_t k = 0; k < safe.nbin(); ++k) quality.set(k, safe[k] ? 0.0 : 1.0);
    quality.hist().Write("quality");

    if (ds.acceptance()) ds.acceptance()->hist().Write("backscal");

    const GoodTimeIntervals gti = ds.gti() ? *ds.gti() : GoodTimeIntervals();
    TVectorD start(static_cast<int>(gti.size())), stop(static_cast<int>(gti.size()));
    for (std::size_t i = 0; i < gti.size(); ++i) {
      start[static_cast<int>(i)] = gti.intervals()[i].start_s;
      stop[static_cast<int>(i)]  = gti.intervals()[i].stop_s;
    }
    start.Write("gti_start");
    stop.Write("gti_stop");
    TNamed ref("reference_time", gti.reference_time().c_str());
    ref.Write();

    TNamed obs("obs_id", name.c_str());
    obs.Write();
    write_livetime(*livetime);
    f->Close();
  }

  // ---- bkg
  if (ds.counts_off()) {
    auto f = open_file(bkg, "RECREATE");
    ds.counts_off()->hist().Write("counts_off");
    if (ds.acceptance_off()) ds.acceptance_off()->hist().Write("backscal");
    f->Close();
  } else if (verbosity_ > 0) {
    std::cerr << "[io] WARNING: dataset '" << name << "' has no counts_off, skipping "
              << bkg.string() << "\n";
  }

  // ---- arf
  {
    auto f = open_file(arf, "RECREATE");
    BinnedSpectrum specresp = ds.response()->exposure();
    if (*livetime > 0.0) specresp /= *livetime;
    specresp.hist().Write("specresp");
    write_livetime(*livetime);
    f->Close();
  }

  // ---- rmf
  if (ds.response()->edisp()) {
    auto f = open_file(rmf, "RECREATE");
    ds.response()->edisp()->hist().Write("matrix");
    f->Close();
  }

  if (verbosity_ > 0) {
    std::cout << "[io] Wrote dataset '" << name << "' to " << dir.string() << "\n";
  }
}

SpectrumDatasetOnOff DatasetRootIO::ReadOnOff(const std::string& pha_path) const {
  const fs::path pha(pha_path);
  if (!fs::exists(pha)) throw std::runtime_error("DatasetRootIO: cannot find " + pha.string());

  std::string name;
  std::optional<BinnedSpectrum> counts, quality, acceptance;
  std::optional<GoodTimeIntervals> gti;
  double livetime = 0.0;
  {
    auto f = open_file(pha, "READ");
    name = read_object<TNamed>(*f, "obs_id")->GetTitle();
    counts  = read_spectrum(*f, "counts", "", "energy");
    quality = read_spectrum(*f, "quality", "", "energy");
    if (f->GetKey("backscal")) acceptance = read_spectrum(*f, "backscal", "", "energy");

    auto start = read_object<TVectorD>(*f, "gti_start");
    auto stop  = read_object<TVectorD>(*f, "gti_stop");
    if (start->GetNrows() != stop->GetNrows()) {
      throw std::runtime_error("DatasetRootIO: gti_start / gti_stop sizes differ in " + pha.string());
    }
    std::string reference_time = "2000-01-01";
    if (f->GetKey("reference_time")) {
      reference_time = read_object<TNamed>(*f, "reference_time")->GetTitle();
    }
    gti = GoodTimeIntervals(reference_time);
    for (int i = 0; i < start->GetNrows(); ++i) gti->Add((*start)[i], (*stop)[i]);

    livetime = read_livetime(*f);
  }

  SpectrumDatasetOnOff ds(name);
  ds.set_counts(std::move(counts));
  std::vector<bool> safe(quality->nbin());
  for (std::size_t k = 0; k < quality->nbin(); ++k) safe[k] = (*quality)[k] == 0.0;
  ds.set_mask_safe(SpectrumMask(quality->axis(), safe));
  if (acceptance) ds.set_acceptance(std::move(acceptance));
  ds.set_gti(std::move(gti));

  const fs::path dir = pha.parent_path();

  const fs::path bkg = dir / BkgFileName(name);
  if (fs::exists(bkg)) {
    auto f = open_file(bkg, "READ");
    ds.set_counts_off(read_spectrum(*f, "counts_off", "", "energy"));
    if (f->GetKey("backscal")) ds.set_acceptance_off(read_spectrum(*f, "backscal", "", "energy"));
  } else {
    std::cerr << "[io] WARNING: no background file " << bkg.string()
              << ", counts_off left unset\n";
  }

  const fs::path arf = dir / ArfFileName(name);
  if (!fs::exists(arf)) throw std::runtime_error("DatasetRootIO: cannot find " + arf.string());
  std::optional<BinnedSpectrum> exposure;
  {
    auto f = open_file(arf, "READ");
    exposure = read_spectrum(*f, "specresp", "cm2", "energy_true");
    livetime = read_livetime(*f);
  }
  *exposure *= livetime;
  exposure->set_unit("cm2 s");

  std::optional<EDispKernel> edisp;
  const fs::path rmf = dir / RmfFileName(name);
  if (fs::exists(rmf)) {
    auto f = open_file(rmf, "READ");
    auto* h = dynamic_cast<TH2D*>(f->Get("matrix"));
    if (!h) throw std::runtime_error("DatasetRootIO: 'matrix' not found in " + rmf.string());
    edisp = EDispKernel::FromTH2D(*h);
  } else {
    std::cerr << "[io] WARNING: no response matrix file " << rmf.string()
              << ", edisp left unset\n";
  }

  ds.set_response(ResponseKernel(std::move(*exposure), std::move(edisp), livetime));

  if (verbosity_ > 1) {
    std::cout << "[io] Read dataset '" << name << "' from " << pha.string() << "\n";
  }
  return ds;
}

} // namespace specstack
