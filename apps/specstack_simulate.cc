#include <filesystem>
#include <iostream>
#include <memory>
#include <optional>
#include <string>
#include <vector>

#include "specstack/io/ConfigManager.hh"
#include "specstack/io/DatasetRootIO.hh"
#include "specstack/datasets/SpectrumDatasetOnOff.hh"
#include "specstack/model/TabulatedSpectralModel.hh"
#include "specstack/sim/PoissonFaker.hh"

using namespace specstack;

static std::shared_ptr<SourceModel> MakeSource(const SourceJSON& s) {
  std::shared_ptr<SpectralModel> spectral;
  if (s.type == "table") {
    spectral = std::make_shared<TabulatedSpectralModel>(s.table_path);
    spectral->parameter("norm").value = s.norm;
  } else {
    spectral = std::make_shared<PowerLawSpectralModel>(s.index, s.amplitude * s.norm, s.reference_TeV);
  }
  return std::make_shared<SourceModel>(s.name, spectral);
}

// Flat effective area times livetime, energy dispersion from the config,
// safe range above the threshold and a flat-per-bin background template.
static SpectrumDataset MakeObservation(const ObservationJSON& o, const AxesJSON& axes) {
  const EnergyAxis e_reco = axes.e_reco.Build("energy");
  const EnergyAxis e_true = axes.e_true ? axes.e_true->Build("energy_true")
                                        : e_reco.Copy("energy_true");

  SpectrumDataset ds = SpectrumDataset::Create(e_reco, e_true, o.name);

  BinnedSpectrum exposure(e_true, "cm2 s", o.aeff_cm2 * o.livetime_s);
  std::optional<EDispKernel> edisp;
  if (o.edisp) edisp = EDispKernel::FromGauss(e_true, e_reco, o.edisp->sigma, o.edisp->bias);
  else         edisp = EDispKernel::FromDiagonalResponse(e_true, e_reco);
  ds.set_response(ResponseKernel(exposure, edisp, o.livetime_s));

  std::vector<bool> safe(e_reco.nbin());
  for (std::size_t k = 0; k < e_reco.nbin(); ++k) safe[k] = e_reco.lo(k) >= o.e_threshold_TeV;
  ds.set_mask_safe(SpectrumMask(e_reco, safe));

  GoodTimeIntervals gti;
  gti.Add(o.tstart_s, o.tstart_s + o.livetime_s);
  ds.set_gti(gti);

  const double per_bin = o.background_rate_per_s * o.livetime_s / static_cast<double>(e_reco.nbin());
  ds.set_background_model(BackgroundModel(BinnedSpectrum(e_reco, "", per_bin)));
  return ds;
}

int main(int argc, char** argv) {
  if (argc < 2) {
    std::cerr << "Usage: " << argv[0] << " <config.json>\n";
    return 1;
  }

  try {
    ConfigManager cfg(argv[1]);
    cfg.parse();
    const RunHeader& run = cfg.run();

    std::string outdir = run.outdir;
    if (outdir.empty())
      outdir = "outputs/" + (run.label.empty() ? std::string("unnamed") : run.label);
    std::filesystem::create_directories(outdir);

    if (run.verbosity > 0) {
      std::cout << "[specstack] label=" << run.label << " outdir='" << outdir
                << "' seed=" << run.rng_seed << "\n";
    }
    if (cfg.observations().empty()) {
      std::cerr << "[specstack] WARNING: no observations in config, nothing to simulate\n";
      return 0;
    }

    const auto source = MakeSource(cfg.source());
    PoissonFaker faker(run.rng_seed);
    DatasetRootIO io(run.verbosity);

    for (const auto& o : cfg.observations()) {
      SpectrumDataset ds = MakeObservation(o, cfg.axes());
      ds.models().Add(source);

      const BackgroundModel bkg = *ds.background_model();
      SpectrumDatasetOnOff onoff =
          SpectrumDatasetOnOff::FromSpectrumDataset(ds, o.acceptance, o.acceptance_off);
      onoff.Fake(bkg, faker.rng());

      io.Write(onoff, outdir, /*overwrite=*/true);

      if (run.verbosity > 0) {
        const DatasetInfo info = onoff.Info();
        std::cout << "[specstack] " << o.name
                  << "  n_on=" << info.n_on
                  << "  n_off=" << info.n_off.value_or(0.0)
                  << "  excess=" << info.excess
                  << "  sqrt_ts=" << info.significance << "\n";
      }
      if (run.verbosity > 1) std::cout << onoff.ToString() << "\n";
    }
    return 0;
  } catch (const std::exception& e) {
    std::cerr << "ERROR: " << e.what() << "\n";
    return 1;
  }
}
