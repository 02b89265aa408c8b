#include <filesystem>
#include <iostream>
#include <stdexcept>
#include <string>
#include <vector>

#include "specstack/io/ConfigManager.hh"
#include "specstack/io/DatasetRootIO.hh"
#include "specstack/datasets/SpectrumDatasetOnOff.hh"

using namespace specstack;

// Coarse axis made of every n-th edge of fine; nbin must divide the fine binning.
static EnergyAxis GroupedAxis(const EnergyAxis& fine, int nbin) {
  if (nbin < 1 || fine.nbin() % static_cast<std::size_t>(nbin) != 0) {
    throw std::invalid_argument("resample_nbin=" + std::to_string(nbin) +
                                " does not divide the " + std::to_string(fine.nbin()) + " input bins");
  }
  const std::size_t step = fine.nbin() / static_cast<std::size_t>(nbin);
  std::vector<double> edges;
  for (std::size_t i = 0; i <= fine.nbin(); i += step) edges.push_back(fine.edges()[i]);
  return EnergyAxis(edges, fine.name());
}

int main(int argc, char** argv) {
  if (argc < 2) {
    std::cerr << "Usage: " << argv[0] << " <config.json> [pha_file ...]\n";
    return 1;
  }

  try {
    ConfigManager cfg(argv[1]);
    cfg.parse();
    const RunHeader& run = cfg.run();
    const StackingJSON& st = cfg.stacking();

    // inputs on the command line take precedence over the config
    std::vector<std::string> inputs;
    for (int i = 2; i < argc; ++i) inputs.emplace_back(argv[i]);
    if (inputs.empty()) inputs = st.inputs;
    if (inputs.empty()) {
      std::cerr << "ERROR: no input datasets (stacking.inputs is empty)\n";
      return 1;
    }

    DatasetRootIO io(run.verbosity);
    SpectrumDatasetOnOff stacked = io.ReadOnOff(inputs.front());
    if (run.verbosity > 0) {
      std::cout << "[stack] start from '" << stacked.name() << "' (" << inputs.front() << ")\n";
    }
    for (std::size_t i = 1; i < inputs.size(); ++i) {
      const SpectrumDatasetOnOff ds = io.ReadOnOff(inputs[i]);
      if (run.verbosity > 0) std::cout << "[stack] + '" << ds.name() << "'\n";
      stacked.Stack(ds);
    }

    SpectrumDatasetOnOff out = [&] {
      if (!st.resample_nbin)
        return stacked.SliceByIdx(0, stacked.AnalysisAxis().nbin(), st.output_name);
      const EnergyAxis coarse = GroupedAxis(stacked.AnalysisAxis(), *st.resample_nbin);
      if (run.verbosity > 0)
        std::cout << "[stack] resampling to " << *st.resample_nbin << " bins\n";
      return stacked.ResampleEnergyAxis(coarse, st.output_name);
    }();

    std::string outdir = run.outdir;
    if (outdir.empty())
      outdir = "outputs/" + (run.label.empty() ? std::string("unnamed") : run.label);
    std::filesystem::create_directories(outdir);
    io.Write(out, outdir, /*overwrite=*/true);

    if (run.verbosity > 0) std::cout << out.ToString() << "\n";
    return 0;
  } catch (const std::exception& e) {
    std::cerr << "ERROR: " << e.what() << "\n";
    return 1;
  }
}
