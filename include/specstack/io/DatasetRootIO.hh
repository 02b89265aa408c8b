#pragma once
#include <string>

#include "specstack/datasets/SpectrumDatasetOnOff.hh"

namespace specstack {

/**
 * Four ROOT files per on/off dataset, side by side in one directory and
 * keyed by the dataset name:
 *
 *   pha_obs<name>.root  counts (TH1D), quality (TH1D, 1 = outside the safe
 *                       range), backscal (TH1D, acceptance), gti_start /
 *                       gti_stop (TVectorD, s), reference_time and obs_id
 *                       (TNamed), livetime (TParameter<double>, s)
 *   bkg_obs<name>.root  counts_off (TH1D), backscal (TH1D, acceptance_off)
 *   arf_obs<name>.root  specresp (TH1D, exposure / livetime, cm2),
 *                       livetime (TParameter<double>, s)
 *   rmf_obs<name>.root  matrix (TH2D, x = true energy, y = reco energy)
 *
 * The rmf file is only written when the dataset has an energy dispersion.
 * On read, a missing bkg or rmf file leaves that component unset.
 */
class DatasetRootIO {
public:
  explicit DatasetRootIO(int verbosity = 1) : verbosity_(verbosity) {}

  static std::string PhaFileName(const std::string& name) { return "pha_obs" + name + ".root"; }
  static std::string BkgFileName(const std::string& name) { return "bkg_obs" + name + ".root"; }
  static std::string ArfFileName(const std::string& name) { return "arf_obs" + name + ".root"; }
  static std::string RmfFileName(const std::string& name) { return "rmf_obs" + name + ".root"; }

  /// Throws std::runtime_error without a livetime, or if a target file
  /// exists and overwrite is false.
  void Write(const SpectrumDatasetOnOff& dataset, const std::string& outdir,
             bool overwrite = false) const;

  /// Reads the pha file and its companions from the same directory.
  SpectrumDatasetOnOff ReadOnOff(const std::string& pha_path) const;

private:
  int verbosity_;
};

} // namespace specstack
