// Created 09-Oct-2026 by David Kirkby (University of California, Irvine) <dkirkby@uci.edu>

#ifndef WCOSMO_PRESETS
#define WCOSMO_PRESETS

#include "wcosmo/FlatwCDM.h"

#include <string>
#include <vector>

namespace wcosmo {

    // Flat LambdaCDM cosmologies from published CMB analyses. Each has a "reference"
    // entry in its metadata.
    extern FlatwCDM const Planck13;
    extern FlatwCDM const Planck15;
    extern FlatwCDM const Planck18;
    extern FlatwCDM const WMAP1;
    extern FlatwCDM const WMAP3;
    extern FlatwCDM const WMAP5;
    extern FlatwCDM const WMAP7;
    extern FlatwCDM const WMAP9;

    // Returns a pointer to the preset with the specified name, or zero if there is
    // no such preset.
    FlatwCDM const *findPreset(std::string const &name);

    // Returns the preset with the specified name. Throws a RuntimeError if there is
    // no such preset.
    FlatwCDM const &getPreset(std::string const &name);

    // Creates a new cosmology using the named model, which must be "FlatwCDM" or
    // "FlatLambdaCDM". Throws a RuntimeError for any other model name or for a
    // FlatLambdaCDM model with w0 != -1.
    FlatwCDM createModel(std::string const &model, double H0, double Om0, double w0 = -1,
        double zmin = 1e-4, double zmax = 100, std::string const &name = "");

    // Returns true if name is a preset or model name.
    bool isAvailable(std::string const &name);

    // Returns the names of all presets followed by the model names.
    std::vector<std::string> getAvailableNames();

} // wcosmo

#endif // WCOSMO_PRESETS
