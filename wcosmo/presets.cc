// Created 09-Oct-2026 by David Kirkby (University of California, Irvine) <dkirkby@uci.edu>

#include "wcosmo/presets.h"
#include "wcosmo/RuntimeError.h"

#include <map>

namespace local = wcosmo;

namespace {
    wcosmo::Metadata reference(std::string const &citation) {
        wcosmo::Metadata meta;
        meta["reference"] = citation;
        return meta;
    }
    char const *modelNames[] = { "FlatwCDM", "FlatLambdaCDM" };
    int const nModels(2);
}

local::FlatwCDM const local::Planck13(createFlatLambdaCDM(67.77,0.30712,1e-4,100,"Planck13",
    reference("Planck Collaboration 2014, A&A, 571, A16 (Paper XVI)")));
local::FlatwCDM const local::Planck15(createFlatLambdaCDM(67.74,0.3075,1e-4,100,"Planck15",
    reference("Planck Collaboration 2016, A&A, 594, A13 (Paper XIII)")));
local::FlatwCDM const local::Planck18(createFlatLambdaCDM(67.66,0.30966,1e-4,100,"Planck18",
    reference("Planck Collaboration 2020, A&A, 641, A6 (Paper VI)")));
local::FlatwCDM const local::WMAP1(createFlatLambdaCDM(72.0,0.257,1e-4,100,"WMAP1",
    reference("Spergel et al. 2003, ApJS, 148, 175")));
local::FlatwCDM const local::WMAP3(createFlatLambdaCDM(70.1,0.276,1e-4,100,"WMAP3",
    reference("Spergel et al. 2007, ApJS, 170, 377")));
local::FlatwCDM const local::WMAP5(createFlatLambdaCDM(70.2,0.277,1e-4,100,"WMAP5",
    reference("Komatsu et al. 2009, ApJS, 180, 330")));
local::FlatwCDM const local::WMAP7(createFlatLambdaCDM(70.4,0.272,1e-4,100,"WMAP7",
    reference("Komatsu et al. 2011, ApJS, 192, 18")));
local::FlatwCDM const local::WMAP9(createFlatLambdaCDM(69.32,0.2865,1e-4,100,"WMAP9",
    reference("Hinshaw et al. 2013, ApJS, 208, 19")));

namespace {
    typedef std::map<std::string, wcosmo::FlatwCDM const*> PresetMap;
    // Only addresses are stored so the table does not depend on the order in which
    // the presets themselves are initialized.
    PresetMap buildPresetMap() {
        PresetMap presets;
        presets["Planck13"] = &wcosmo::Planck13;
        presets["Planck15"] = &wcosmo::Planck15;
        presets["Planck18"] = &wcosmo::Planck18;
        presets["WMAP1"] = &wcosmo::WMAP1;
        presets["WMAP3"] = &wcosmo::WMAP3;
        presets["WMAP5"] = &wcosmo::WMAP5;
        presets["WMAP7"] = &wcosmo::WMAP7;
        presets["WMAP9"] = &wcosmo::WMAP9;
        return presets;
    }
    PresetMap const &getPresetMap() {
        static PresetMap const presets(buildPresetMap());
        return presets;
    }
}

local::FlatwCDM const *local::findPreset(std::string const &name) {
    PresetMap const &presets(getPresetMap());
    PresetMap::const_iterator found = presets.find(name);
    return (found == presets.end()) ? 0 : found->second;
}

local::FlatwCDM const &local::getPreset(std::string const &name) {
    FlatwCDM const *preset = findPreset(name);
    if(0 == preset) {
        throw RuntimeError("getPreset: unknown cosmology \"" + name + "\".");
    }
    return *preset;
}

local::FlatwCDM local::createModel(std::string const &model, double H0, double Om0, double w0,
double zmin, double zmax, std::string const &name) {
    if(model == "FlatwCDM") {
        return FlatwCDM(H0,Om0,w0,zmin,zmax,name);
    }
    if(model == "FlatLambdaCDM") {
        if(w0 != -1) {
            throw RuntimeError("createModel: FlatLambdaCDM requires w0 = -1.");
        }
        return createFlatLambdaCDM(H0,Om0,zmin,zmax,name);
    }
    throw RuntimeError("createModel: unknown model \"" + model + "\".");
}

bool local::isAvailable(std::string const &name) {
    if(0 != findPreset(name)) return true;
    for(int i = 0; i < nModels; ++i) {
        if(name == modelNames[i]) return true;
    }
    return false;
}

std::vector<std::string> local::getAvailableNames() {
    std::vector<std::string> names;
    // Presets in declaration order rather than map order.
    char const *presetNames[] = {
        "Planck13", "Planck15", "Planck18", "WMAP1", "WMAP3", "WMAP5", "WMAP7", "WMAP9" };
    for(int i = 0; i < 8; ++i) {
        names.push_back(presetNames[i]);
    }
    for(int i = 0; i < nModels; ++i) {
        names.push_back(modelNames[i]);
    }
    return names;
}
