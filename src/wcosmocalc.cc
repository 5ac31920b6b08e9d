// Created 12-Oct-2026 by David Kirkby (University of California, Irvine) <dkirkby@uci.edu>

// Print distances and times to z = 2 in the Planck 2015 cosmology:
// wcosmocalc --cosmology Planck15 --redshift 2
//
// Convert a 30+25 Msun detector-frame binary at 1.5 Gpc to the source frame:
// wcosmocalc --luminosity-distance 1500 --mass1 30 --mass2 25
//
// Tabulate distances for a w0 = -0.9 cosmology:
// wcosmocalc --cosmology FlatwCDM --hubble-constant 70 --omega-matter 0.3 --w0 -0.9 \
//   --save-table wcdm.dat --tmin 0.01 --tmax 10 --nz 200

#include "wcosmo/wcosmo.h"
#include "likely/likely.h"

#include "boost/program_options.hpp"
#include "boost/format.hpp"
#include "boost/bind.hpp"

#include <fstream>
#include <iostream>
#include <string>
#include <vector>

namespace po = boost::program_options;
namespace lk = likely;

int main(int argc, char **argv) {

    // Configure command-line option processing
    po::options_description cli("Flat wCDM cosmology calculator");
    double hubbleConstant,OmegaMatter,w0,zmin,zmax,zval,dL,mass1,mass2,tmin,tmax;
    int nz;
    std::string cosmologyName,saveTableFile;
    cli.add_options()
        ("help,h", "Prints this info and exits.")
        ("verbose", "Prints additional information.")
        ("list", "Lists the available preset and model names and exits.")
        ("cosmology", po::value<std::string>(&cosmologyName)->default_value("Planck15"),
            "Name of a preset cosmology, or FlatwCDM or FlatLambdaCDM to use the parameters below.")
        ("hubble-constant", po::value<double>(&hubbleConstant)->default_value(70),
            "Present-day Hubble constant H0 in km/s/Mpc (models only).")
        ("omega-matter", po::value<double>(&OmegaMatter)->default_value(0.3),
            "Present-day value of OmegaMatter (models only).")
        ("w0", po::value<double>(&w0)->default_value(-1),
            "Dark energy equation of state parameter (FlatwCDM only).")
        ("zmin", po::value<double>(&zmin)->default_value(1e-4),
            "Minimum redshift used to invert luminosity distance.")
        ("zmax", po::value<double>(&zmax)->default_value(100),
            "Maximum redshift used to invert luminosity distance.")
        ("redshift,z", po::value<double>(&zval)->default_value(1),
            "Emitter redshift.")
        ("luminosity-distance", po::value<double>(&dL)->default_value(0),
            "Luminosity distance in Mpc to convert to a redshift (zero to skip).")
        ("mass1", po::value<double>(&mass1)->default_value(0),
            "Detector-frame primary mass to convert to the source frame (zero to skip).")
        ("mass2", po::value<double>(&mass2)->default_value(0),
            "Detector-frame secondary mass to convert to the source frame.")
        ("save-table", po::value<std::string>(&saveTableFile)->default_value(""),
            "Saves a table of distances, volumes and times to the specified filename.")
        ("tmin", po::value<double>(&tmin)->default_value(1e-3),
            "Minimum redshift for the saved table.")
        ("tmax", po::value<double>(&tmax)->default_value(10),
            "Maximum redshift for the saved table.")
        ("nz", po::value<int>(&nz)->default_value(100),
            "Number of logarithmic steps to use for the saved table.")
        ;

    // do the command line parsing now
    po::variables_map vm;
    try {
        po::store(po::parse_command_line(argc, argv, cli), vm);
        po::notify(vm);
    }
    catch(std::exception const &e) {
        std::cerr << "Unable to parse command line options: " << e.what() << std::endl;
        return -1;
    }
    if(vm.count("help")) {
        std::cout << cli << std::endl;
        return 1;
    }
    bool verbose(vm.count("verbose"));

    if(vm.count("list")) {
        std::vector<std::string> names(wcosmo::getAvailableNames());
        for(std::size_t i = 0; i < names.size(); ++i) {
            wcosmo::FlatwCDM const *preset = wcosmo::findPreset(names[i]);
            std::cout << names[i];
            if(preset) {
                std::cout << boost::format(" H0 = %.2f Om0 = %.5f (%s)") % preset->getH0()
                    % preset->getOmegaMatter() % preset->getMeta().find("reference")->second;
            }
            std::cout << std::endl;
        }
        return 0;
    }

    try {
        // Build the cosmology we will use.
        wcosmo::FlatwCDMPtr cosmology;
        wcosmo::FlatwCDM const *preset = wcosmo::findPreset(cosmologyName);
        if(preset) {
            cosmology.reset(new wcosmo::FlatwCDM(preset->getH0(),preset->getOmegaMatter(),
                preset->getW0(),zmin,zmax,preset->getName(),preset->getMeta()));
        }
        else {
            cosmology.reset(new wcosmo::FlatwCDM(wcosmo::createModel(cosmologyName,
                hubbleConstant,OmegaMatter,w0,zmin,zmax,cosmologyName)));
        }
        if(verbose) {
            std::cout << "Using " << cosmology->getName() << " with H0 = " << cosmology->getH0()
                << " km/s/Mpc, Om0 = " << cosmology->getOmegaMatter() << ", w0 = "
                << cosmology->getW0() << std::endl;
            std::cout << "  Hubble distance = " << cosmology->getHubbleDistance() << " Mpc"
                << std::endl;
            std::cout << "  Hubble time = " << cosmology->getHubbleTime() << " Gyr" << std::endl;
            std::cout << "  Age today = " << cosmology->getAge(0) << " Gyr" << std::endl;
        }

        // Print quantities at the requested redshift.
        std::cout << "At z = " << zval << ':' << std::endl;
        std::cout << "  E(z) = " << cosmology->getHubbleFunction(zval) << std::endl;
        std::cout << "  Comoving dC(z) = " << cosmology->getComovingDistance(zval) << " Mpc"
            << std::endl;
        std::cout << "  Luminosity dL(z) = " << cosmology->getLuminosityDistance(zval) << " Mpc"
            << std::endl;
        std::cout << "  d(dL)/dz = " << cosmology->getLuminosityDistanceDerivative(zval) << " Mpc"
            << std::endl;
        std::cout << "  dVc/dz = " << cosmology->getDifferentialComovingVolume(zval) << " Mpc^3/sr"
            << std::endl;
        std::cout << "  Vc(z) = " << cosmology->getComovingVolume(zval) << " Mpc^3" << std::endl;
        std::cout << "  t(lookback,z) = " << cosmology->getLookbackTime(zval) << " Gyr"
            << std::endl;
        std::cout << "  t(age,z) = " << cosmology->getAge(zval) << " Gyr" << std::endl;
        std::cout << "  Absorption X(z) = " << cosmology->getAbsorptionDistance(zval) << std::endl;

        // Invert a luminosity distance, converting masses if requested.
        if(dL > 0) {
            wcosmo::RedshiftFunction fn(boost::bind(
                &wcosmo::FlatwCDM::getLuminosityDistance,cosmology,_1));
            wcosmo::RedshiftInverter inverter(fn,zmin,zmax,1000,verbose);
            if(dL < inverter.getMinValue() || dL > inverter.getMaxValue()) {
                std::cout << "Luminosity distance " << dL << " Mpc is outside the range for z in ["
                    << zmin << "," << zmax << "] and will be clamped." << std::endl;
            }
            // Source-frame masses use the same redshift, so one inversion serves both.
            double z(inverter(dL));
            std::cout << "At dL = " << dL << " Mpc: z = " << z;
            if(mass1 > 0) {
                std::cout << ", m1 = " << mass1/(1+z) << ", m2 = " << mass2/(1+z);
            }
            std::cout << std::endl;
        }

        if(0 < saveTableFile.length()) {
            std::vector<double> zValues(wcosmo::logspace(tmin,tmax,nz));
            double age0(cosmology->getAge(0));
            std::ofstream out(saveTableFile.c_str());
            boost::format outFormat("%.6g %.10g %.10g %.10g %.10g %.10g %.10g %.10g");
            for(int i = 0; i < nz; ++i) {
                double z(zValues[i]);
                double tL(cosmology->getLookbackTime(z));
                out << outFormat % z % cosmology->getComovingDistance(z)
                    % cosmology->getLuminosityDistance(z)
                    % cosmology->getLuminosityDistanceDerivative(z)
                    % cosmology->getDifferentialComovingVolume(z)
                    % cosmology->getComovingVolume(z) % tL % (age0 - tL) << std::endl;
            }
            out.close();
            if(verbose) {
                std::cout << "Wrote " << nz << " rows to " << saveTableFile << std::endl;
            }
        }
    }
    catch(wcosmo::RuntimeError const &e) {
        std::cerr << "ERROR: " << e.what() << std::endl;
        return -2;
    }
    catch(lk::RuntimeError const &e) {
        std::cerr << "ERROR: " << e.what() << std::endl;
        return -2;
    }

    return 0;
}
