// Created 09-Oct-2026 by David Kirkby (University of California, Irvine) <dkirkby@uci.edu>

#ifndef WCOSMO_FLAT_WCDM
#define WCOSMO_FLAT_WCDM

#include "wcosmo/types.h"
#include "wcosmo/frames.h"

#include <string>
#include <vector>

namespace wcosmo {
    // Describes a spatially flat universe of matter and dark energy with a constant
    // equation of state w0, and binds the distance, time and frame conversion
    // functions to its parameters. Instances are immutable. Distances are in Mpc,
    // times in Gyr and H0 in km/s/Mpc.
	class FlatwCDM {
	public:
	    // Creates a new cosmology. The redshift range [zmin,zmax] is used when
	    // inverting luminosity distance. Parameters are not validated.
		FlatwCDM(double H0, double Om0, double w0, double zmin = 1e-4, double zmax = 100,
		    std::string const &name = "", Metadata const &meta = Metadata());
		virtual ~FlatwCDM();
		// Accessors for constructor parameters.
        double getH0() const;
        double getOmegaMatter() const;
        double getW0() const;
        double getZmin() const;
        double getZmax() const;
        std::string const &getName() const;
        Metadata const &getMeta() const;
        // Returns the present-day Hubble distance c/H0 in Mpc.
        double getHubbleDistance() const;
        // Returns the present-day Hubble time 1/H0 in Gyr.
        double getHubbleTime() const;
        // Returns the normalized Hubble function E(z) = H(z)/H0.
        double getHubbleFunction(double z) const;
        double getInverseHubbleFunction(double z) const;
        // Returns c/H(z) in Mpc.
        double getHubbleParameter(double z) const;
        double getComovingDistance(double z) const;
        double getLuminosityDistance(double z) const;
        // Returns d(dL)/dz in Mpc.
        double getLuminosityDistanceDerivative(double z) const;
        // Returns d(dL)/d(dH) = dL/dH, the derivative of luminosity distance with
        // respect to the Hubble distance at fixed redshift.
        double getLuminosityDistanceHubbleDerivative(double z) const;
        // Returns dVc/dz in Mpc^3/sr.
        double getDifferentialComovingVolume(double z) const;
        // Returns Vc in Mpc^3.
        double getComovingVolume(double z) const;
        double getLookbackTime(double z) const;
        double getAbsorptionDistance(double z) const;
        // Returns the age of the universe in Gyr at redshift z, measured from zmax.
        double getAge(double z, double zmax = 1e5) const;
        // Returns the redshift in [zmin,zmax] with the specified luminosity distance
        // in Mpc, by interpolation.
        double getRedshiftAtLuminosityDistance(double dL) const;
        // Frame conversions using this cosmology and its [zmin,zmax] range.
        SourceFrame detectorToSourceFrame(double m1z, double m2z, double dL) const;
        DetectorFrame sourceToDetectorFrame(double m1, double m2, double z) const;
        std::vector<SourceFrame> detectorToSourceFrame(std::vector<double> const &m1z,
            std::vector<double> const &m2z, std::vector<double> const &dL) const;
        std::vector<DetectorFrame> sourceToDetectorFrame(std::vector<double> const &m1,
            std::vector<double> const &m2, std::vector<double> const &z) const;
	private:
        double _H0, _Om0, _w0, _zmin, _zmax;
        std::string _name;
        Metadata _meta;
	}; // FlatwCDM

    inline double FlatwCDM::getH0() const { return _H0; }
    inline double FlatwCDM::getOmegaMatter() const { return _Om0; }
    inline double FlatwCDM::getW0() const { return _w0; }
    inline double FlatwCDM::getZmin() const { return _zmin; }
    inline double FlatwCDM::getZmax() const { return _zmax; }
    inline std::string const &FlatwCDM::getName() const { return _name; }
    inline Metadata const &FlatwCDM::getMeta() const { return _meta; }

    // Creates a flat LambdaCDM cosmology, i.e. a FlatwCDM with w0 = -1.
    FlatwCDM createFlatLambdaCDM(double H0, double Om0, double zmin = 1e-4, double zmax = 100,
        std::string const &name = "", Metadata const &meta = Metadata());

} // wcosmo

#endif // WCOSMO_FLAT_WCDM
