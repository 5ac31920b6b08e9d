// Created 07-Oct-2026 by David Kirkby (University of California, Irvine) <dkirkby@uci.edu>

#ifndef WCOSMO_REDSHIFT_INVERTER
#define WCOSMO_REDSHIFT_INVERTER

#include "wcosmo/types.h"

#include "likely/types.h"

#include <vector>

namespace wcosmo {
	class RedshiftInverter {
	// Finds the redshift at which a monotonic function of redshift takes a given
	// value, by linear interpolation in a table of function values on a fixed grid of
	// log-spaced redshifts. This is an approximation, not a root finder: its accuracy
	// is set by the grid density and is not refined.
	public:
	    // Creates a new inverter by tabulating fn at nz redshifts spaced uniformly in
	    // log(z) over [zmin,zmax]. Throws a RuntimeError unless 0 < zmin < zmax,
	    // nz >= 2 and the tabulated values are strictly increasing or decreasing.
		RedshiftInverter(RedshiftFunction const &fn, double zmin = 1e-4, double zmax = 100,
		    int nz = 1000, bool verbose = false);
		virtual ~RedshiftInverter();
		// Returns the redshift where the function equals fval. Values outside the
		// tabulated range are clamped to whichever of zmin or zmax the function attains
		// that extreme at, without extrapolation. Returns NaN for a NaN fval.
        double operator()(double fval) const;
        // Returns the redshifts for each of the specified function values.
        std::vector<double> operator()(std::vector<double> const &fvals) const;
        // Returns the range of tabulated function values.
        double getMinValue() const;
        double getMaxValue() const;
        double getZmin() const;
        double getZmax() const;
	private:
        double _zmin, _zmax, _fmin, _fmax, _zAtMin, _zAtMax;
        likely::InterpolatorPtr _interpolator;
	}; // RedshiftInverter

    inline double RedshiftInverter::getMinValue() const { return _fmin; }
    inline double RedshiftInverter::getMaxValue() const { return _fmax; }
    inline double RedshiftInverter::getZmin() const { return _zmin; }
    inline double RedshiftInverter::getZmax() const { return _zmax; }

    // Returns the redshift in [zmin,zmax] at which fn equals fval, using a 1000 point
    // log-spaced grid. See RedshiftInverter for details.
    double zAtValue(RedshiftFunction const &fn, double fval, double zmin = 1e-4, double zmax = 100);

    // Returns the redshifts in [zmin,zmax] at which fn equals each of fvals, sharing
    // a single tabulation of fn.
    std::vector<double> zAtValue(RedshiftFunction const &fn, std::vector<double> const &fvals,
        double zmin = 1e-4, double zmax = 100);

} // wcosmo

#endif // WCOSMO_REDSHIFT_INVERTER
