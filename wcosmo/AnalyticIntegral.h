// Created 19-Oct-2026 by David Kirkby (University of California, Irvine) <dkirkby@uci.edu>

#ifndef WCOSMO_ANALYTIC_INTEGRAL
#define WCOSMO_ANALYTIC_INTEGRAL

#include "boost/smart_ptr.hpp"

namespace wcosmo {
    // Evaluates the integral
    //
    //   I(z) = Integral[(1+z')^p / E(z'), {z',0,z}]
    //
    // for a flat wCDM expansion rate E(z) and an arbitrary real exponent p, without
    // numerical quadrature. With x = 1+z, 1/E is expanded as a binomial series in the
    // density ratio u <= 1 of the sub-dominant to the dominant component, and each
    // term x^(p-1-n sigma) is integrated exactly. The matter-dominated and dark
    // energy-dominated epochs each get their own expansion, joined at the epoch of
    // matter-dark energy equality where u = 1 on both sides. The alternating series
    // are summed using Pade approximants so that at most 100 terms reach double
    // precision.
	class AnalyticIntegral {
	public:
	    // Creates a new integral for the cosmology (Om0,w0) with integrand exponent p.
	    // Use zpower = 0 for comoving distance, -1 for lookback time and 2 for
	    // absorption distance. Parameters are not validated.
		AnalyticIntegral(double Om0, double w0 = -1, double zpower = 0);
		virtual ~AnalyticIntegral();
		// Returns the dimensionless integral from 0 to z. Returns exactly zero for z = 0
		// and NaN for z <= -1.
        double operator()(double z) const;
        // Accessors for constructor parameters.
        double getOmegaMatter() const;
        double getW0() const;
        double getZPower() const;
	private:
        double _Om0, _w0, _zpower, _logEquality;
        struct Expansion;
        boost::scoped_ptr<Expansion> _matter, _darkEnergy;
        bool _isMatterDominated(double logx) const;
	}; // AnalyticIntegral

    inline double AnalyticIntegral::getOmegaMatter() const { return _Om0; }
    inline double AnalyticIntegral::getW0() const { return _w0; }
    inline double AnalyticIntegral::getZPower() const { return _zpower; }

    // Returns Integral[(1+z')^zpower / E(z'), {z',0,z}] for a flat wCDM cosmology.
    double analyticIntegral(double z, double Om0, double w0 = -1, double zpower = 0);

    // Returns the Gauss hypergeometric function 2F1(a,b;c;t) summed from its Taylor
    // series using Pade approximants. Converges for all real t < 1 provided c is not
    // zero or a negative integer, but the number of terms needed grows as t -> 1.
    // Returns the best estimate after maxTerms terms if not converged by then.
    double hypergeometric2F1(double a, double b, double c, double t, int maxTerms = 64);

} // wcosmo

#endif // WCOSMO_ANALYTIC_INTEGRAL
