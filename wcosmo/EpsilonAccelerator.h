// Created 06-Oct-2026 by David Kirkby (University of California, Irvine) <dkirkby@uci.edu>

#ifndef WCOSMO_EPSILON_ACCELERATOR
#define WCOSMO_EPSILON_ACCELERATOR

#include <vector>

namespace wcosmo {
    // Accelerates the convergence of a series using Wynn's epsilon algorithm.
    // Feeding the successive partial sums S_0, S_1, ... of a power series yields
    // the diagonal Pade approximants [n/n] of the series (for an odd number of
    // sums) or [n/n+1] (for an even number), which converge well beyond the
    // radius of convergence of the Taylor series itself.
	class EpsilonAccelerator {
	public:
	    // Creates a new accelerator for up to maxTerms partial sums. The estimate
	    // is considered converged once two successive estimates agree to within
	    // the relative tolerance epsRel.
		explicit EpsilonAccelerator(int maxTerms, double epsRel = 1e-15);
		virtual ~EpsilonAccelerator();
		// Adds the next partial sum and returns the updated estimate of the limit.
		// Throws a RuntimeError if called more than maxTerms times.
        double operator()(double partialSum);
        // Returns the most recent estimate of the limit.
        double getEstimate() const;
        // Returns the absolute change in the estimate caused by the last partial sum.
        double getLastChange() const;
        // Returns the number of partial sums added so far.
        int getNumTerms() const;
        bool isConverged() const;
	private:
        std::vector<double> _table;
        int _nterms, _nstable;
        double _epsRel, _estimate, _lastChange;
	}; // EpsilonAccelerator

    inline double EpsilonAccelerator::getEstimate() const { return _estimate; }
    inline double EpsilonAccelerator::getLastChange() const { return _lastChange; }
    inline int EpsilonAccelerator::getNumTerms() const { return _nterms; }
    inline bool EpsilonAccelerator::isConverged() const { return _nstable >= 2; }

} // wcosmo

#endif // WCOSMO_EPSILON_ACCELERATOR
