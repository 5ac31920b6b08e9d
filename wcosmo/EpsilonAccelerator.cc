// Created 06-Oct-2026 by David Kirkby (University of California, Irvine) <dkirkby@uci.edu>

#include "wcosmo/EpsilonAccelerator.h"
#include "wcosmo/RuntimeError.h"

#include <cmath>
#include <limits>

namespace local = wcosmo;

namespace {
    // Table entries are replaced by this value when a difference vanishes.
    double const huge(std::numeric_limits<double>::max());
    double const tiny(std::numeric_limits<double>::min());
}

local::EpsilonAccelerator::EpsilonAccelerator(int maxTerms, double epsRel)
: _table(maxTerms > 0 ? maxTerms : 0), _nterms(0), _nstable(0), _epsRel(epsRel),
_estimate(0), _lastChange(0)
{
    if(maxTerms < 1) {
        throw RuntimeError("EpsilonAccelerator: invalid maxTerms < 1.");
    }
    if(epsRel <= 0) {
        throw RuntimeError("EpsilonAccelerator: invalid epsRel <= 0.");
    }
}

local::EpsilonAccelerator::~EpsilonAccelerator() { }

double local::EpsilonAccelerator::operator()(double partialSum) {
    if(_nterms >= (int)_table.size()) {
        throw RuntimeError("EpsilonAccelerator: too many partial sums.");
    }
    // Update the rising diagonal of the epsilon table in place, working back from
    // the new partial sum. Entry j of the table holds epsilon(n-j,j) afterwards.
    _table[_nterms] = partialSum;
    double above(0);
    for(int j = _nterms; j > 0; --j) {
        double twoBack(above);
        above = _table[j-1];
        double diff(_table[j] - above);
        _table[j-1] = (std::fabs(diff) <= tiny) ? huge : twoBack + 1/diff;
    }
    ++_nterms;
    // Only the even columns approximate the limit.
    double estimate = (_nterms % 2) ? _table[0] : _table[1];
    bool poisoned(!(std::fabs(estimate) <= 0.01*huge));
    if(poisoned) {
        // A vanishing difference poisoned this diagonal so keep the last estimate,
        // which does not count towards convergence.
        estimate = _estimate;
    }
    _lastChange = std::fabs(estimate - _estimate);
    if(!poisoned && _nterms > 1 && _lastChange <= _epsRel*std::fabs(estimate)) {
        ++_nstable;
    }
    else {
        _nstable = 0;
    }
    _estimate = estimate;
    return _estimate;
}
