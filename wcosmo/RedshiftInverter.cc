// Created 07-Oct-2026 by David Kirkby (University of California, Irvine) <dkirkby@uci.edu>

#include "wcosmo/RedshiftInverter.h"
#include "wcosmo/RuntimeError.h"
#include "wcosmo/grid.h"

#include "likely/Interpolator.h"

#include "boost/math/special_functions/fpclassify.hpp"

#include <algorithm>
#include <iostream>

namespace local = wcosmo;

local::RedshiftInverter::RedshiftInverter(RedshiftFunction const &fn, double zmin, double zmax,
int nz, bool verbose)
: _zmin(zmin), _zmax(zmax)
{
    if(zmin <= 0) {
        throw RuntimeError("RedshiftInverter: invalid zmin <= 0.");
    }
    if(zmax <= zmin) {
        throw RuntimeError("RedshiftInverter: invalid zmax <= zmin.");
    }
    if(nz < 2) {
        throw RuntimeError("RedshiftInverter: invalid nz < 2.");
    }
    likely::Interpolator::CoordinateValues zValues(logspace(zmin,zmax,nz));
    likely::Interpolator::CoordinateValues fValues(tabulate(fn,zValues));
    // The interpolator needs increasing function values so reverse a decreasing table.
    bool decreasing(fValues[nz-1] < fValues[0]);
    if(decreasing) {
        std::reverse(zValues.begin(),zValues.end());
        std::reverse(fValues.begin(),fValues.end());
    }
    for(int i = 1; i < nz; ++i) {
        if(!(fValues[i] > fValues[i-1])) {
            throw RuntimeError("RedshiftInverter: function is not strictly monotonic.");
        }
    }
    _fmin = fValues[0];
    _fmax = fValues[nz-1];
    _zAtMin = decreasing ? zmax : zmin;
    _zAtMax = decreasing ? zmin : zmax;
    if(verbose) {
        std::cout << "RedshiftInverter: tabulated " << nz << " redshifts in [" << zmin << ","
            << zmax << "] with function values in [" << _fmin << "," << _fmax << "]"
            << (decreasing ? " (decreasing)" : "") << std::endl;
    }
    _interpolator.reset(new likely::Interpolator(fValues,zValues,"linear"));
}

local::RedshiftInverter::~RedshiftInverter() { }

double local::RedshiftInverter::operator()(double fval) const {
    if((boost::math::isnan)(fval)) return fval;
    if(fval < _fmin) return _zAtMin;
    if(fval > _fmax) return _zAtMax;
    return (*_interpolator)(fval);
}

std::vector<double> local::RedshiftInverter::operator()(std::vector<double> const &fvals) const {
    std::vector<double> zValues;
    zValues.reserve(fvals.size());
    for(std::vector<double>::const_iterator iter = fvals.begin(); iter != fvals.end(); ++iter) {
        zValues.push_back((*this)(*iter));
    }
    return zValues;
}

double local::zAtValue(RedshiftFunction const &fn, double fval, double zmin, double zmax) {
    RedshiftInverter inverter(fn,zmin,zmax);
    return inverter(fval);
}

std::vector<double> local::zAtValue(RedshiftFunction const &fn, std::vector<double> const &fvals,
double zmin, double zmax) {
    RedshiftInverter inverter(fn,zmin,zmax);
    return inverter(fvals);
}
