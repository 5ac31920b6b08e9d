// Created 07-Oct-2026 by David Kirkby (University of California, Irvine) <dkirkby@uci.edu>

#include "wcosmo/grid.h"
#include "wcosmo/RuntimeError.h"

#include <cmath>

namespace local = wcosmo;

std::vector<double> local::logspace(double xmin, double xmax, int n) {
    if(xmin <= 0) {
        throw RuntimeError("logspace: invalid xmin <= 0.");
    }
    if(xmax <= xmin) {
        throw RuntimeError("logspace: invalid xmax <= xmin.");
    }
    if(n < 2) {
        throw RuntimeError("logspace: invalid n < 2.");
    }
    std::vector<double> values(n);
    double logmin(std::log10(xmin)), logmax(std::log10(xmax));
    double dlog((logmax-logmin)/(n-1));
    for(int i = 0; i < n-1; ++i) {
        values[i] = std::pow(10.,logmin + i*dlog);
    }
    values[n-1] = std::pow(10.,logmax);
    return values;
}

std::vector<double> local::tabulate(RedshiftFunction const &fn, std::vector<double> const &zValues) {
    std::vector<double> values;
    values.reserve(zValues.size());
    for(std::vector<double>::const_iterator iter = zValues.begin(); iter != zValues.end(); ++iter) {
        values.push_back(fn(*iter));
    }
    return values;
}
