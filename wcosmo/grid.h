// Created 07-Oct-2026 by David Kirkby (University of California, Irvine) <dkirkby@uci.edu>

#ifndef WCOSMO_GRID
#define WCOSMO_GRID

#include "wcosmo/types.h"

#include <vector>

namespace wcosmo {

    // Returns n values spaced uniformly in log10 from xmin to xmax inclusive. The
    // last value is exactly 10^log10(xmax). Throws a RuntimeError unless
    // 0 < xmin < xmax and n >= 2.
    std::vector<double> logspace(double xmin, double xmax, int n);

    // Returns the function evaluated at each of the specified redshifts.
    std::vector<double> tabulate(RedshiftFunction const &fn, std::vector<double> const &zValues);

} // wcosmo

#endif // WCOSMO_GRID
