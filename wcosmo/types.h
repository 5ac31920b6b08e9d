// Created 05-Oct-2026 by David Kirkby (University of California, Irvine) <dkirkby@uci.edu>

#ifndef WCOSMO_TYPES
#define WCOSMO_TYPES

#include "boost/function.hpp"
#include "boost/smart_ptr.hpp"

#include <map>
#include <string>

namespace wcosmo {

    // Represents a scalar function of redshift, e.g. a luminosity distance in Mpc
    // for a fixed cosmology.
    typedef boost::function<double (double)> RedshiftFunction;

    // Free-form descriptive metadata attached to a cosmology, e.g. a reference.
    typedef std::map<std::string,std::string> Metadata;

    class FlatwCDM;
    typedef boost::shared_ptr<FlatwCDM> FlatwCDMPtr;

} // wcosmo

#endif // WCOSMO_TYPES
