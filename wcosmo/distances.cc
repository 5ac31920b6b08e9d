// Created 05-Oct-2026 by David Kirkby (University of California, Irvine) <dkirkby@uci.edu>

#include "wcosmo/distances.h"
#include "wcosmo/AnalyticIntegral.h"

#include "boost/math/constants/constants.hpp"

#include <cmath>

namespace local = wcosmo;

double local::efunc(double z, double Om0, double w0) {
    double zp1(1+z);
    return std::sqrt(Om0*zp1*zp1*zp1 + (1-Om0)*std::pow(zp1,3*(1+w0)));
}

double local::invEfunc(double z, double Om0, double w0) {
    return 1/efunc(z,Om0,w0);
}

double local::hubbleDistance(double H0) {
    return speedOfLight()/H0;
}

double local::hubbleTime(double H0) {
    return gigayearKmPerSecMpc()/H0;
}

double local::hubbleParameter(double z, double H0, double Om0, double w0) {
    return hubbleDistance(H0)*invEfunc(z,Om0,w0);
}

double local::comovingDistance(double z, double H0, double Om0, double w0) {
    return analyticIntegral(z,Om0,w0,0)*hubbleDistance(H0);
}

double local::lookbackTime(double z, double H0, double Om0, double w0) {
    return analyticIntegral(z,Om0,w0,-1)*hubbleTime(H0);
}

double local::absorptionDistance(double z, double Om0, double w0) {
    return analyticIntegral(z,Om0,w0,2);
}

double local::luminosityDistance(double z, double H0, double Om0, double w0) {
    return (1+z)*comovingDistance(z,H0,Om0,w0);
}

double local::dDLdz(double z, double H0, double Om0, double w0) {
    double dC(comovingDistance(z,H0,Om0,w0));
    return dC + (1+z)*hubbleDistance(H0)*invEfunc(z,Om0,w0);
}

double local::differentialComovingVolume(double z, double H0, double Om0, double w0) {
    double dC(comovingDistance(z,H0,Om0,w0));
    return dC*dC*hubbleDistance(H0)*invEfunc(z,Om0,w0);
}

double local::comovingVolume(double z, double H0, double Om0, double w0) {
    double dC(comovingDistance(z,H0,Om0,w0));
    return 4*boost::math::constants::pi<double>()/3*dC*dC*dC;
}
