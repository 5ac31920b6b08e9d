// Created 09-Oct-2026 by David Kirkby (University of California, Irvine) <dkirkby@uci.edu>

#include "wcosmo/FlatwCDM.h"
#include "wcosmo/distances.h"
#include "wcosmo/RedshiftInverter.h"

#include "boost/bind.hpp"

namespace local = wcosmo;

local::FlatwCDM::FlatwCDM(double H0, double Om0, double w0, double zmin, double zmax,
std::string const &name, Metadata const &meta)
: _H0(H0), _Om0(Om0), _w0(w0), _zmin(zmin), _zmax(zmax), _name(name), _meta(meta)
{ }

local::FlatwCDM::~FlatwCDM() { }

double local::FlatwCDM::getHubbleDistance() const {
    return hubbleDistance(_H0);
}

double local::FlatwCDM::getHubbleTime() const {
    return hubbleTime(_H0);
}

double local::FlatwCDM::getHubbleFunction(double z) const {
    return efunc(z,_Om0,_w0);
}

double local::FlatwCDM::getInverseHubbleFunction(double z) const {
    return invEfunc(z,_Om0,_w0);
}

double local::FlatwCDM::getHubbleParameter(double z) const {
    return hubbleParameter(z,_H0,_Om0,_w0);
}

double local::FlatwCDM::getComovingDistance(double z) const {
    return comovingDistance(z,_H0,_Om0,_w0);
}

double local::FlatwCDM::getLuminosityDistance(double z) const {
    return luminosityDistance(z,_H0,_Om0,_w0);
}

double local::FlatwCDM::getLuminosityDistanceDerivative(double z) const {
    return dDLdz(z,_H0,_Om0,_w0);
}

double local::FlatwCDM::getLuminosityDistanceHubbleDerivative(double z) const {
    return getLuminosityDistance(z)/getHubbleDistance();
}

double local::FlatwCDM::getDifferentialComovingVolume(double z) const {
    return differentialComovingVolume(z,_H0,_Om0,_w0);
}

double local::FlatwCDM::getComovingVolume(double z) const {
    return comovingVolume(z,_H0,_Om0,_w0);
}

double local::FlatwCDM::getLookbackTime(double z) const {
    return lookbackTime(z,_H0,_Om0,_w0);
}

double local::FlatwCDM::getAbsorptionDistance(double z) const {
    return absorptionDistance(z,_Om0,_w0);
}

double local::FlatwCDM::getAge(double z, double zmax) const {
    return getLookbackTime(zmax) - getLookbackTime(z);
}

double local::FlatwCDM::getRedshiftAtLuminosityDistance(double dL) const {
    RedshiftFunction fn(boost::bind(&FlatwCDM::getLuminosityDistance,this,_1));
    return zAtValue(fn,dL,_zmin,_zmax);
}

local::SourceFrame local::FlatwCDM::detectorToSourceFrame(double m1z, double m2z, double dL) const {
    return wcosmo::detectorToSourceFrame(m1z,m2z,dL,_H0,_Om0,_w0,_zmin,_zmax);
}

local::DetectorFrame local::FlatwCDM::sourceToDetectorFrame(double m1, double m2, double z) const {
    return wcosmo::sourceToDetectorFrame(m1,m2,z,_H0,_Om0,_w0);
}

std::vector<local::SourceFrame> local::FlatwCDM::detectorToSourceFrame(
std::vector<double> const &m1z, std::vector<double> const &m2z,
std::vector<double> const &dL) const {
    return wcosmo::detectorToSourceFrame(m1z,m2z,dL,_H0,_Om0,_w0,_zmin,_zmax);
}

std::vector<local::DetectorFrame> local::FlatwCDM::sourceToDetectorFrame(
std::vector<double> const &m1, std::vector<double> const &m2,
std::vector<double> const &z) const {
    return wcosmo::sourceToDetectorFrame(m1,m2,z,_H0,_Om0,_w0);
}

local::FlatwCDM local::createFlatLambdaCDM(double H0, double Om0, double zmin, double zmax,
std::string const &name, Metadata const &meta) {
    return FlatwCDM(H0,Om0,-1,zmin,zmax,name,meta);
}
