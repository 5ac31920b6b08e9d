// Created 08-Oct-2026 by David Kirkby (University of California, Irvine) <dkirkby@uci.edu>

#include "wcosmo/frames.h"
#include "wcosmo/distances.h"
#include "wcosmo/RedshiftInverter.h"
#include "wcosmo/RuntimeError.h"

#include "boost/bind.hpp"

namespace local = wcosmo;

namespace {
    wcosmo::RedshiftFunction bindLuminosityDistance(double H0, double Om0, double w0) {
        return boost::bind(&wcosmo::luminosityDistance,_1,H0,Om0,w0);
    }
    wcosmo::SourceFrame toSourceFrame(double m1z, double m2z, double z) {
        wcosmo::SourceFrame frame;
        frame.mass1 = m1z/(1+z);
        frame.mass2 = m2z/(1+z);
        frame.redshift = z;
        return frame;
    }
}

local::SourceFrame local::detectorToSourceFrame(double m1z, double m2z, double dL,
double H0, double Om0, double w0, double zmin, double zmax) {
    double z = zAtValue(bindLuminosityDistance(H0,Om0,w0),dL,zmin,zmax);
    return toSourceFrame(m1z,m2z,z);
}

local::DetectorFrame local::sourceToDetectorFrame(double m1, double m2, double z,
double H0, double Om0, double w0) {
    DetectorFrame frame;
    frame.mass1 = m1*(1+z);
    frame.mass2 = m2*(1+z);
    frame.luminosityDistance = luminosityDistance(z,H0,Om0,w0);
    return frame;
}

std::vector<local::SourceFrame> local::detectorToSourceFrame(std::vector<double> const &m1z,
std::vector<double> const &m2z, std::vector<double> const &dL,
double H0, double Om0, double w0, double zmin, double zmax) {
    if(m1z.size() != dL.size() || m2z.size() != dL.size()) {
        throw RuntimeError("detectorToSourceFrame: input sizes differ.");
    }
    std::vector<SourceFrame> frames;
    frames.reserve(dL.size());
    RedshiftInverter inverter(bindLuminosityDistance(H0,Om0,w0),zmin,zmax);
    for(std::size_t i = 0; i < dL.size(); ++i) {
        frames.push_back(toSourceFrame(m1z[i],m2z[i],inverter(dL[i])));
    }
    return frames;
}

std::vector<local::DetectorFrame> local::sourceToDetectorFrame(std::vector<double> const &m1,
std::vector<double> const &m2, std::vector<double> const &z,
double H0, double Om0, double w0) {
    if(m1.size() != z.size() || m2.size() != z.size()) {
        throw RuntimeError("sourceToDetectorFrame: input sizes differ.");
    }
    std::vector<DetectorFrame> frames;
    frames.reserve(z.size());
    for(std::size_t i = 0; i < z.size(); ++i) {
        frames.push_back(sourceToDetectorFrame(m1[i],m2[i],z[i],H0,Om0,w0));
    }
    return frames;
}
