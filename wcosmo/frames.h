// Created 08-Oct-2026 by David Kirkby (University of California, Irvine) <dkirkby@uci.edu>

#ifndef WCOSMO_FRAMES
#define WCOSMO_FRAMES

#include <vector>

// Conversions between the detector frame, where a gravitational-wave source has
// redshifted masses and a luminosity distance, and the source frame, where it has
// intrinsic masses and a redshift. Masses may use any unit; distances are in Mpc.

namespace wcosmo {

    struct SourceFrame {
        double mass1, mass2, redshift;
    };

    struct DetectorFrame {
        double mass1, mass2, luminosityDistance;
    };

    // Converts detector-frame masses and luminosity distance to source-frame masses
    // and redshift. The redshift is found by interpolating luminosity distance on a
    // grid over [zmin,zmax], so distances outside that range clamp to zmin or zmax and
    // a round trip through sourceToDetectorFrame is only approximate.
    SourceFrame detectorToSourceFrame(double m1z, double m2z, double dL,
        double H0, double Om0, double w0 = -1, double zmin = 1e-4, double zmax = 100);

    // Converts source-frame masses and redshift to detector-frame masses and
    // luminosity distance.
    DetectorFrame sourceToDetectorFrame(double m1, double m2, double z,
        double H0, double Om0, double w0 = -1);

    // Converts each element of equal-length vectors, sharing a single redshift grid.
    // Throws a RuntimeError if the vector sizes differ.
    std::vector<SourceFrame> detectorToSourceFrame(std::vector<double> const &m1z,
        std::vector<double> const &m2z, std::vector<double> const &dL,
        double H0, double Om0, double w0 = -1, double zmin = 1e-4, double zmax = 100);

    std::vector<DetectorFrame> sourceToDetectorFrame(std::vector<double> const &m1,
        std::vector<double> const &m2, std::vector<double> const &z,
        double H0, double Om0, double w0 = -1);

} // wcosmo

#endif // WCOSMO_FRAMES
