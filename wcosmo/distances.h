// Created 05-Oct-2026 by David Kirkby (University of California, Irvine) <dkirkby@uci.edu>

#ifndef WCOSMO_DISTANCES
#define WCOSMO_DISTANCES

// Distances, times and volumes in a flat wCDM cosmology with present-day matter
// density Om0 and constant dark energy equation of state w0. Distances are in Mpc,
// times in Gyr and H0 in km/s/Mpc. None of these functions validate their inputs:
// unphysical parameters propagate as NaN or infinity.

namespace wcosmo {

    // Returns the speed of light in km/s.
    inline double speedOfLight() {
        return 299792.458;
    }

    // Returns 1/(km/s/Mpc) in Gyr.
    inline double gigayearKmPerSecMpc() {
        return 977.7922216807891;
    }

    // Returns the normalized Hubble function E(z) = H(z)/H0
    //
    //   E(z) = sqrt(Om0 (1+z)^3 + (1-Om0) (1+z)^(3(1+w0)))
    double efunc(double z, double Om0, double w0 = -1);

    // Returns 1/E(z).
    double invEfunc(double z, double Om0, double w0 = -1);

    // Returns the present-day Hubble distance c/H0 in Mpc.
    double hubbleDistance(double H0);

    // Returns the present-day Hubble time 1/H0 in Gyr.
    double hubbleTime(double H0);

    // Returns the Hubble distance scaled by 1/E(z), i.e. c/H(z) in Mpc.
    double hubbleParameter(double z, double H0, double Om0, double w0 = -1);

    // Returns the line of sight comoving distance in Mpc to redshift z.
    double comovingDistance(double z, double H0, double Om0, double w0 = -1);

    // Returns the lookback time in Gyr to redshift z.
    double lookbackTime(double z, double H0, double Om0, double w0 = -1);

    // Returns the dimensionless absorption distance X(z) = Integral[(1+z')^2/E(z'), {z',0,z}].
    double absorptionDistance(double z, double Om0, double w0 = -1);

    // Returns the luminosity distance (1+z) dC(z) in Mpc.
    double luminosityDistance(double z, double H0, double Om0, double w0 = -1);

    // Returns the derivative of luminosity distance with respect to redshift in Mpc,
    //
    //   d(dL)/dz = dC(z) + (1+z) dH/E(z)
    //
    // which is the Jacobian for expressing a distribution in redshift as one in
    // luminosity distance.
    double dDLdz(double z, double H0, double Om0, double w0 = -1);

    // Returns the differential comoving volume dC^2 dH/E(z) in Mpc^3 per unit
    // redshift per steradian.
    double differentialComovingVolume(double z, double H0, double Om0, double w0 = -1);

    // Returns the comoving volume (4pi/3) dC^3 in Mpc^3 enclosed within redshift z.
    double comovingVolume(double z, double H0, double Om0, double w0 = -1);

} // wcosmo

#endif // WCOSMO_DISTANCES
