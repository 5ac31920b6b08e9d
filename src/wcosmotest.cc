// Created 13-Oct-2026 by David Kirkby (University of California, Irvine) <dkirkby@uci.edu>

#include "wcosmo/wcosmo.h"

#include "boost/bind.hpp"
#include "boost/math/special_functions/asinh.hpp"

#include <iostream>
#include <cmath>

// Returns the LambdaCDM age in units of the Hubble time at redshift z.
double lambdaCdmAge(double z, double Om0) {
    double OL(1-Om0);
    return 2/(3*std::sqrt(OL))*boost::math::asinh(std::sqrt(OL/Om0)*std::pow(1+z,-1.5));
}

// Returns the Einstein-de Sitter integral of (1+z)^p/E(z).
double einsteinDeSitter(double z, double p) {
    double q(p-0.5);
    return (std::pow(1+z,q)-1)/q;
}

// Returns the antiderivative of x^p/E(x) on the dark-energy dominated side,
// G(x) = x^(p+1)/(q E) 2F1(1/2,1;1-q/sigma;Om0 x^3/E^2), with x = 1+z.
double darkEnergyAntiderivative(double x, double Om0, double w0, double p) {
    double alpha(3*(1+w0)), sigma(alpha-3), q(p+1-alpha/2);
    double E2(Om0*x*x*x + (1-Om0)*std::pow(x,alpha));
    return std::pow(x,p+1)/(q*std::sqrt(E2))*
        wcosmo::hypergeometric2F1(0.5,1,1-q/sigma,Om0*x*x*x/E2);
}

int main(int argc, char **argv) {

    int ntest(20);
    double zmin(1e-3), zmax(1e3);

    // Compare with Einstein-de Sitter (Om0 = 1) for each exponent used by the distances.
    double powers[] = { 0, -1, 2 };
    for(int ip = 0; ip < 3; ++ip) {
        for(int i = 0; i < ntest; ++i) {
            double z(zmin*std::pow(zmax/zmin,i/(ntest-1.)));
            double value(wcosmo::analyticIntegral(z,1,-1,powers[ip]));
            double exact(einsteinDeSitter(z,powers[ip]));
            std::cout << "EdS I(z = " << z << ", p = " << powers[ip] << ") = " << value
                << " (error = " << value/exact-1 << ")" << std::endl;
        }
    }

    // Compare with the hypergeometric closed form below matter-dark energy equality,
    // which is at z = 0.368 for Om0 = 0.3 and w0 = -0.9.
    for(int ip = 0; ip < 3; ++ip) {
        for(int i = 0; i < ntest; ++i) {
            double z(zmin*std::pow(0.3/zmin,i/(ntest-1.)));
            double value(wcosmo::analyticIntegral(z,0.3,-0.9,powers[ip]));
            double exact(darkEnergyAntiderivative(1+z,0.3,-0.9,powers[ip]) -
                darkEnergyAntiderivative(1,0.3,-0.9,powers[ip]));
            std::cout << "2F1 I(z = " << z << ", p = " << powers[ip] << ") = " << value
                << " (error = " << value/exact-1 << ")" << std::endl;
        }
    }

    // Compare the age of the universe in LambdaCDM with its closed form.
    double omegas[] = { 0.05, 0.3, 0.7 };
    for(int io = 0; io < 3; ++io) {
        wcosmo::FlatwCDM cosmology(wcosmo::createFlatLambdaCDM(70,omegas[io]));
        for(int i = 0; i < ntest; ++i) {
            double z(zmin*std::pow(zmax/zmin,i/(ntest-1.)));
            double age(cosmology.getAge(z));
            double exact(cosmology.getHubbleTime()*
                (lambdaCdmAge(z,omegas[io]) - lambdaCdmAge(1e5,omegas[io])));
            std::cout << "LCDM age(z = " << z << ", Om0 = " << omegas[io] << ") = " << age
                << " Gyr (error = " << age/exact-1 << ")" << std::endl;
        }
    }

    // Check the redshift recovered from luminosity distance across the grid.
    wcosmo::RedshiftFunction fn(boost::bind(
        &wcosmo::FlatwCDM::getLuminosityDistance,&wcosmo::Planck15,_1));
    wcosmo::RedshiftInverter inverter(fn);
    for(int i = 0; i < ntest; ++i) {
        double z(1e-3*std::pow(1e4,i/(ntest-1.)));
        double zrec(inverter(wcosmo::Planck15.getLuminosityDistance(z)));
        std::cout << "Planck15 z(dL(z = " << z << ")) = " << zrec << " (error = "
            << zrec/z-1 << ")" << std::endl;
    }

    return 0;
}
