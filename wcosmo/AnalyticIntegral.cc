// Created 19-Oct-2026 by David Kirkby (University of California, Irvine) <dkirkby@uci.edu>

#include "wcosmo/AnalyticIntegral.h"
#include "wcosmo/EpsilonAccelerator.h"

#include "boost/math/special_functions/expm1.hpp"
#include "boost/math/special_functions/log1p.hpp"

#include <cmath>
#include <limits>

namespace local = wcosmo;

namespace {
    // Upper limit on the number of binomial terms summed for each expansion.
    int const maxExpansionTerms(100);
    // Terms this small relative to the partial sum end a series.
    double const negligibleTerm(1e-17);
}

namespace wcosmo {
    struct AnalyticIntegral::Expansion {
        // Represents E(x)^2 = A x^alpha + B x^beta expanded about its A x^alpha term,
        // in powers of u = (B/A) x^(-sigma) with sigma = alpha - beta. Integrating the
        // binomial series of x^p/E term by term gives
        //
        //   Integral[x^p/E, {x,x0,x}] = x0^q/sqrt(A) Sum[c(n) u0^n T(q - n sigma), n >= 0]
        //
        // with q = p + 1 - alpha/2, c(n) the coefficients of (1+u)^(-1/2) and
        // T(e) = ((x/x0)^e - 1)/e, which becomes log(x/x0) for e = 0. The series
        // converges for u <= 1 at both endpoints.
        Expansion(double A_, double alpha_, double B_, double beta_, double p_)
        : A(A_), B(B_), sigma(alpha_-beta_), q(p_+1-alpha_/2)
        { }
        // Returns u = (B/A) x^(-sigma) at log(x).
        double getDensityRatio(double logx) const {
            return (B > 0) ? std::exp(std::log(B/A) - sigma*logx) : 0;
        }
        // Returns the integral between x0 and x, specified by their logarithms.
        double operator()(double logx0, double logx) const {
            double L(logx - logx0);
            double u0(getDensityRatio(logx0)), u(getDensityRatio(logx));
            double xqRatio(std::exp(q*L));
            EpsilonAccelerator accelerator(maxExpansionTerms);
            double coef(1), u0n(1), un(1), sum(0), estimate(0);
            for(int n = 0; n < maxExpansionTerms; ++n) {
                double e(q - n*sigma), eL(e*L), term;
                if(std::fabs(eL) < 1) {
                    term = coef*u0n*((0 == e) ? L : boost::math::expm1(eL)/e);
                }
                else {
                    // u0^n (x/x0)^e = (x/x0)^q u^n avoids overflow when (x/x0)^e is large.
                    term = coef*(xqRatio*un - u0n)/e;
                }
                sum += term;
                estimate = accelerator(sum);
                if(std::fabs(term) <= negligibleTerm*std::fabs(sum)) {
                    estimate = sum;
                    break;
                }
                if(accelerator.isConverged()) break;
                coef *= -(n+0.5)/(n+1);
                u0n *= u0;
                un *= u;
            }
            return std::exp(q*logx0)*estimate/std::sqrt(A);
        }
        double A, B, sigma, q;
    };
}

local::AnalyticIntegral::AnalyticIntegral(double Om0, double w0, double zpower)
: _Om0(Om0), _w0(w0), _zpower(zpower), _logEquality(0)
{
    if(0 == w0) {
        // Both components dilute like matter so E(x) = x^(3/2) for any Om0.
        _matter.reset(new Expansion(1,3,0,3,zpower));
        return;
    }
    _matter.reset(new Expansion(Om0,3,1-Om0,3*(1+w0),zpower));
    _darkEnergy.reset(new Expansion(1-Om0,3*(1+w0),Om0,3,zpower));
    if(Om0 > 0 && Om0 < 1) {
        _logEquality = std::log((1-Om0)/Om0)/(-3*w0);
    }
}

local::AnalyticIntegral::~AnalyticIntegral() { }

bool local::AnalyticIntegral::_isMatterDominated(double logx) const {
    if(!_darkEnergy) return true;
    // Compare Om0 x^3 with (1-Om0) x^(3(1+w0)) using logarithms, which are -inf for
    // a vanishing density.
    return std::log(_Om0) - 3*_w0*logx >= std::log(1-_Om0);
}

double local::AnalyticIntegral::operator()(double z) const {
    if(0 == z) return 0;
    if(!(z > -1)) return std::numeric_limits<double>::quiet_NaN();
    double logx(boost::math::log1p(z));
    bool matterAtStart(_isMatterDominated(0)), matterAtEnd(_isMatterDominated(logx));
    Expansion const &start(matterAtStart ? *_matter : *_darkEnergy);
    Expansion const &end(matterAtEnd ? *_matter : *_darkEnergy);
    if(matterAtStart == matterAtEnd) {
        return start(0,logx);
    }
    return start(0,_logEquality) + end(_logEquality,logx);
}

double local::analyticIntegral(double z, double Om0, double w0, double zpower) {
    AnalyticIntegral integral(Om0,w0,zpower);
    return integral(z);
}

double local::hypergeometric2F1(double a, double b, double c, double t, int maxTerms) {
    if(0 == t) return 1;
    EpsilonAccelerator accelerator(maxTerms);
    double term(1), sum(0), estimate(1);
    for(int n = 0; n < maxTerms; ++n) {
        sum += term;
        estimate = accelerator(sum);
        if(std::fabs(term) <= 1e-16*std::fabs(sum)) return sum;
        if(accelerator.isConverged()) return estimate;
        term *= (a+n)*(b+n)/((c+n)*(n+1))*t;
    }
    return estimate;
}
