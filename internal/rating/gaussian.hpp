#pragma once

#include <cmath>
#include <limits>

namespace gaitrank::rating {

/*
  Gaussian in natural parameters: precision pi = 1/sigma^2 and
  precision-adjusted mean tau = pi * mu. Multiplication and division are
  the message operations of the factor graph.
*/
struct Gaussian {
  double pi  = 0.0;
  double tau = 0.0;

  static Gaussian FromMuSigma(double mu, double sigma) {
    const double p = 1.0 / (sigma * sigma);
    return Gaussian{p, p * mu};
  }

  double Mu() const {
    return pi != 0.0 ? tau / pi : 0.0;
  }

  double Sigma() const {
    return pi != 0.0 ? std::sqrt(1.0 / pi) : std::numeric_limits<double>::infinity();
  }
};

inline Gaussian operator*(const Gaussian& a, const Gaussian& b) {
  return Gaussian{a.pi + b.pi, a.tau + b.tau};
}

inline Gaussian operator/(const Gaussian& a, const Gaussian& b) {
  return Gaussian{a.pi - b.pi, a.tau - b.tau};
}

// Standard normal helpers.
double Pdf(double x);
double Cdf(double x);
// Inverse of Cdf for 0 < p < 1.
double Ppf(double p);

} // namespace gaitrank::rating
