#include "gaussian.hpp"

namespace gaitrank::rating {

namespace {

constexpr double kSqrt2   = 1.41421356237309504880;
constexpr double kInvSqrt2Pi = 0.39894228040143267794;

// Inverse complementary error function: rational first guess refined by two Newton steps.
double InverseErfc(double y) {
  if (y >= 2.0) return -100.0;
  if (y <= 0.0) return 100.0;

  const bool   lower = y < 1.0;
  const double yy    = lower ? y : 2.0 - y;
  const double t     = std::sqrt(-2.0 * std::log(yy / 2.0));
  double       x     = -0.70711 * ((2.30753 + t * 0.27061) / (1.0 + t * (0.99229 + t * 0.04481)) - t);
  for (int i = 0; i < 2; ++i) {
    const double err = std::erfc(x) - yy;
    x += err / (1.12837916709551257 * std::exp(-(x * x)) - x * err);
  }
  return lower ? x : -x;
}

} // namespace

double Pdf(double x) {
  return kInvSqrt2Pi * std::exp(-(x * x) / 2.0);
}

double Cdf(double x) {
  return 0.5 * std::erfc(-x / kSqrt2);
}

double Ppf(double p) {
  return -kSqrt2 * InverseErfc(2.0 * p);
}

} // namespace gaitrank::rating
