#include "peaktrade/risk/distributions.h"

#include "peaktrade/core/error.h"

#include <cmath>
#include <kj/string.h>
#include <limits>

namespace peaktrade::risk {

namespace {

constexpr double kSqrt2 = 1.41421356237309504880;
constexpr double kSqrt2Pi = 2.50662827463100050242;
constexpr double kTwoPi = 6.28318530717958647693;

double acklam_inverse_normal(double p) {
  constexpr double a1 = -3.969683028665376e+01;
  constexpr double a2 = 2.209460984245205e+02;
  constexpr double a3 = -2.759285104469687e+02;
  constexpr double a4 = 1.383577518672690e+02;
  constexpr double a5 = -3.066479806614716e+01;
  constexpr double a6 = 2.506628277459239e+00;

  constexpr double b1 = -5.447609879822406e+01;
  constexpr double b2 = 1.615858368580409e+02;
  constexpr double b3 = -1.556989798598866e+02;
  constexpr double b4 = 6.680131188771972e+01;
  constexpr double b5 = -1.328068155288572e+01;

  constexpr double c1 = -7.784894002430293e-03;
  constexpr double c2 = -3.223964580411365e-01;
  constexpr double c3 = -2.400758277161838e+00;
  constexpr double c4 = -2.549732539343734e+00;
  constexpr double c5 = 4.374664141464968e+00;
  constexpr double c6 = 2.938163982698783e+00;

  constexpr double d1 = 7.784695709041462e-03;
  constexpr double d2 = 3.224671290700398e-01;
  constexpr double d3 = 2.445134137142996e+00;
  constexpr double d4 = 3.754408661907416e+00;

  constexpr double p_low = 0.02425;
  constexpr double p_high = 1.0 - p_low;

  double q, r;

  if (p < p_low) {
    q = std::sqrt(-2.0 * std::log(p));
    return (((((c1 * q + c2) * q + c3) * q + c4) * q + c5) * q + c6) /
           ((((d1 * q + d2) * q + d3) * q + d4) * q + 1.0);
  } else if (p <= p_high) {
    q = p - 0.5;
    r = q * q;
    return (((((a1 * r + a2) * r + a3) * r + a4) * r + a5) * r + a6) * q /
           (((((b1 * r + b2) * r + b3) * r + b4) * r + b5) * r + 1.0);
  } else {
    q = std::sqrt(-2.0 * std::log(1.0 - p));
    return -(((((c1 * q + c2) * q + c3) * q + c4) * q + c5) * q + c6) /
           ((((d1 * q + d2) * q + d3) * q + d4) * q + 1.0);
  }
}

} // namespace

double normal_cdf(double x) {
  return 0.5 * std::erfc(-x / kSqrt2);
}

double inverse_normal_cdf(double p) {
  if (std::isnan(p)) {
    return std::numeric_limits<double>::quiet_NaN();
  }
  if (p <= 0.0) {
    return -std::numeric_limits<double>::infinity();
  }
  if (p >= 1.0) {
    return std::numeric_limits<double>::infinity();
  }

  double x = acklam_inverse_normal(p);

  // Halley refinement
  double e = normal_cdf(x) - p;
  double u = e * kSqrt2Pi * std::exp(x * x / 2.0);
  x = x - u / (1.0 + x * u / 2.0);
  return x;
}

double chi2_sf(double x, int dof) {
  if (dof != 1 && dof != 2) {
    throw core::ValidationException(
        kj::str("chi2_sf supports 1 or 2 degrees of freedom, got ", dof));
  }
  if (!(x > 0.0)) {
    return 1.0;
  }
  if (dof == 1) {
    return std::erfc(std::sqrt(x / 2.0));
  }
  return std::exp(-x / 2.0);
}

double chi2_ppf(double p, int dof) {
  if (dof != 1 && dof != 2) {
    throw core::ValidationException(
        kj::str("chi2_ppf supports 1 or 2 degrees of freedom, got ", dof));
  }
  if (!(p >= 0.0 && p < 1.0)) {
    throw core::ValidationException(kj::str("chi2_ppf probability must lie in [0, 1), got ", p));
  }
  if (dof == 1) {
    double z = inverse_normal_cdf((1.0 + p) / 2.0);
    return z * z;
  }
  return -2.0 * std::log(1.0 - p);
}

double binomial_cdf(int64_t k, int64_t n, double p) {
  if (k < 0) {
    return 0.0;
  }
  if (k >= n) {
    return 1.0;
  }
  if (p <= 0.0) {
    return 1.0;
  }
  if (p >= 1.0) {
    return 0.0;
  }

  const double log_p = std::log(p);
  const double log_q = std::log1p(-p);
  const double log_n_fact = std::lgamma(static_cast<double>(n) + 1.0);

  double total = 0.0;
  for (int64_t i = 0; i <= k; ++i) {
    double log_term = log_n_fact - std::lgamma(static_cast<double>(i) + 1.0) -
                      std::lgamma(static_cast<double>(n - i) + 1.0) +
                      static_cast<double>(i) * log_p + static_cast<double>(n - i) * log_q;
    total += std::exp(log_term);
  }
  return total < 1.0 ? total : 1.0;
}

// ============================================================================
// XorShiftRng Implementation
// ============================================================================

XorShiftRng::XorShiftRng(uint64_t seed) : state_(seed == 0 ? 0x9E3779B97F4A7C15ULL : seed) {}

uint64_t XorShiftRng::next() {
  state_ ^= state_ >> 12;
  state_ ^= state_ << 25;
  state_ ^= state_ >> 27;
  return state_ * 0x2545F4914F6CDD1DULL;
}

double XorShiftRng::next_uniform() {
  // 53 random mantissa bits, offset by half a step to stay off 0 and 1
  return (static_cast<double>(next() >> 11) + 0.5) * (1.0 / 9007199254740992.0);
}

double XorShiftRng::next_normal() {
  double u1 = next_uniform();
  double u2 = next_uniform();
  return std::sqrt(-2.0 * std::log(u1)) * std::cos(kTwoPi * u2);
}

} // namespace peaktrade::risk
