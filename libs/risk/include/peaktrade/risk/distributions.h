#pragma once

#include <cstdint>
#include <kj/common.h>

namespace peaktrade::risk {

/**
 * @brief Standard normal cumulative distribution function
 */
[[nodiscard]] double normal_cdf(double x);

/**
 * @brief Standard normal quantile function (inverse CDF)
 *
 * Acklam's rational approximation refined with one Halley step, accurate to
 * roughly 1e-15 in the central region. Returns -inf for p <= 0 and +inf for
 * p >= 1.
 */
[[nodiscard]] double inverse_normal_cdf(double p);

/**
 * @brief Chi-square survival function P(X > x)
 *
 * Supports 1 and 2 degrees of freedom, the only ones the coverage tests use.
 *
 * @throws ValidationException for any other degree of freedom
 */
[[nodiscard]] double chi2_sf(double x, int dof);

/**
 * @brief Chi-square quantile function for 1 and 2 degrees of freedom
 *
 * @throws ValidationException for any other degree of freedom or p outside [0, 1)
 */
[[nodiscard]] double chi2_ppf(double p, int dof);

/**
 * @brief Binomial cumulative probability P(X <= k) for X ~ Bin(n, p)
 *
 * Summed in log space so large n does not underflow.
 */
[[nodiscard]] double binomial_cdf(int64_t k, int64_t n, double p);

/**
 * @brief xorshift64* generator
 *
 * Deterministic for a given seed on every platform; used for synthetic data.
 */
class XorShiftRng final {
public:
  explicit XorShiftRng(uint64_t seed);

  uint64_t next();

  /// Uniform double in the open interval (0, 1)
  double next_uniform();

  /// Standard normal draw (Box-Muller)
  double next_normal();

private:
  uint64_t state_;
};

} // namespace peaktrade::risk
