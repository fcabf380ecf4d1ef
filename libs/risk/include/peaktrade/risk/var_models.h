#pragma once

#include "peaktrade/risk/distributions.h"

#include <cstdint>
#include <kj/array.h>
#include <kj/common.h>
#include <kj/string.h>

namespace peaktrade::risk {

/**
 * @brief VaR calculation method enumeration
 */
enum class VaRMethod : std::uint8_t {
  Historical = 0,       ///< Empirical quantile of the sample
  ParametricNormal = 1, ///< Normal quantile from sample mean and std dev
};

/**
 * @brief Convert VaRMethod to its canonical name
 */
[[nodiscard]] kj::StringPtr var_method_to_string(VaRMethod method);

/**
 * @brief Parse "historical" or "parametric_normal"
 * @throws ValidationException for any other name
 */
[[nodiscard]] VaRMethod parse_var_method(kj::StringPtr name);

/**
 * @brief Immutable VaR estimate
 *
 * var is a non-negative loss magnitude: 0.02 means a 2% loss is exceeded
 * with probability 1 - alpha over horizon periods.
 */
class VaRResult final {
public:
  VaRResult(VaRMethod method, double alpha, int horizon, double var, size_t sample_size)
      : method_(method), alpha_(alpha), horizon_(horizon), var_(var), sample_size_(sample_size) {}

  [[nodiscard]] VaRMethod method() const {
    return method_;
  }
  [[nodiscard]] double alpha() const {
    return alpha_;
  }
  [[nodiscard]] int horizon() const {
    return horizon_;
  }
  [[nodiscard]] double var() const {
    return var_;
  }
  /// Observations left after dropping non-finite values
  [[nodiscard]] size_t sample_size() const {
    return sample_size_;
  }

private:
  VaRMethod method_;
  double alpha_;
  int horizon_;
  double var_;
  size_t sample_size_;
};

/**
 * @brief Signature of an inverse standard normal CDF
 */
using InverseNormalCdf = double (*)(double p);

/**
 * @brief VaR estimator with an injected inverse normal CDF
 *
 * Stateless apart from the quantile function chosen at construction, so a
 * single instance can be shared freely.
 */
class VaREstimator final {
public:
  static constexpr size_t kMinSampleSize = 30;

  explicit VaREstimator(InverseNormalCdf inverse_cdf = &inverse_normal_cdf);

  /**
   * @brief Estimate VaR for a returns sample
   *
   * Non-finite values are dropped before the length check.
   *
   * @param returns Arithmetic returns, one per period
   * @param alpha Confidence level in (0.5, 1.0)
   * @param horizon Periods to scale to (square-root-of-time), >= 1
   * @param method Estimation method
   * @throws ValidationException if the sample is too short or a parameter is out of range
   */
  [[nodiscard]] VaRResult compute(kj::ArrayPtr<const double> returns, double alpha = 0.99,
                                  int horizon = 1,
                                  VaRMethod method = VaRMethod::Historical) const;

  /**
   * @brief Same as above with the method given by name
   */
  [[nodiscard]] VaRResult compute(kj::ArrayPtr<const double> returns, double alpha, int horizon,
                                  kj::StringPtr method) const;

  // === Utility Functions ===

  [[nodiscard]] static double calculate_mean(kj::ArrayPtr<const double> values);

  /**
   * @brief Sample standard deviation (N-1 denominator); 0 for fewer than 2 values
   */
  [[nodiscard]] static double calculate_std_dev(kj::ArrayPtr<const double> values);

  /**
   * @brief Linearly interpolated quantile of an ascending-sorted sample
   */
  [[nodiscard]] static double get_percentile(kj::ArrayPtr<const double> sorted_values,
                                             double percentile);

  /**
   * @brief Scale a one-period VaR by sqrt(horizon)
   */
  [[nodiscard]] static double scale_var_to_horizon(double var_1period, int horizon);

private:
  InverseNormalCdf inverse_cdf_;
};

/**
 * @brief compute_var with the default estimator
 */
[[nodiscard]] VaRResult compute_var(kj::ArrayPtr<const double> returns, double alpha = 0.99,
                                    int horizon = 1, VaRMethod method = VaRMethod::Historical);

[[nodiscard]] VaRResult compute_var(kj::ArrayPtr<const double> returns, double alpha,
                                    int horizon, kj::StringPtr method);

/**
 * @brief Deterministic i.i.d. normal returns
 */
[[nodiscard]] kj::Array<double> generate_normal_returns(size_t count, double mean, double std_dev,
                                                        uint64_t seed);

} // namespace peaktrade::risk
