#include "peaktrade/risk/var_models.h"

#include "peaktrade/core/error.h"

#include <algorithm>
#include <cmath>
#include <kj/vector.h>
#include <numeric>

namespace peaktrade::risk {

kj::StringPtr var_method_to_string(VaRMethod method) {
  switch (method) {
  case VaRMethod::Historical:
    return "historical"_kj;
  case VaRMethod::ParametricNormal:
    return "parametric_normal"_kj;
  }
  return "unknown"_kj;
}

VaRMethod parse_var_method(kj::StringPtr name) {
  if (name == "historical"_kj) {
    return VaRMethod::Historical;
  }
  if (name == "parametric_normal"_kj) {
    return VaRMethod::ParametricNormal;
  }
  throw core::ValidationException(
      kj::str("Unknown VaR method '", name, "' (expected historical or parametric_normal)"));
}

// ============================================================================
// VaREstimator Implementation
// ============================================================================

VaREstimator::VaREstimator(InverseNormalCdf inverse_cdf) : inverse_cdf_(inverse_cdf) {
  PEAKTRADE_REQUIRE(inverse_cdf_ != nullptr, "inverse normal CDF must be provided");
}

VaRResult VaREstimator::compute(kj::ArrayPtr<const double> returns, double alpha, int horizon,
                                VaRMethod method) const {
  if (!(alpha > 0.5 && alpha < 1.0)) {
    throw core::ValidationException(kj::str("alpha must lie in (0.5, 1.0), got ", alpha));
  }
  if (horizon < 1) {
    throw core::ValidationException(kj::str("horizon must be >= 1, got ", horizon));
  }

  kj::Vector<double> clean(returns.size());
  for (double r : returns) {
    if (std::isfinite(r)) {
      clean.add(r);
    }
  }

  if (clean.size() < kMinSampleSize) {
    throw core::ValidationException(kj::str("returns too short: need at least ", kMinSampleSize,
                                            " finite observations, got ", clean.size()));
  }

  double var_1period = 0.0;
  switch (method) {
  case VaRMethod::Historical: {
    std::sort(clean.begin(), clean.end());
    double quantile = get_percentile(clean.asPtr(), 1.0 - alpha);
    var_1period = std::max(0.0, -quantile);
    break;
  }
  case VaRMethod::ParametricNormal: {
    double mean = calculate_mean(clean.asPtr());
    double std_dev = calculate_std_dev(clean.asPtr());
    if (std_dev <= 0.0) {
      // Constant returns carry no measurable risk
      return VaRResult(method, alpha, horizon, 0.0, clean.size());
    }
    double z = inverse_cdf_(1.0 - alpha);
    var_1period = std::max(0.0, -(mean + z * std_dev));
    break;
  }
  }

  return VaRResult(method, alpha, horizon, scale_var_to_horizon(var_1period, horizon),
                   clean.size());
}

VaRResult VaREstimator::compute(kj::ArrayPtr<const double> returns, double alpha, int horizon,
                                kj::StringPtr method) const {
  return compute(returns, alpha, horizon, parse_var_method(method));
}

double VaREstimator::calculate_mean(kj::ArrayPtr<const double> values) {
  if (values.size() == 0) {
    return 0.0;
  }
  double sum = std::accumulate(values.begin(), values.end(), 0.0);
  return sum / static_cast<double>(values.size());
}

double VaREstimator::calculate_std_dev(kj::ArrayPtr<const double> values) {
  if (values.size() < 2) {
    return 0.0;
  }

  double mean = calculate_mean(values);
  double sum_sq = 0.0;
  for (double v : values) {
    sum_sq += (v - mean) * (v - mean);
  }
  return std::sqrt(sum_sq / static_cast<double>(values.size() - 1));
}

double VaREstimator::get_percentile(kj::ArrayPtr<const double> sorted_values, double percentile) {
  if (sorted_values.size() == 0) {
    return 0.0;
  }

  double index = percentile * static_cast<double>(sorted_values.size() - 1);
  size_t lower = static_cast<size_t>(std::floor(index));
  size_t upper = static_cast<size_t>(std::ceil(index));

  if (lower == upper || upper >= sorted_values.size()) {
    return sorted_values[lower];
  }

  // Linear interpolation
  double fraction = index - static_cast<double>(lower);
  return sorted_values[lower] + fraction * (sorted_values[upper] - sorted_values[lower]);
}

double VaREstimator::scale_var_to_horizon(double var_1period, int horizon) {
  if (horizon <= 1) {
    return var_1period;
  }
  return var_1period * std::sqrt(static_cast<double>(horizon));
}

// ============================================================================
// Free functions
// ============================================================================

VaRResult compute_var(kj::ArrayPtr<const double> returns, double alpha, int horizon,
                      VaRMethod method) {
  static const VaREstimator estimator;
  return estimator.compute(returns, alpha, horizon, method);
}

VaRResult compute_var(kj::ArrayPtr<const double> returns, double alpha, int horizon,
                      kj::StringPtr method) {
  return compute_var(returns, alpha, horizon, parse_var_method(method));
}

kj::Array<double> generate_normal_returns(size_t count, double mean, double std_dev,
                                          uint64_t seed) {
  XorShiftRng rng(seed);
  auto builder = kj::heapArrayBuilder<double>(count);
  for (size_t i = 0; i < count; ++i) {
    builder.add(mean + std_dev * rng.next_normal());
  }
  return builder.finish();
}

} // namespace peaktrade::risk
