#include "peaktrade/backtest/kupiec.h"

#include "peaktrade/core/error.h"
#include "peaktrade/risk/distributions.h"

#include <algorithm>
#include <cmath>
#include <limits>

namespace peaktrade::backtest {

namespace {

void validate_levels(double alpha, double test_alpha) {
  if (!(alpha > 0.0 && alpha < 1.0)) {
    throw core::ValidationException(kj::str("confidence level must lie in (0, 1), got ", alpha));
  }
  if (!(test_alpha > 0.0 && test_alpha < 1.0)) {
    throw core::ValidationException(
        kj::str("test significance level must lie in (0, 1), got ", test_alpha));
  }
}

} // namespace

double KupiecResult::violation_ratio() const {
  if (expected_rate <= 0.0) {
    return 0.0;
  }
  return observed_rate / expected_rate;
}

double kupiec_lr_statistic(size_t T, size_t N, double p) {
  if (T == 0) {
    return 0.0;
  }
  const double t = static_cast<double>(T);
  const double n = static_cast<double>(N);

  double lr;
  if (N == 0) {
    lr = -2.0 * t * std::log(1.0 - p);
  } else if (N == T) {
    lr = -2.0 * t * std::log(p);
  } else {
    const double p_hat = n / t;
    const double log_l0 = (t - n) * std::log(1.0 - p) + n * std::log(p);
    const double log_l1 = (t - n) * std::log(1.0 - p_hat) + n * std::log(p_hat);
    lr = -2.0 * (log_l0 - log_l1);
  }
  return std::max(0.0, lr);
}

KupiecResult kupiec_pof_test(kj::ArrayPtr<const bool> exceedances, double alpha,
                             double test_alpha, size_t min_observations) {
  validate_levels(alpha, test_alpha);

  KupiecResult result;
  result.n_observations = exceedances.size();
  result.n_violations = count_violations(exceedances);
  result.expected_rate = 1.0 - alpha;
  result.observed_rate =
      result.n_observations > 0
          ? static_cast<double>(result.n_violations) / static_cast<double>(result.n_observations)
          : 0.0;
  result.critical_value = risk::chi2_ppf(1.0 - test_alpha, 1);

  if (result.n_observations == 0 || result.n_observations < min_observations) {
    result.status = TestStatus::InsufficientData;
    result.lr_statistic = std::numeric_limits<double>::quiet_NaN();
    result.p_value = std::numeric_limits<double>::quiet_NaN();
    result.notes = kj::str("Insufficient observations (T=", result.n_observations,
                           " < minimum ", min_observations, "). Test inconclusive.");
    return result;
  }

  result.lr_statistic =
      kupiec_lr_statistic(result.n_observations, result.n_violations, result.expected_rate);
  result.p_value = risk::chi2_sf(result.lr_statistic, 1);

  if (result.lr_statistic > result.critical_value) {
    result.status = TestStatus::Fail;
    result.notes = kj::str("Model calibration rejected (p=", format_fixed(result.p_value, 4),
                           " < ", test_alpha, ")");
  } else {
    result.status = TestStatus::Pass;
    result.notes = kj::str("Model calibration acceptable (p=", format_fixed(result.p_value, 4),
                           " >= ", test_alpha, ")");
  }
  return result;
}

} // namespace peaktrade::backtest
