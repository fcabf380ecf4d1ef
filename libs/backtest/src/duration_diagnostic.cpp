#include "peaktrade/backtest/duration_diagnostic.h"

#include "peaktrade/backtest/exceedances.h"
#include "peaktrade/core/error.h"

#include <algorithm>
#include <cmath>
#include <kj/vector.h>
#include <limits>

namespace peaktrade::backtest {

namespace {

constexpr double kEpsilon = 1e-12;
constexpr double kAdCriticalValue = 2.5;

double exponential_cdf(double x, double rate) {
  double f = 1.0 - std::exp(-rate * x);
  return std::clamp(f, kEpsilon, 1.0 - kEpsilon);
}

} // namespace

bool DurationDiagnosticResult::is_suspicious(double threshold) const {
  if (status == TestStatus::InsufficientData) {
    return false;
  }
  return duration_ratio < threshold;
}

kj::Array<size_t> extract_durations(kj::ArrayPtr<const bool> exceedances) {
  auto indices = exceedance_indices(exceedances);
  if (indices.size() < 2) {
    return nullptr;
  }
  auto builder = kj::heapArrayBuilder<size_t>(indices.size() - 1);
  for (size_t i = 1; i < indices.size(); ++i) {
    builder.add(indices[i] - indices[i - 1]);
  }
  return builder.finish();
}

DurationDiagnosticResult duration_diagnostic(kj::ArrayPtr<const bool> exceedances, double alpha,
                                             bool enable_exponential_test) {
  if (!(alpha > 0.0 && alpha < 1.0)) {
    throw core::ValidationException(kj::str("confidence level must lie in (0, 1), got ", alpha));
  }

  const double expected_rate = 1.0 - alpha;
  const double nan = std::numeric_limits<double>::quiet_NaN();

  DurationDiagnosticResult result;
  result.n_violations = count_violations(exceedances);
  result.durations = extract_durations(exceedances);
  result.expected_duration = 1.0 / expected_rate;

  if (result.durations.size() == 0) {
    result.status = TestStatus::InsufficientData;
    result.mean_duration = nan;
    result.std_duration = nan;
    result.duration_ratio = nan;
    result.clustering_score = nan;
    result.notes = kj::str("Insufficient data: need at least 2 exceedances for duration analysis");
    return result;
  }

  const size_t n = result.durations.size();
  double sum = 0.0;
  for (size_t d : result.durations) {
    sum += static_cast<double>(d);
  }
  result.mean_duration = sum / static_cast<double>(n);

  if (n > 1) {
    double sum_sq = 0.0;
    for (size_t d : result.durations) {
      double diff = static_cast<double>(d) - result.mean_duration;
      sum_sq += diff * diff;
    }
    result.std_duration = std::sqrt(sum_sq / static_cast<double>(n - 1));
  }

  result.duration_ratio = result.mean_duration / result.expected_duration;
  result.clustering_score =
      std::abs(result.mean_duration - result.expected_duration) / result.expected_duration;

  if (result.duration_ratio < 0.5) {
    result.notes = kj::str("⚠️  DIAGNOSTIC: Duration ratio < 0.5 suggests potential clustering. "
                           "Verify with Christoffersen Independence Test.");
  } else if (result.duration_ratio > 1.5) {
    result.notes =
        kj::str("⚠️  DIAGNOSTIC: Duration ratio > 1.5 suggests violations may be too sparse. "
                "Check if model is conservative.");
  } else {
    result.notes = kj::str("✓ DIAGNOSTIC: Duration ratio within normal range [0.5, 1.5]. "
                           "No strong clustering evidence from durations.");
  }
  result.status = result.is_suspicious() ? TestStatus::Fail : TestStatus::Pass;

  if (enable_exponential_test) {
    result.exponential_test = exponential_goodness_of_fit(result.durations, expected_rate);
  }
  return result;
}

kj::Maybe<ExponentialTestResult> exponential_goodness_of_fit(kj::ArrayPtr<const size_t> durations,
                                                             double rate) {
  if (durations.size() < 3) {
    return kj::none;
  }

  kj::Vector<double> sorted(durations.size());
  for (size_t d : durations) {
    sorted.add(static_cast<double>(d));
  }
  std::sort(sorted.begin(), sorted.end());

  const size_t n = sorted.size();
  double ad_sum = 0.0;
  for (size_t i = 1; i <= n; ++i) {
    double f_low = exponential_cdf(sorted[i - 1], rate);
    double f_high = exponential_cdf(sorted[n - i], rate);
    ad_sum += static_cast<double>(2 * i - 1) * (std::log(f_low) + std::log(1.0 - f_high));
  }

  ExponentialTestResult result;
  result.n_durations = n;
  result.statistic = -static_cast<double>(n) - ad_sum / static_cast<double>(n);
  result.critical_value = kAdCriticalValue;
  result.passed = result.statistic < kAdCriticalValue;
  result.notes = kj::str("Anderson-Darling A^2=", format_fixed(result.statistic, 4),
                         ", critical~", format_fixed(kAdCriticalValue, 2), ". ",
                         result.passed ? "PASS" : "FAIL", " at 5% (approximate critical value).");
  return kj::mv(result);
}

} // namespace peaktrade::backtest
