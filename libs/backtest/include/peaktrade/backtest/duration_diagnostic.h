#pragma once

#include "peaktrade/backtest/types.h"

#include <kj/array.h>
#include <kj/common.h>
#include <kj/string.h>

namespace peaktrade::backtest {

/**
 * @brief Anderson-Darling fit of durations against Exponential(rate)
 */
struct ExponentialTestResult {
  size_t n_durations{0};
  double statistic{0.0}; ///< A^2
  double critical_value{2.5};
  bool passed{true};
  kj::String notes;
};

/**
 * @brief Inter-exceedance duration diagnostic
 *
 * Under i.i.d. exceedances at rate 1 - alpha, durations are geometric with
 * mean 1 / (1 - alpha). A mean far below that points to clustering.
 */
struct DurationDiagnosticResult {
  TestStatus status{TestStatus::InsufficientData}; ///< Fail iff suspicious
  size_t n_violations{0};
  kj::Array<size_t> durations;
  double mean_duration{0.0};
  double std_duration{0.0};
  double expected_duration{0.0};
  double duration_ratio{0.0};
  double clustering_score{0.0};
  kj::String notes;
  kj::Maybe<ExponentialTestResult> exponential_test;

  /// True iff the mean duration is under half the expected one
  [[nodiscard]] bool is_suspicious(double threshold = 0.5) const;
};

/**
 * @brief Index gaps between consecutive exceedances
 */
[[nodiscard]] kj::Array<size_t> extract_durations(kj::ArrayPtr<const bool> exceedances);

/**
 * @brief Run the duration diagnostic
 *
 * Fewer than two exceedances gives InsufficientData with NaN statistics.
 *
 * @param alpha VaR confidence level in (0, 1)
 * @param enable_exponential_test Attach the Anderson-Darling fit (needs >= 3 durations)
 * @throws ValidationException if alpha is out of range
 */
[[nodiscard]] DurationDiagnosticResult duration_diagnostic(kj::ArrayPtr<const bool> exceedances,
                                                           double alpha,
                                                           bool enable_exponential_test = false);

/**
 * @brief Anderson-Darling statistic for Exponential(rate); none with fewer than 3 durations
 */
[[nodiscard]] kj::Maybe<ExponentialTestResult>
exponential_goodness_of_fit(kj::ArrayPtr<const size_t> durations, double rate);

} // namespace peaktrade::backtest
