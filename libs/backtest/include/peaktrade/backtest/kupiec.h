#pragma once

#include "peaktrade/backtest/types.h"

#include <kj/common.h>
#include <kj/string.h>

namespace peaktrade::backtest {

/**
 * @brief Kupiec proportion-of-failures test result
 */
struct KupiecResult {
  TestStatus status{TestStatus::InsufficientData};
  size_t n_observations{0};
  size_t n_violations{0};
  double expected_rate{0.0}; ///< 1 - alpha
  double observed_rate{0.0};
  double lr_statistic{0.0}; ///< NaN when there is insufficient data
  double p_value{0.0};      ///< NaN when there is insufficient data
  double critical_value{0.0};
  kj::String notes;

  /// Only an accepted null hypothesis counts as a pass
  [[nodiscard]] bool passed() const {
    return status == TestStatus::Pass;
  }

  /// Observed over expected violation rate
  [[nodiscard]] double violation_ratio() const;
};

/**
 * @brief Likelihood-ratio statistic for N exceedances out of T at rate p
 *
 * Uses the 0^0 = 1 convention: N = 0 gives -2T ln(1-p), N = T gives -2T ln p.
 * Never negative.
 */
[[nodiscard]] double kupiec_lr_statistic(size_t T, size_t N, double p);

/**
 * @brief Kupiec POF test
 *
 * H0: the exceedance rate equals 1 - alpha. Rejected when the statistic
 * exceeds the chi-square(1) critical value at 1 - test_alpha.
 *
 * @param exceedances Exceedance sequence
 * @param alpha VaR confidence level in (0, 1)
 * @param test_alpha Significance level of the test in (0, 1)
 * @param min_observations Below this the status is InsufficientData
 * @throws ValidationException if alpha or test_alpha lie outside (0, 1)
 */
[[nodiscard]] KupiecResult kupiec_pof_test(kj::ArrayPtr<const bool> exceedances, double alpha,
                                           double test_alpha = 0.05,
                                           size_t min_observations = 250);

} // namespace peaktrade::backtest
