#pragma once

#include "peaktrade/backtest/types.h"

#include <cstdint>
#include <kj/common.h>
#include <kj/string.h>

namespace peaktrade::backtest {

/**
 * @brief First-order Markov transition counts of an exceedance sequence
 *
 * nij counts the pairs (e[t-1] = i, e[t] = j).
 */
struct TransitionCounts {
  uint64_t n00{0};
  uint64_t n01{0};
  uint64_t n10{0};
  uint64_t n11{0};

  [[nodiscard]] uint64_t from_no_violation() const {
    return n00 + n01;
  }
  [[nodiscard]] uint64_t from_violation() const {
    return n10 + n11;
  }
  [[nodiscard]] uint64_t total() const {
    return n00 + n01 + n10 + n11;
  }
};

[[nodiscard]] TransitionCounts count_transitions(kj::ArrayPtr<const bool> exceedances);

/**
 * @brief Christoffersen independence test result
 *
 * InsufficientData means no transition starts in one of the two states;
 * independence cannot be rejected then, so the result still counts as passed.
 */
struct IndependenceResult {
  TestStatus status{TestStatus::InsufficientData};
  TransitionCounts transitions;
  double pi01{0.0}; ///< P(violation | no violation yesterday)
  double pi11{0.0}; ///< P(violation | violation yesterday)
  double pi{0.0};   ///< Unconditional transition-into-violation rate
  double lr_statistic{0.0};
  double p_value{1.0};
  double critical_value{0.0};
  kj::String notes;

  [[nodiscard]] bool passed() const {
    return status != TestStatus::Fail;
  }
};

/**
 * @brief Christoffersen conditional coverage result (LR_uc + LR_ind, chi-square(2))
 */
struct ConditionalCoverageResult {
  TestStatus status{TestStatus::InsufficientData};
  double lr_uc{0.0};
  double lr_ind{0.0};
  double lr_statistic{0.0};
  double p_value{1.0};
  double critical_value{0.0};
  kj::String notes;

  [[nodiscard]] bool passed() const {
    return status == TestStatus::Pass;
  }
};

/**
 * @brief Test H0: exceedances are serially independent
 * @throws ValidationException if test_alpha lies outside (0, 1)
 */
[[nodiscard]] IndependenceResult christoffersen_independence_test(
    kj::ArrayPtr<const bool> exceedances, double test_alpha = 0.05);

/**
 * @brief Joint test of correct coverage at 1 - alpha and independence
 * @throws ValidationException if alpha or test_alpha lie outside (0, 1)
 */
[[nodiscard]] ConditionalCoverageResult christoffersen_conditional_coverage_test(
    kj::ArrayPtr<const bool> exceedances, double alpha, double test_alpha = 0.05);

} // namespace peaktrade::backtest
