#pragma once

#include "peaktrade/backtest/christoffersen.h"
#include "peaktrade/backtest/kupiec.h"
#include "peaktrade/backtest/types.h"

#include <cstdint>
#include <kj/common.h>
#include <kj/string.h>
#include <kj/vector.h>

namespace peaktrade::backtest {

/**
 * @brief Core test results for one window [start_index, end_index)
 */
struct RollingWindowResult {
  size_t window_id{0};
  size_t start_index{0};
  size_t end_index{0};
  size_t n_observations{0};
  size_t n_violations{0};
  KupiecResult kupiec;
  IndependenceResult independence;
  ConditionalCoverageResult conditional_coverage;

  [[nodiscard]] bool all_passed() const {
    return kupiec.passed() && independence.passed() && conditional_coverage.passed();
  }
};

enum class StabilityAssessment : std::uint8_t {
  NoWindows = 0,
  Stable = 1,   ///< all-pass rate >= 90%
  Moderate = 2, ///< all-pass rate >= 75%
  Unstable = 3, ///< all-pass rate >= 50%
  Critical = 4,
};

[[nodiscard]] kj::StringPtr stability_assessment_to_string(StabilityAssessment assessment);

struct RollingSummary {
  size_t n_windows{0};
  double kupiec_pass_rate{0.0};
  double independence_pass_rate{0.0};
  double cc_pass_rate{0.0};
  double all_pass_rate{0.0};
  double worst_kupiec_p_value{1.0};
  double worst_independence_p_value{1.0};
  double worst_cc_p_value{1.0};
  /// Fraction of adjacent window pairs with the same all-pass outcome
  double verdict_stability{1.0};
  StabilityAssessment assessment{StabilityAssessment::NoWindows};
  kj::String notes;
};

/**
 * @brief Criterion for RollingEvaluationResult::worst_window
 */
enum class WorstWindowCriterion : std::uint8_t {
  KupiecPValue = 0,
  IndependencePValue = 1,
  ConditionalCoveragePValue = 2,
  Violations = 3,
};

/**
 * @brief Parse "kupiec_p_value", "independence_p_value", "cc_p_value" or "n_violations"
 * @throws ValidationException for any other name
 */
[[nodiscard]] WorstWindowCriterion parse_worst_window_criterion(kj::StringPtr name);

struct RollingEvaluationResult {
  size_t window_size{0};
  size_t step_size{0};
  size_t n_total{0};
  kj::Vector<RollingWindowResult> windows;
  RollingSummary summary;

  /// Windows where at least one core test did not pass
  [[nodiscard]] kj::Vector<const RollingWindowResult*> failing_windows() const;

  /**
   * @brief Window with the lowest p-value, or the most violations
   * @throws ValidationException when there are no windows
   */
  [[nodiscard]] const RollingWindowResult& worst_window(
      WorstWindowCriterion criterion = WorstWindowCriterion::KupiecPValue) const;
};

struct RollingOptions {
  size_t window_size{250};
  kj::Maybe<size_t> step_size; ///< Defaults to window_size (non-overlapping)
  double test_alpha{0.05};
  size_t min_window_size{100};
};

/**
 * @brief Re-run the three core tests over sliding windows
 *
 * A window larger than the input yields zero windows.
 *
 * @throws ValidationException if window_size < min_window_size or step_size == 0
 */
[[nodiscard]] RollingEvaluationResult rolling_evaluation(kj::ArrayPtr<const bool> exceedances,
                                                         double alpha,
                                                         const RollingOptions& options);

} // namespace peaktrade::backtest
