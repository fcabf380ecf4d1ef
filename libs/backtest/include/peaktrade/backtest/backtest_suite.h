#pragma once

#include "peaktrade/backtest/christoffersen.h"
#include "peaktrade/backtest/duration_diagnostic.h"
#include "peaktrade/backtest/kupiec.h"
#include "peaktrade/backtest/rolling_evaluation.h"
#include "peaktrade/backtest/traffic_light.h"

#include <kj/common.h>

namespace peaktrade::backtest {

/**
 * @brief Knobs for run_backtest_suite
 */
struct SuiteOptions {
  double test_alpha{0.05};
  size_t min_observations{250}; ///< Kupiec minimum sample
  size_t basel_window{250};

  bool enable_duration_diagnostic{false};
  bool enable_exponential_test{false};

  bool enable_rolling{false};
  size_t rolling_window_size{250};
  kj::Maybe<size_t> rolling_step_size;
  size_t min_window_size{100};
};

/**
 * @brief Aggregated result of every test in the suite
 */
struct BacktestVerdict {
  size_t n_observations{0};
  size_t n_violations{0};
  double alpha{0.99};
  double test_alpha{0.05};
  double violation_rate{0.0};

  KupiecResult kupiec;
  IndependenceResult independence;
  ConditionalCoverageResult conditional_coverage;
  TrafficLightResult traffic_light;

  kj::Maybe<DurationDiagnosticResult> duration;
  kj::Maybe<RollingEvaluationResult> rolling;

  /// Core tests passed and the traffic light is not red
  bool overall_pass{false};

  /// Kupiec, independence and conditional coverage all passed
  [[nodiscard]] bool core_tests_passed() const {
    return kupiec.passed() && independence.passed() && conditional_coverage.passed();
  }
};

/**
 * @brief Run the core tests plus the enabled optional diagnostics
 *
 * Optional diagnostics never change overall_pass.
 *
 * @throws ValidationException on invalid levels or rolling parameters
 */
[[nodiscard]] BacktestVerdict run_backtest_suite(kj::ArrayPtr<const bool> exceedances,
                                                 double alpha, const SuiteOptions& options = {});

} // namespace peaktrade::backtest
