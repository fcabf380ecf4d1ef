#include "peaktrade/backtest/backtest_suite.h"

#include "peaktrade/backtest/types.h"

namespace peaktrade::backtest {

BacktestVerdict run_backtest_suite(kj::ArrayPtr<const bool> exceedances, double alpha,
                                   const SuiteOptions& options) {
  BacktestVerdict verdict;
  verdict.n_observations = exceedances.size();
  verdict.n_violations = count_violations(exceedances);
  verdict.alpha = alpha;
  verdict.test_alpha = options.test_alpha;
  verdict.violation_rate =
      exceedances.size() == 0
          ? 0.0
          : static_cast<double>(verdict.n_violations) / static_cast<double>(exceedances.size());

  verdict.kupiec =
      kupiec_pof_test(exceedances, alpha, options.test_alpha, options.min_observations);
  verdict.independence = christoffersen_independence_test(exceedances, options.test_alpha);
  verdict.conditional_coverage =
      christoffersen_conditional_coverage_test(exceedances, alpha, options.test_alpha);
  verdict.traffic_light = basel_traffic_light(exceedances, alpha, options.basel_window);

  if (options.enable_duration_diagnostic) {
    verdict.duration = duration_diagnostic(exceedances, alpha, options.enable_exponential_test);
  }

  if (options.enable_rolling) {
    RollingOptions rolling;
    rolling.window_size = options.rolling_window_size;
    rolling.step_size = options.rolling_step_size;
    rolling.test_alpha = options.test_alpha;
    rolling.min_window_size = options.min_window_size;
    verdict.rolling = rolling_evaluation(exceedances, alpha, rolling);
  }

  verdict.overall_pass = verdict.core_tests_passed() && !verdict.traffic_light.is_red();
  return verdict;
}

} // namespace peaktrade::backtest
