#include "peaktrade/backtest/backtest_suite.h"
#include "peaktrade/backtest/data_source.h"
#include "peaktrade/backtest/exceedances.h"
#include "peaktrade/core/error.h"
#include "test_utilities.h"

#include <cmath>
#include <kj/test.h>

namespace peaktrade::backtest {
namespace {

using test::exceedances_at;

bool near(double a, double b, double tol = 1e-4) {
  return std::abs(a - b) < tol;
}

ExceedanceSequence synthetic_exceedances(size_t n) {
  auto series = generate_synthetic_series(n, 0.99);
  return build_exceedances(series.returns, series.var_forecasts);
}

KJ_TEST("Suite: synthetic 250-day series passes every core test") {
  auto exc = synthetic_exceedances(250);
  auto verdict = run_backtest_suite(exc, 0.99);

  KJ_EXPECT(verdict.n_observations == 250);
  KJ_EXPECT(verdict.n_violations == 2);
  KJ_EXPECT(near(verdict.violation_rate, 0.008));
  KJ_EXPECT(verdict.alpha == 0.99);
  KJ_EXPECT(verdict.test_alpha == 0.05);

  KJ_EXPECT(verdict.kupiec.status == TestStatus::Pass);
  KJ_EXPECT(near(verdict.kupiec.p_value, 0.741933));
  KJ_EXPECT(verdict.independence.passed());
  KJ_EXPECT(near(verdict.independence.p_value, 0.857177));
  KJ_EXPECT(verdict.conditional_coverage.passed());
  KJ_EXPECT(near(verdict.conditional_coverage.p_value, 0.932010));
  KJ_EXPECT(verdict.traffic_light.zone == BaselZone::Green);

  KJ_EXPECT(verdict.core_tests_passed());
  KJ_EXPECT(verdict.overall_pass);
  KJ_EXPECT(verdict.duration == kj::none);
  KJ_EXPECT(verdict.rolling == kj::none);
}

KJ_TEST("Suite: optional diagnostics are attached but never change the verdict") {
  auto exc = synthetic_exceedances(1000);

  auto plain = run_backtest_suite(exc, 0.99);

  SuiteOptions options;
  options.enable_duration_diagnostic = true;
  options.enable_exponential_test = true;
  options.enable_rolling = true;
  auto full = run_backtest_suite(exc, 0.99, options);

  KJ_EXPECT(full.overall_pass == plain.overall_pass);
  KJ_EXPECT(full.kupiec.p_value == plain.kupiec.p_value);

  auto& duration = KJ_ASSERT_NONNULL(full.duration);
  KJ_EXPECT(duration.n_violations == 10);
  KJ_EXPECT(duration.exponential_test != kj::none);

  auto& rolling = KJ_ASSERT_NONNULL(full.rolling);
  KJ_EXPECT(rolling.windows.size() == 4);
  KJ_EXPECT(rolling.windows[0].n_violations == 3);
  KJ_EXPECT(rolling.windows[1].n_violations == 2);
  KJ_EXPECT(rolling.windows[2].n_violations == 2);
  KJ_EXPECT(rolling.windows[3].n_violations == 3);
}

KJ_TEST("Suite: clustered violations fail independence and the verdict") {
  auto exc = exceedances_at(250, {100, 101, 102, 103, 104});
  auto verdict = run_backtest_suite(exc, 0.99);

  KJ_EXPECT(verdict.kupiec.passed());
  KJ_EXPECT(!verdict.independence.passed());
  KJ_EXPECT(!verdict.conditional_coverage.passed());
  KJ_EXPECT(verdict.traffic_light.zone == BaselZone::Yellow);
  KJ_EXPECT(!verdict.core_tests_passed());
  KJ_EXPECT(!verdict.overall_pass);
}

KJ_TEST("Suite: a red traffic light fails the verdict even when core tests pass") {
  // Ten isolated exceedances, all within the last 250 of 1000 days
  auto exc = test::exceedances_every(1000, 25, 750);
  auto verdict = run_backtest_suite(exc, 0.99);

  KJ_EXPECT(verdict.n_violations == 10);
  KJ_EXPECT(verdict.core_tests_passed());
  KJ_EXPECT(verdict.traffic_light.n_observations == 250);
  KJ_EXPECT(verdict.traffic_light.is_red());
  KJ_EXPECT(!verdict.overall_pass);
}

KJ_TEST("Suite: zero violations is a structured result, not an exception") {
  auto exc = exceedances_at(250, {});
  auto verdict = run_backtest_suite(exc, 0.99);

  KJ_EXPECT(verdict.kupiec.status == TestStatus::Fail);
  KJ_EXPECT(verdict.independence.status == TestStatus::InsufficientData);
  KJ_EXPECT(verdict.traffic_light.zone == BaselZone::Green);
  KJ_EXPECT(!verdict.overall_pass);
}

KJ_TEST("Suite: short series are inconclusive for Kupiec") {
  auto exc = exceedances_at(50, {});
  SuiteOptions options;
  options.enable_duration_diagnostic = true;
  options.enable_rolling = true;
  auto verdict = run_backtest_suite(exc, 0.99, options);

  KJ_EXPECT(verdict.kupiec.status == TestStatus::InsufficientData);
  KJ_EXPECT(!verdict.overall_pass);
  KJ_EXPECT(KJ_ASSERT_NONNULL(verdict.duration).status == TestStatus::InsufficientData);
  KJ_EXPECT(KJ_ASSERT_NONNULL(verdict.rolling).windows.size() == 0);
}

KJ_TEST("Suite: identical inputs give identical verdicts") {
  auto exc = synthetic_exceedances(500);
  SuiteOptions options;
  options.enable_rolling = true;
  options.rolling_step_size = size_t(125);

  auto first = run_backtest_suite(exc, 0.99, options);
  auto second = run_backtest_suite(exc, 0.99, options);
  KJ_EXPECT(first.kupiec.lr_statistic == second.kupiec.lr_statistic);
  KJ_EXPECT(first.conditional_coverage.p_value == second.conditional_coverage.p_value);
  KJ_EXPECT(KJ_ASSERT_NONNULL(first.rolling).summary.all_pass_rate ==
            KJ_ASSERT_NONNULL(second.rolling).summary.all_pass_rate);
}

KJ_TEST("Suite: invalid rolling configuration propagates") {
  auto exc = synthetic_exceedances(500);
  SuiteOptions options;
  options.enable_rolling = true;
  options.rolling_window_size = 20;
  KJ_EXPECT(test::throws_with<core::ValidationException>(
      [&] { (void)run_backtest_suite(exc, 0.99, options); }));
}

} // namespace
} // namespace peaktrade::backtest
