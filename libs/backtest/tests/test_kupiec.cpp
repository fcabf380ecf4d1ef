#include "peaktrade/backtest/kupiec.h"
#include "peaktrade/core/error.h"
#include "test_utilities.h"

#include <cmath>
#include <kj/test.h>

namespace peaktrade::backtest {
namespace {

using test::exceedances_at;
using test::exceedances_every;

bool near(double a, double b, double tol = 1e-4) {
  return std::abs(a - b) < tol;
}

KJ_TEST("Kupiec LR statistic") {
  KJ_EXPECT(near(kupiec_lr_statistic(250, 2, 0.01), 0.108435));
  KJ_EXPECT(near(kupiec_lr_statistic(250, 10, 0.01), 12.955491));
  // Observed rate equal to the expected rate
  KJ_EXPECT(kupiec_lr_statistic(500, 5, 0.01) < 1e-9);
  KJ_EXPECT(kupiec_lr_statistic(0, 0, 0.01) == 0.0);
}

KJ_TEST("Kupiec LR statistic at the boundaries") {
  KJ_EXPECT(near(kupiec_lr_statistic(250, 0, 0.01), -2.0 * 250 * std::log(0.99)));
  KJ_EXPECT(near(kupiec_lr_statistic(250, 250, 0.01), -2.0 * 250 * std::log(0.01)));
  for (size_t n = 0; n <= 20; ++n) {
    KJ_EXPECT(kupiec_lr_statistic(250, n, 0.01) >= 0.0, n);
  }
}

KJ_TEST("Kupiec POF: well calibrated model passes") {
  auto exc = exceedances_at(250, {10, 100});
  auto result = kupiec_pof_test(exc, 0.99);

  KJ_EXPECT(result.status == TestStatus::Pass);
  KJ_EXPECT(result.passed());
  KJ_EXPECT(result.n_observations == 250);
  KJ_EXPECT(result.n_violations == 2);
  KJ_EXPECT(near(result.expected_rate, 0.01, 1e-12));
  KJ_EXPECT(near(result.observed_rate, 0.008, 1e-12));
  KJ_EXPECT(near(result.lr_statistic, 0.108435));
  KJ_EXPECT(near(result.p_value, 0.741933));
  KJ_EXPECT(near(result.critical_value, 3.841459));
  KJ_EXPECT(near(result.violation_ratio(), 0.8, 1e-12));
  KJ_EXPECT(result.notes.contains("acceptable"_kj), result.notes);
}

KJ_TEST("Kupiec POF: too many violations is rejected") {
  auto exc = exceedances_every(250, 25);
  auto result = kupiec_pof_test(exc, 0.99);

  KJ_EXPECT(result.n_violations == 10);
  KJ_EXPECT(result.status == TestStatus::Fail);
  KJ_EXPECT(!result.passed());
  KJ_EXPECT(result.lr_statistic > result.critical_value);
  KJ_EXPECT(near(result.p_value, 0.000319));
  KJ_EXPECT(result.notes.contains("rejected"_kj), result.notes);
}

KJ_TEST("Kupiec POF: zero violations over 250 days is rejected") {
  auto exc = exceedances_at(250, {});
  auto result = kupiec_pof_test(exc, 0.99);

  KJ_EXPECT(result.status == TestStatus::Fail);
  KJ_EXPECT(near(result.lr_statistic, 5.025168));
  KJ_EXPECT(std::isfinite(result.p_value));
}

KJ_TEST("Kupiec POF: short samples are inconclusive") {
  auto exc = exceedances_at(100, {5});
  auto result = kupiec_pof_test(exc, 0.99);

  KJ_EXPECT(result.status == TestStatus::InsufficientData);
  KJ_EXPECT(!result.passed());
  KJ_EXPECT(std::isnan(result.lr_statistic));
  KJ_EXPECT(std::isnan(result.p_value));
  KJ_EXPECT(result.notes.contains("Insufficient observations"_kj), result.notes);

  auto empty = kupiec_pof_test(nullptr, 0.99);
  KJ_EXPECT(empty.status == TestStatus::InsufficientData);
}

KJ_TEST("Kupiec POF: minimum sample is configurable") {
  auto exc = exceedances_at(100, {40});
  auto result = kupiec_pof_test(exc, 0.99, 0.05, 100);
  KJ_EXPECT(result.status == TestStatus::Pass);
  KJ_EXPECT(result.lr_statistic == 0.0);
}

KJ_TEST("Kupiec POF: a stricter significance level widens acceptance") {
  auto exc = exceedances_at(250, {10, 40, 70, 100, 130, 160, 190});
  KJ_EXPECT(kupiec_pof_test(exc, 0.99, 0.05).status == TestStatus::Fail);
  KJ_EXPECT(kupiec_pof_test(exc, 0.99, 0.01).status == TestStatus::Pass);
}

KJ_TEST("Kupiec POF: invalid levels throw") {
  auto exc = exceedances_at(250, {});
  KJ_EXPECT(test::throws_with<core::ValidationException>(
      [&] { (void)kupiec_pof_test(exc, 1.0); }, "confidence"_kj));
  KJ_EXPECT(test::throws_with<core::ValidationException>(
      [&] { (void)kupiec_pof_test(exc, 0.99, 0.0); }, "significance"_kj));
}

} // namespace
} // namespace peaktrade::backtest
