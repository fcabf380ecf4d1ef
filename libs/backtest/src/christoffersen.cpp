#include "peaktrade/backtest/christoffersen.h"

#include "peaktrade/backtest/kupiec.h"
#include "peaktrade/core/error.h"
#include "peaktrade/risk/distributions.h"

#include <algorithm>
#include <cmath>

namespace peaktrade::backtest {

namespace {

constexpr double kProbEpsilon = 1e-12;

double clamp_probability(double p) {
  return std::clamp(p, kProbEpsilon, 1.0 - kProbEpsilon);
}

void validate_test_alpha(double test_alpha) {
  if (!(test_alpha > 0.0 && test_alpha < 1.0)) {
    throw core::ValidationException(
        kj::str("test significance level must lie in (0, 1), got ", test_alpha));
  }
}

} // namespace

TransitionCounts count_transitions(kj::ArrayPtr<const bool> exceedances) {
  TransitionCounts counts;
  for (size_t t = 1; t < exceedances.size(); ++t) {
    bool prev = exceedances[t - 1];
    bool curr = exceedances[t];
    if (!prev && !curr) {
      ++counts.n00;
    } else if (!prev && curr) {
      ++counts.n01;
    } else if (prev && !curr) {
      ++counts.n10;
    } else {
      ++counts.n11;
    }
  }
  return counts;
}

IndependenceResult christoffersen_independence_test(kj::ArrayPtr<const bool> exceedances,
                                                    double test_alpha) {
  validate_test_alpha(test_alpha);

  IndependenceResult result;
  result.transitions = count_transitions(exceedances);
  result.critical_value = risk::chi2_ppf(1.0 - test_alpha, 1);

  const auto& tc = result.transitions;
  const uint64_t n0 = tc.from_no_violation();
  const uint64_t n1 = tc.from_violation();

  if (n0 == 0 || n1 == 0) {
    result.status = TestStatus::InsufficientData;
    result.lr_statistic = 0.0;
    result.p_value = 1.0;
    result.notes = kj::str("Insufficient transitions (n0=", n0, ", n1=", n1,
                           "). Test inconclusive.");
    return result;
  }

  const double d00 = static_cast<double>(tc.n00);
  const double d01 = static_cast<double>(tc.n01);
  const double d10 = static_cast<double>(tc.n10);
  const double d11 = static_cast<double>(tc.n11);

  result.pi01 = d01 / static_cast<double>(n0);
  result.pi11 = d11 / static_cast<double>(n1);
  result.pi = (d01 + d11) / static_cast<double>(n0 + n1);

  double lr = 0.0;
  if (result.pi > kProbEpsilon && result.pi < 1.0 - kProbEpsilon) {
    const double restricted =
        (d00 + d10) * std::log(1.0 - result.pi) + (d01 + d11) * std::log(result.pi);

    const double pi01 = clamp_probability(result.pi01);
    const double pi11 = clamp_probability(result.pi11);
    const double unrestricted = d00 * std::log(1.0 - pi01) + d01 * std::log(pi01) +
                                d10 * std::log(1.0 - pi11) + d11 * std::log(pi11);

    lr = std::max(0.0, -2.0 * (restricted - unrestricted));
  }

  result.lr_statistic = lr;
  result.p_value = risk::chi2_sf(lr, 1);

  if (result.p_value >= test_alpha) {
    result.status = TestStatus::Pass;
    result.notes = kj::str("Violations are independent (p=", format_fixed(result.p_value, 4),
                           " >= ", test_alpha, ")");
  } else {
    result.status = TestStatus::Fail;
    result.notes = kj::str("Violations show clustering (p=", format_fixed(result.p_value, 4),
                           " < ", test_alpha, ")");
  }
  return result;
}

ConditionalCoverageResult christoffersen_conditional_coverage_test(
    kj::ArrayPtr<const bool> exceedances, double alpha, double test_alpha) {
  validate_test_alpha(test_alpha);
  if (!(alpha > 0.0 && alpha < 1.0)) {
    throw core::ValidationException(kj::str("confidence level must lie in (0, 1), got ", alpha));
  }

  ConditionalCoverageResult result;
  result.critical_value = risk::chi2_ppf(1.0 - test_alpha, 2);

  if (exceedances.size() < 2) {
    result.status = TestStatus::InsufficientData;
    result.notes = kj::str("Need at least 2 observations, got ", exceedances.size(), ".");
    return result;
  }

  result.lr_uc =
      kupiec_lr_statistic(exceedances.size(), count_violations(exceedances), 1.0 - alpha);
  result.lr_ind = christoffersen_independence_test(exceedances, test_alpha).lr_statistic;
  result.lr_statistic = result.lr_uc + result.lr_ind;
  result.p_value = risk::chi2_sf(result.lr_statistic, 2);

  if (result.p_value >= test_alpha) {
    result.status = TestStatus::Pass;
    result.notes = kj::str("Model has correct coverage and independent violations (p=",
                           format_fixed(result.p_value, 4), " >= ", test_alpha, ")");
  } else {
    result.status = TestStatus::Fail;
    result.notes = kj::str("Model fails conditional coverage (p=",
                           format_fixed(result.p_value, 4), " < ", test_alpha, ")");
  }
  return result;
}

} // namespace peaktrade::backtest
