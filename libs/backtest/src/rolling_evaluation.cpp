#include "peaktrade/backtest/rolling_evaluation.h"

#include "peaktrade/core/error.h"

#include <cmath>

namespace peaktrade::backtest {

namespace {

// Lowest non-NaN value; 1.0 if every value is NaN
template <typename Fn>
double worst_p_value(const kj::Vector<RollingWindowResult>& windows, Fn&& p_value_of) {
  double worst = 1.0;
  for (const auto& w : windows) {
    double p = p_value_of(w);
    if (!std::isnan(p) && p < worst) {
      worst = p;
    }
  }
  return worst;
}

RollingSummary summarize(const kj::Vector<RollingWindowResult>& windows) {
  RollingSummary summary;
  summary.n_windows = windows.size();

  if (windows.size() == 0) {
    summary.assessment = StabilityAssessment::NoWindows;
    summary.notes = kj::str("No windows evaluated: input shorter than one window.");
    return summary;
  }

  size_t kupiec_passed = 0;
  size_t independence_passed = 0;
  size_t cc_passed = 0;
  size_t all_passed = 0;
  for (const auto& w : windows) {
    kupiec_passed += w.kupiec.passed() ? 1 : 0;
    independence_passed += w.independence.passed() ? 1 : 0;
    cc_passed += w.conditional_coverage.passed() ? 1 : 0;
    all_passed += w.all_passed() ? 1 : 0;
  }

  const double n = static_cast<double>(windows.size());
  summary.kupiec_pass_rate = static_cast<double>(kupiec_passed) / n;
  summary.independence_pass_rate = static_cast<double>(independence_passed) / n;
  summary.cc_pass_rate = static_cast<double>(cc_passed) / n;
  summary.all_pass_rate = static_cast<double>(all_passed) / n;

  summary.worst_kupiec_p_value =
      worst_p_value(windows, [](const RollingWindowResult& w) { return w.kupiec.p_value; });
  summary.worst_independence_p_value =
      worst_p_value(windows, [](const RollingWindowResult& w) { return w.independence.p_value; });
  summary.worst_cc_p_value = worst_p_value(
      windows, [](const RollingWindowResult& w) { return w.conditional_coverage.p_value; });

  if (windows.size() < 2) {
    summary.verdict_stability = 1.0;
  } else {
    size_t agreements = 0;
    for (size_t i = 1; i < windows.size(); ++i) {
      if (windows[i].all_passed() == windows[i - 1].all_passed()) {
        ++agreements;
      }
    }
    summary.verdict_stability =
        static_cast<double>(agreements) / static_cast<double>(windows.size() - 1);
  }

  if (summary.all_pass_rate >= 0.9) {
    summary.assessment = StabilityAssessment::Stable;
    summary.notes = kj::str("✅ STABLE: ≥90% of windows passed all tests. "
                            "Model shows consistent performance over time.");
  } else if (summary.all_pass_rate >= 0.75) {
    summary.assessment = StabilityAssessment::Moderate;
    summary.notes = kj::str("⚠️  MODERATE: 75-90% of windows passed. "
                            "Some instability detected. Investigate failing windows.");
  } else if (summary.all_pass_rate >= 0.5) {
    summary.assessment = StabilityAssessment::Unstable;
    summary.notes = kj::str("⚠️  UNSTABLE: 50-75% of windows passed. "
                            "Significant time-varying performance. Model may be degrading.");
  } else {
    summary.assessment = StabilityAssessment::Critical;
    summary.notes = kj::str("❌ CRITICAL: <50% of windows passed. "
                            "Model shows poor performance across multiple periods.");
  }
  return summary;
}

} // namespace

kj::StringPtr stability_assessment_to_string(StabilityAssessment assessment) {
  switch (assessment) {
  case StabilityAssessment::NoWindows:
    return "NO_WINDOWS"_kj;
  case StabilityAssessment::Stable:
    return "STABLE"_kj;
  case StabilityAssessment::Moderate:
    return "MODERATE"_kj;
  case StabilityAssessment::Unstable:
    return "UNSTABLE"_kj;
  case StabilityAssessment::Critical:
    return "CRITICAL"_kj;
  }
  return "UNKNOWN"_kj;
}

WorstWindowCriterion parse_worst_window_criterion(kj::StringPtr name) {
  if (name == "kupiec_p_value"_kj) {
    return WorstWindowCriterion::KupiecPValue;
  }
  if (name == "independence_p_value"_kj) {
    return WorstWindowCriterion::IndependencePValue;
  }
  if (name == "cc_p_value"_kj) {
    return WorstWindowCriterion::ConditionalCoveragePValue;
  }
  if (name == "n_violations"_kj) {
    return WorstWindowCriterion::Violations;
  }
  throw core::ValidationException(
      kj::str("Unknown criterion: ", name,
              ". Choose from: kupiec_p_value, independence_p_value, cc_p_value, n_violations"));
}

kj::Vector<const RollingWindowResult*> RollingEvaluationResult::failing_windows() const {
  kj::Vector<const RollingWindowResult*> failing;
  for (const auto& w : windows) {
    if (!w.all_passed()) {
      failing.add(&w);
    }
  }
  return failing;
}

const RollingWindowResult&
RollingEvaluationResult::worst_window(WorstWindowCriterion criterion) const {
  if (windows.size() == 0) {
    throw core::ValidationException("No windows to evaluate"_kj);
  }

  const RollingWindowResult* worst = &windows[0];
  for (const auto& w : windows) {
    bool worse = false;
    switch (criterion) {
    case WorstWindowCriterion::KupiecPValue:
      worse = w.kupiec.p_value < worst->kupiec.p_value;
      break;
    case WorstWindowCriterion::IndependencePValue:
      worse = w.independence.p_value < worst->independence.p_value;
      break;
    case WorstWindowCriterion::ConditionalCoveragePValue:
      worse = w.conditional_coverage.p_value < worst->conditional_coverage.p_value;
      break;
    case WorstWindowCriterion::Violations:
      worse = w.n_violations > worst->n_violations;
      break;
    }
    if (worse) {
      worst = &w;
    }
  }
  return *worst;
}

RollingEvaluationResult rolling_evaluation(kj::ArrayPtr<const bool> exceedances, double alpha,
                                           const RollingOptions& options) {
  if (options.window_size < options.min_window_size) {
    throw core::ValidationException(kj::str("window_size (", options.window_size,
                                            ") must be >= min_window_size (",
                                            options.min_window_size, ")"));
  }
  size_t step = options.window_size;
  KJ_IF_SOME(s, options.step_size) {
    step = s;
  }
  if (step == 0) {
    throw core::ValidationException(kj::str("step_size must be positive, got ", step));
  }

  RollingEvaluationResult result;
  result.window_size = options.window_size;
  result.step_size = step;
  result.n_total = exceedances.size();

  size_t window_id = 0;
  for (size_t start = 0; start + options.window_size <= exceedances.size(); start += step) {
    auto window = exceedances.slice(start, start + options.window_size);

    RollingWindowResult w;
    w.window_id = window_id++;
    w.start_index = start;
    w.end_index = start + options.window_size;
    w.n_observations = window.size();
    w.n_violations = count_violations(window);
    w.kupiec = kupiec_pof_test(window, alpha, options.test_alpha, options.min_window_size);
    w.independence = christoffersen_independence_test(window, options.test_alpha);
    w.conditional_coverage =
        christoffersen_conditional_coverage_test(window, alpha, options.test_alpha);
    result.windows.add(kj::mv(w));
  }

  result.summary = summarize(result.windows);
  return result;
}

} // namespace peaktrade::backtest
