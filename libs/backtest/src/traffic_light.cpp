#include "peaktrade/backtest/traffic_light.h"

#include "peaktrade/core/error.h"
#include "peaktrade/risk/distributions.h"

#include <algorithm>
#include <kj/debug.h>

namespace peaktrade::backtest {

namespace {

constexpr double kGreenCdf = 0.95;
constexpr double kYellowCdf = 0.9999;
constexpr double kBaseMultiplier = 3.0;
constexpr double kRedMultiplier = 4.0;
constexpr double kPlusFactors[] = {0.40, 0.50, 0.65, 0.75, 0.85};

void validate_alpha(double alpha) {
  if (!(alpha > 0.0 && alpha < 1.0)) {
    throw core::ValidationException(kj::str("confidence level must lie in (0, 1), got ", alpha));
  }
}

} // namespace

kj::StringPtr basel_zone_to_string(BaselZone zone) {
  switch (zone) {
  case BaselZone::Green:
    return "GREEN"_kj;
  case BaselZone::Yellow:
    return "YELLOW"_kj;
  case BaselZone::Red:
    return "RED"_kj;
  }
  return "UNKNOWN"_kj;
}

ZoneThresholds compute_zone_thresholds(size_t n_observations, double alpha) {
  validate_alpha(alpha);
  const double p = 1.0 - alpha;
  const auto n = static_cast<int64_t>(n_observations);

  int64_t green = -1;
  int64_t yellow = -1;
  for (int64_t k = 0; k <= n; ++k) {
    double cdf = risk::binomial_cdf(k, n, p);
    if (cdf < kGreenCdf) {
      green = k;
    }
    if (cdf < kYellowCdf) {
      yellow = k;
    } else {
      break;
    }
  }

  ZoneThresholds thresholds;
  thresholds.green = std::max<int64_t>(0, green);
  thresholds.yellow = std::max(thresholds.green + 1, yellow);
  return thresholds;
}

TrafficLightResult basel_traffic_light(size_t n_violations, size_t n_observations, double alpha) {
  validate_alpha(alpha);
  if (n_violations > n_observations) {
    throw core::ValidationException(kj::str("violations (", n_violations,
                                            ") exceed observations (", n_observations, ")"));
  }

  TrafficLightResult result;
  result.n_violations = n_violations;
  result.n_observations = n_observations;
  result.expected_violations = static_cast<double>(n_observations) * (1.0 - alpha);
  result.violation_rate =
      n_observations > 0 ? static_cast<double>(n_violations) / static_cast<double>(n_observations)
                         : 0.0;
  result.thresholds = compute_zone_thresholds(n_observations, alpha);

  const auto k = static_cast<int64_t>(n_violations);
  if (k <= result.thresholds.green) {
    result.zone = BaselZone::Green;
    result.capital_multiplier = kBaseMultiplier;
  } else if (k <= result.thresholds.yellow) {
    result.zone = BaselZone::Yellow;
    size_t step = static_cast<size_t>(k - result.thresholds.green) - 1;
    step = std::min(step, kj::size(kPlusFactors) - 1);
    result.capital_multiplier = kBaseMultiplier + kPlusFactors[step];
  } else {
    result.zone = BaselZone::Red;
    result.capital_multiplier = kRedMultiplier;
  }
  return result;
}

TrafficLightResult basel_traffic_light(kj::ArrayPtr<const bool> exceedances, double alpha,
                                       size_t window) {
  size_t n = std::min(window, exceedances.size());
  auto recent = exceedances.slice(exceedances.size() - n, exceedances.size());
  return basel_traffic_light(count_violations(recent), n, alpha);
}

kj::String traffic_light_recommendation(const TrafficLightResult& result) {
  auto counts = kj::str("   Violations: ", result.n_violations,
                        " (expected: ", format_fixed(result.expected_violations, 1), ")\n");
  auto multiplier = format_fixed(result.capital_multiplier, 2);

  switch (result.zone) {
  case BaselZone::Green:
    return kj::str("✅ GREEN ZONE: Model performance is acceptable.\n", counts,
                   "   Capital Multiplier: ", multiplier, "\n",
                   "   No action required. Continue periodic monitoring.");
  case BaselZone::Yellow:
    return kj::str("⚠️  YELLOW ZONE: Model requires increased monitoring.\n", counts,
                   "   Capital Multiplier: ", multiplier, " (+",
                   format_fixed(result.capital_multiplier - kBaseMultiplier, 2), " penalty)\n",
                   "   Actions:\n",
                   "   1. Analyze violation patterns (clustered? market stress?)\n",
                   "   2. Review model assumptions and calibration\n",
                   "   3. Consider model adjustments if trend persists\n",
                   "   4. Increase monitoring frequency");
  case BaselZone::Red:
    return kj::str("🔴 RED ZONE: Model is inadequate. IMMEDIATE ACTION REQUIRED.\n", counts,
                   "   Capital Multiplier: ", multiplier, " (MAXIMUM PENALTY)\n",
                   "   Regulatory Actions:\n",
                   "   1. INCREASE capital multiplier to ", multiplier, "\n",
                   "   2. REVISE model methodology immediately\n",
                   "   3. REPORT to risk committee and regulators\n",
                   "   4. SUSPEND model for trading until fixed\n",
                   "   5. CONDUCT root cause analysis");
  }
  KJ_UNREACHABLE;
}

// ============================================================================
// TrafficLightMonitor Implementation
// ============================================================================

TrafficLightMonitor::TrafficLightMonitor(double alpha, size_t window)
    : alpha_(alpha), buffer_(kj::heapArray<bool>(window)) {
  validate_alpha(alpha);
  if (window == 0) {
    throw core::ValidationException("traffic light window must be positive"_kj);
  }
}

TrafficLightResult TrafficLightMonitor::update(double realized_loss, double var_estimate) {
  bool violation = realized_loss > var_estimate;

  if (count_ == buffer_.size()) {
    // Overwrite the oldest observation
    if (buffer_[head_]) {
      --violations_;
    }
  } else {
    ++count_;
  }
  buffer_[head_] = violation;
  if (violation) {
    ++violations_;
  }
  head_ = (head_ + 1) % buffer_.size();

  auto result = basel_traffic_light(violations_, count_, alpha_);
  current_zone_ = result.zone;
  return result;
}

void TrafficLightMonitor::reset() {
  head_ = 0;
  count_ = 0;
  violations_ = 0;
  current_zone_ = kj::none;
}

} // namespace peaktrade::backtest
