#pragma once

#include "peaktrade/backtest/types.h"

#include <cstdint>
#include <kj/array.h>
#include <kj/common.h>
#include <kj/string.h>

namespace peaktrade::backtest {

/**
 * @brief Basel backtesting zones
 */
enum class BaselZone : std::uint8_t {
  Green = 0,  ///< Model acceptable
  Yellow = 1, ///< Increased monitoring, capital plus factor
  Red = 2,    ///< Model inadequate
};

/// "GREEN", "YELLOW" or "RED"
[[nodiscard]] kj::StringPtr basel_zone_to_string(BaselZone zone);

/**
 * @brief Largest exceedance counts still in the green and yellow zones
 */
struct ZoneThresholds {
  int64_t green{0};
  int64_t yellow{0};
};

/**
 * @brief Zone boundaries from the exact binomial distribution
 *
 * Green while P(X <= k) < 0.95, yellow while P(X <= k) < 0.9999, with
 * X ~ Bin(n_observations, 1 - alpha). Gives 4 and 9 for 250 observations
 * at 99%.
 */
[[nodiscard]] ZoneThresholds compute_zone_thresholds(size_t n_observations, double alpha);

struct TrafficLightResult {
  BaselZone zone{BaselZone::Green};
  size_t n_violations{0};
  size_t n_observations{0};
  double expected_violations{0.0};
  double violation_rate{0.0};
  ZoneThresholds thresholds;
  double capital_multiplier{3.0};

  [[nodiscard]] bool is_red() const {
    return zone == BaselZone::Red;
  }
};

/**
 * @brief Classify a violation count
 *
 * Capital multiplier: 3.0 in green, 3.0 plus 0.40/0.50/0.65/0.75/0.85 for the
 * first to fifth count above the green threshold, 4.0 in red.
 *
 * @param alpha VaR confidence level in (0, 1)
 * @throws ValidationException if n_violations > n_observations or alpha is out of range
 */
[[nodiscard]] TrafficLightResult basel_traffic_light(size_t n_violations, size_t n_observations,
                                                     double alpha);

/**
 * @brief Classify the most recent min(window, n) observations
 */
[[nodiscard]] TrafficLightResult basel_traffic_light(kj::ArrayPtr<const bool> exceedances,
                                                     double alpha, size_t window = 250);

/**
 * @brief Multi-line operator guidance for a zone
 */
[[nodiscard]] kj::String traffic_light_recommendation(const TrafficLightResult& result);

/**
 * @brief Streaming traffic light over a sliding window of recent observations
 */
class TrafficLightMonitor final {
public:
  explicit TrafficLightMonitor(double alpha = 0.99, size_t window = 250);

  /**
   * @brief Record one observation and reclassify the window
   * @param realized_loss Loss as a positive number (gains negative)
   * @param var_estimate VaR as a positive loss magnitude
   */
  TrafficLightResult update(double realized_loss, double var_estimate);

  void reset();

  [[nodiscard]] kj::Maybe<BaselZone> current_zone() const {
    return current_zone_;
  }
  [[nodiscard]] size_t observations() const {
    return count_;
  }

private:
  double alpha_;
  kj::Array<bool> buffer_;
  size_t head_{0};
  size_t count_{0};
  size_t violations_{0};
  kj::Maybe<BaselZone> current_zone_;
};

} // namespace peaktrade::backtest
