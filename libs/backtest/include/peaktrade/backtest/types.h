#pragma once

#include <cstdint>
#include <kj/array.h>
#include <kj/common.h>
#include <kj/string.h>

namespace peaktrade::backtest {

/**
 * @brief Exceedance indicator per evaluation date
 *
 * Element t is true iff the realized loss at t exceeded the VaR forecast.
 */
using ExceedanceSequence = kj::Array<bool>;

/**
 * @brief Outcome of a single statistical sub-test
 */
enum class TestStatus : std::uint8_t {
  Pass = 0,
  Fail = 1,
  InsufficientData = 2, ///< Sample too small for the statistic to be meaningful
};

[[nodiscard]] kj::StringPtr test_status_to_string(TestStatus status);

/**
 * @brief Number of true entries
 */
[[nodiscard]] size_t count_violations(kj::ArrayPtr<const bool> exceedances);

/**
 * @brief Format a value with a fixed number of decimals ("%.*f")
 */
[[nodiscard]] kj::String format_fixed(double value, int decimals);

/**
 * @brief Format a fraction as a percentage, e.g. 0.0123 -> "1.23%"
 */
[[nodiscard]] kj::String format_percent(double fraction, int decimals);

} // namespace peaktrade::backtest
