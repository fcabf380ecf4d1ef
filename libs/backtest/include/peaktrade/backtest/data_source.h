#pragma once

#include "peaktrade/core/logger.h"

#include <cstdint>
#include <kj/array.h>
#include <kj/common.h>
#include <kj/string.h>

namespace peaktrade::backtest {

/**
 * @brief Realized returns paired 1:1 with VaR forecasts
 */
struct ReturnSeries {
  kj::Array<double> returns;
  kj::Array<double> var_forecasts;
};

/**
 * @brief Read one numeric series from a CSV file
 *
 * The last column of each row is the value, so both "value" and
 * "date,value" layouts work. Blank lines are skipped, as is a first
 * non-blank line whose value is not numeric (a header).
 *
 * @throws ResourceException if the file cannot be opened
 * @throws ParseException on a non-numeric value past the header, with its line number
 */
[[nodiscard]] kj::Array<double> load_series_csv(kj::StringPtr path, core::Logger& logger);

/**
 * @brief Deterministic demo data
 *
 * Returns are -0.01 except for int(n * (1 - confidence)) entries of -0.03, shuffled
 * with a seeded Fisher-Yates pass. The forecast is a constant 0.02, so exactly the
 * -0.03 entries are exceedances.
 */
[[nodiscard]] ReturnSeries generate_synthetic_series(size_t n_observations, double confidence,
                                                     std::uint64_t seed = 42);

} // namespace peaktrade::backtest
