#pragma once

#include "peaktrade/backtest/types.h"

#include <kj/common.h>

namespace peaktrade::backtest {

/**
 * @brief Pair realized returns with VaR forecasts into an exceedance sequence
 *
 * The realized loss at t is -realized_returns[t]; it is an exceedance iff it
 * is strictly greater than |var_forecasts[t]|, so forecasts may be given as
 * positive loss magnitudes or as negative return thresholds. A pair with a
 * non-finite value is never an exceedance.
 *
 * @throws ValidationException if the two series differ in length
 */
[[nodiscard]] ExceedanceSequence build_exceedances(kj::ArrayPtr<const double> realized_returns,
                                                   kj::ArrayPtr<const double> var_forecasts);

/**
 * @brief Indices of the exceedances, ascending
 */
[[nodiscard]] kj::Array<size_t> exceedance_indices(kj::ArrayPtr<const bool> exceedances);

} // namespace peaktrade::backtest
