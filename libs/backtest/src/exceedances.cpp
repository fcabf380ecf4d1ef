#include "peaktrade/backtest/exceedances.h"

#include "peaktrade/core/error.h"

#include <cmath>
#include <kj/vector.h>

namespace peaktrade::backtest {

ExceedanceSequence build_exceedances(kj::ArrayPtr<const double> realized_returns,
                                     kj::ArrayPtr<const double> var_forecasts) {
  if (realized_returns.size() != var_forecasts.size()) {
    throw core::ValidationException(
        kj::str("Length mismatch: ", realized_returns.size(), " returns vs ",
                var_forecasts.size(), " VaR forecasts"));
  }

  auto result = kj::heapArray<bool>(realized_returns.size());
  for (size_t t = 0; t < realized_returns.size(); ++t) {
    double r = realized_returns[t];
    double v = var_forecasts[t];
    if (!std::isfinite(r) || !std::isfinite(v)) {
      result[t] = false;
      continue;
    }
    result[t] = -r > std::abs(v);
  }
  return result;
}

kj::Array<size_t> exceedance_indices(kj::ArrayPtr<const bool> exceedances) {
  kj::Vector<size_t> indices;
  for (size_t t = 0; t < exceedances.size(); ++t) {
    if (exceedances[t]) {
      indices.add(t);
    }
  }
  return indices.releaseAsArray();
}

} // namespace peaktrade::backtest
