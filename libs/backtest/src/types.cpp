#include "peaktrade/backtest/types.h"

#include <cstdio>

namespace peaktrade::backtest {

kj::StringPtr test_status_to_string(TestStatus status) {
  switch (status) {
  case TestStatus::Pass:
    return "PASS"_kj;
  case TestStatus::Fail:
    return "FAIL"_kj;
  case TestStatus::InsufficientData:
    return "INSUFFICIENT_DATA"_kj;
  }
  return "UNKNOWN"_kj;
}

size_t count_violations(kj::ArrayPtr<const bool> exceedances) {
  size_t count = 0;
  for (bool e : exceedances) {
    if (e) {
      ++count;
    }
  }
  return count;
}

kj::String format_fixed(double value, int decimals) {
  char buffer[64];
  std::snprintf(buffer, sizeof(buffer), "%.*f", decimals, value);
  return kj::str(buffer);
}

kj::String format_percent(double fraction, int decimals) {
  return kj::str(format_fixed(fraction * 100.0, decimals), "%");
}

} // namespace peaktrade::backtest
