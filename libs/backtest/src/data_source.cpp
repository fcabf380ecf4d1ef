#include "peaktrade/backtest/data_source.h"

#include "peaktrade/core/error.h"
#include "peaktrade/risk/distributions.h"

// std library includes with justifications
#include <cstdlib> // std::strtod - strict numeric parsing
#include <fstream> // std::ifstream - file I/O (no KJ equivalent)
#include <string>  // std::string - std::getline buffer
#include <utility> // std::swap

#include <kj/vector.h>

namespace peaktrade::backtest {

namespace {

constexpr double kSyntheticBaseReturn = -0.01;
constexpr double kSyntheticViolationReturn = -0.03;
constexpr double kSyntheticVaR = 0.02;

void trim(std::string& token) {
  token.erase(0, token.find_first_not_of(" \t\r\n"));
  token.erase(token.find_last_not_of(" \t\r\n") + 1);
}

kj::Maybe<double> parse_double(const std::string& token) {
  if (token.empty()) {
    return kj::none;
  }
  char* end = nullptr;
  double value = std::strtod(token.c_str(), &end);
  if (end != token.c_str() + token.size()) {
    return kj::none;
  }
  return value;
}

} // namespace

kj::Array<double> load_series_csv(kj::StringPtr path, core::Logger& logger) {
  std::ifstream file(path.cStr());
  if (!file.is_open()) {
    throw core::ResourceException(kj::str("Failed to open file: ", path));
  }

  kj::Vector<double> values;
  std::string line;
  size_t line_number = 0;
  bool seen_first_row = false;

  while (std::getline(file, line)) {
    line_number++;

    trim(line);
    if (line.empty()) {
      continue;
    }

    auto comma = line.find_last_of(',');
    std::string token = comma == std::string::npos ? line : line.substr(comma + 1);
    trim(token);

    KJ_IF_SOME(value, parse_double(token)) {
      values.add(value);
      seen_first_row = true;
      continue;
    }
    if (seen_first_row) {
      throw core::ParseException(
          kj::str("Invalid value '", token.c_str(), "' at ", path, ":", line_number));
    }
    logger.debug(kj::str("Skipping header line ", line_number, " in ", path));
    seen_first_row = true;
  }

  logger.info(kj::str("Read ", values.size(), " values from ", path));
  return values.releaseAsArray();
}

ReturnSeries generate_synthetic_series(size_t n_observations, double confidence,
                                       std::uint64_t seed) {
  if (!(confidence > 0.0 && confidence < 1.0)) {
    throw core::ValidationException(
        kj::str("confidence must be in (0, 1), got ", confidence));
  }

  const auto n_violations =
      static_cast<size_t>(static_cast<double>(n_observations) * (1.0 - confidence));

  auto returns = kj::heapArray<double>(n_observations);
  for (size_t i = 0; i < n_observations; ++i) {
    returns[i] = i < n_observations - n_violations ? kSyntheticBaseReturn
                                                   : kSyntheticViolationReturn;
  }

  risk::XorShiftRng rng(seed);
  for (size_t i = n_observations; i > 1; --i) {
    size_t j = static_cast<size_t>(rng.next() % i);
    std::swap(returns[i - 1], returns[j]);
  }

  auto forecasts = kj::heapArray<double>(n_observations);
  for (auto& f : forecasts) {
    f = kSyntheticVaR;
  }

  return ReturnSeries{kj::mv(returns), kj::mv(forecasts)};
}

} // namespace peaktrade::backtest
