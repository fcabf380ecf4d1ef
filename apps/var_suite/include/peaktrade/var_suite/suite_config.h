#pragma once

#include <cstddef>
#include <kj/common.h>
#include <kj/string.h>

namespace peaktrade::var_suite {

struct SuiteConfig final {
  // Data source
  kj::Maybe<kj::String> returns_file;
  kj::Maybe<kj::String> var_file;
  bool use_synthetic{false};
  size_t n_observations{500}; ///< Synthetic series length

  kj::String symbol{kj::str("PORTFOLIO")};
  double confidence{0.99};
  double test_alpha{0.05};
  size_t min_observations{250};
  size_t basel_window{250};

  // Phase 9A
  bool enable_duration_diagnostic{false};
  bool enable_exponential_test{false};

  // Phase 9B
  bool enable_rolling{false};
  size_t rolling_window_size{250};
  kj::Maybe<size_t> rolling_step_size;

  // Output
  kj::String output_dir{kj::str("reports/var_backtest")};
  bool no_report{false};
  kj::Maybe<kj::String> json_output;

  kj::Maybe<kj::String> config_file;
  bool verbose{false};
  bool show_help{false};
};

} // namespace peaktrade::var_suite
