#pragma once

#include "peaktrade/backtest/backtest_suite.h"
#include "peaktrade/backtest/data_source.h"
#include "peaktrade/backtest/reporter.h"
#include "peaktrade/var_suite/suite_config.h"

#include <kj/common.h>
#include <kj/io.h>
#include <kj/memory.h>

namespace peaktrade::core {
class Logger;
}

namespace peaktrade::var_suite {

/// Exit codes
constexpr int kExitPass = 0;
constexpr int kExitFail = 1;
constexpr int kExitError = 2;

/**
 * @brief VaR backtest suite snapshot runner
 *
 * Prints the console summary to `out`; logs and errors go to `err`.
 */
class SuiteApp final {
public:
  SuiteApp(SuiteConfig config, kj::OutputStream& out, kj::OutputStream& err);
  ~SuiteApp();

  /// kExitPass if the overall verdict passes, kExitFail if not, kExitError on errors
  int run();

private:
  friend struct SuiteAppTestAccess;

  SuiteConfig config_;
  kj::OutputStream& out_;
  kj::OutputStream& err_;
  kj::Own<core::Logger> logger_;

  [[nodiscard]] backtest::ReturnSeries load_series();
  [[nodiscard]] backtest::SuiteOptions suite_options() const;
  [[nodiscard]] backtest::ReportContext report_context(kj::StringPtr generated_at) const;
  void write_json(const backtest::BacktestVerdict& verdict, const backtest::ReportContext& context,
                  kj::StringPtr path);
};

/**
 * @brief Parse arguments and run the suite
 * @return Process exit code
 */
int run_cli(kj::ArrayPtr<const kj::StringPtr> args, kj::OutputStream& out, kj::OutputStream& err);

} // namespace peaktrade::var_suite
