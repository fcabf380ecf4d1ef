#pragma once

#include "peaktrade/backtest/backtest_suite.h"
#include "peaktrade/core/logger.h"

#include <kj/common.h>
#include <kj/string.h>

namespace peaktrade::backtest {

/**
 * @brief Header fields shared by every rendering of a verdict
 */
struct ReportContext {
  kj::String symbol;
  double confidence{0.99};
  double test_alpha{0.05};
  kj::String generated_at; ///< "%Y-%m-%d %H:%M:%S"
};

/**
 * @brief Render the markdown snapshot report
 *
 * Section headings are stable: downstream tooling greps for them. The Phase 9A
 * and 9B sections appear only when the verdict carries those results.
 */
[[nodiscard]] kj::String render_markdown_report(const BacktestVerdict& verdict,
                                                const ReportContext& context);

/**
 * @brief Render the operator summary printed to the console
 */
[[nodiscard]] kj::String render_console_summary(const BacktestVerdict& verdict,
                                                const ReportContext& context);

/**
 * @brief Machine-readable verdict (pretty-printed JSON)
 */
[[nodiscard]] kj::String verdict_to_json(const BacktestVerdict& verdict,
                                         const ReportContext& context);

/**
 * @brief "var_backtest_suite_snapshot_<timestamp>.md"
 * @param timestamp Local time as "%Y%m%d_%H%M%S"
 */
[[nodiscard]] kj::String report_file_name(kj::StringPtr timestamp);

/**
 * @brief Write content to directory/file_name, creating the directory if needed
 * @return Path of the written file
 * @throws ResourceException if the directory or file cannot be written
 */
kj::String write_report(kj::StringPtr directory, kj::StringPtr file_name, kj::StringPtr content,
                        core::Logger& logger);

} // namespace peaktrade::backtest
