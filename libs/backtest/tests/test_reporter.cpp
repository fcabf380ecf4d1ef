#include "peaktrade/backtest/data_source.h"
#include "peaktrade/backtest/exceedances.h"
#include "peaktrade/backtest/reporter.h"
#include "peaktrade/core/error.h"
#include "peaktrade/core/json.h"
#include "peaktrade/core/logger.h"
#include "test_utilities.h"

#include <kj/test.h>

namespace peaktrade::backtest {
namespace {

using test::TempDir;
using test::VectorOutputStream;

BacktestVerdict synthetic_verdict(size_t n, bool optional_sections) {
  auto series = generate_synthetic_series(n, 0.99);
  auto exc = build_exceedances(series.returns, series.var_forecasts);
  SuiteOptions options;
  options.enable_duration_diagnostic = optional_sections;
  options.enable_rolling = optional_sections;
  return run_backtest_suite(exc, 0.99, options);
}

ReportContext make_context(kj::StringPtr generated_at = "2026-01-02 03:04:05"_kj) {
  return ReportContext{kj::str("PORTFOLIO"), 0.99, 0.05, kj::str(generated_at)};
}

// Lines starting with '#', which form the report structure
kj::String headings(kj::StringPtr markdown) {
  kj::Vector<char> out;
  bool at_line_start = true;
  bool in_heading = false;
  for (char c : markdown) {
    if (at_line_start) {
      in_heading = c == '#';
    }
    if (in_heading) {
      out.add(c);
    }
    at_line_start = c == '\n';
  }
  return kj::heapString(out.begin(), out.size());
}

KJ_TEST("Markdown report core structure") {
  auto verdict = synthetic_verdict(250, false);
  auto md = render_markdown_report(verdict, make_context());

  KJ_EXPECT(md.startsWith("# VaR Backtest Suite Snapshot\n"_kj));
  KJ_EXPECT(md.contains("**Generated:** 2026-01-02 03:04:05"_kj));
  KJ_EXPECT(md.contains("**Symbol:** PORTFOLIO"_kj));
  KJ_EXPECT(md.contains("**VaR Confidence:** 99.0%"_kj));
  KJ_EXPECT(md.contains("**Test Significance:** 5.00%"_kj));
  KJ_EXPECT(md.contains("## Summary"_kj));
  KJ_EXPECT(md.contains("- **Observations:** 250"_kj));
  KJ_EXPECT(md.contains("- **Violations:** 2"_kj));
  KJ_EXPECT(md.contains("- **Violation Rate:** 0.80%"_kj));
  KJ_EXPECT(md.contains("- **Expected Rate:** 1.00%"_kj));
  KJ_EXPECT(md.contains("## Core Tests"_kj));
  KJ_EXPECT(md.contains("### Kupiec Proportion of Failures"_kj));
  KJ_EXPECT(md.contains("### Christoffersen Independence Test"_kj));
  KJ_EXPECT(md.contains("### Christoffersen Conditional Coverage Test"_kj));
  KJ_EXPECT(md.contains("### Basel Traffic Light"_kj));
  KJ_EXPECT(md.contains("- **Zone:** GREEN"_kj));
  KJ_EXPECT(md.contains("- **p-value:** 0.7419"_kj));
  KJ_EXPECT(md.contains("## Overall Verdict"_kj));
  KJ_EXPECT(md.contains("✅ ALL PASSED"_kj));
  KJ_EXPECT(md.contains("NOT for live trading"_kj));

  KJ_EXPECT(!md.contains("## Phase 9A"_kj));
  KJ_EXPECT(!md.contains("## Phase 9B"_kj));
}

KJ_TEST("Markdown report optional sections") {
  auto verdict = synthetic_verdict(1000, true);
  auto md = render_markdown_report(verdict, make_context());

  KJ_EXPECT(md.contains("## Phase 9A: Duration Diagnostic"_kj));
  KJ_EXPECT(md.contains("- **Duration Ratio:**"_kj));
  KJ_EXPECT(md.contains("## Phase 9B: Rolling Evaluation"_kj));
  KJ_EXPECT(md.contains("### Pass Rates"_kj));
  KJ_EXPECT(md.contains("### Window Details"_kj));
  KJ_EXPECT(md.contains("- **Windows Evaluated:** 4"_kj));
  KJ_EXPECT(md.contains("| Win | Start | End | N | Viol | UC | IND | CC | All |"_kj));
  KJ_EXPECT(md.contains("| 3 | 750 | 1000 | 250 | 3 |"_kj));
}

KJ_TEST("Markdown report keeps rolling headings when no window fits") {
  SuiteOptions options;
  options.enable_rolling = true;
  options.rolling_window_size = 300;
  auto verdict = run_backtest_suite(test::exceedances_every(250, 100), 0.99, options);
  KJ_ASSERT(KJ_ASSERT_NONNULL(verdict.rolling).windows.size() == 0);

  auto md = render_markdown_report(verdict, make_context());
  KJ_EXPECT(md.contains("## Phase 9B: Rolling Evaluation"_kj));
  KJ_EXPECT(md.contains("- **Windows Evaluated:** 0"_kj));
  KJ_EXPECT(md.contains("### Pass Rates"_kj));
  KJ_EXPECT(md.contains("### Window Details"_kj));
  KJ_EXPECT(md.contains("| Win | Start | End | N | Viol | UC | IND | CC | All |"_kj));
  KJ_EXPECT(md.contains("_No windows evaluated: input shorter than one window._"_kj));
}

KJ_TEST("Markdown report prints n/a for durations it cannot compute") {
  SuiteOptions options;
  options.enable_duration_diagnostic = true;
  auto verdict = run_backtest_suite(test::exceedances_at(250, {10}), 0.99, options);

  auto md = render_markdown_report(verdict, make_context());
  KJ_EXPECT(md.contains("- **Status:** INSUFFICIENT_DATA"_kj));
  KJ_EXPECT(md.contains("- **Mean Duration:** n/a"_kj));
  KJ_EXPECT(md.contains("- **Expected Duration:** 100.00"_kj));
  KJ_EXPECT(md.contains("- **Duration Ratio:** n/a"_kj));
  KJ_EXPECT(md.contains("- **Clustering Score:** n/a"_kj));
  KJ_EXPECT(!md.contains("nan"_kj));
}

KJ_TEST("Markdown report marks failures") {
  auto exc = test::exceedances_every(250, 20);
  auto verdict = run_backtest_suite(exc, 0.99);
  auto md = render_markdown_report(verdict, make_context());

  KJ_EXPECT(md.contains("✗ FAIL"_kj));
  KJ_EXPECT(md.contains("❌ SOME FAILED"_kj));
  KJ_EXPECT(md.contains("- **Zone:** RED"_kj));
  KJ_EXPECT(md.contains("Basel traffic light is RED"_kj));
}

KJ_TEST("Report structure is deterministic across runs") {
  auto first = render_markdown_report(synthetic_verdict(500, true), make_context());
  auto second =
      render_markdown_report(synthetic_verdict(500, true), make_context("2030-12-31 23:59:59"_kj));

  KJ_EXPECT(first != second);
  KJ_EXPECT(headings(first) == headings(second));

  auto again = render_markdown_report(synthetic_verdict(500, true), make_context());
  KJ_EXPECT(first == again);
}

KJ_TEST("Console summary labels") {
  auto verdict = synthetic_verdict(250, true);
  auto summary = render_console_summary(verdict, make_context());

  for (auto label : {"VAR BACKTEST SUITE SUMMARY - PORTFOLIO", "Observations:", "Violations:",
                     "Kupiec POF:", "Independence:", "Cond. Coverage:", "Basel Traffic Light:",
                     "Overall Verdict:", "Phase 9A: Duration Diagnostic", "Duration Ratio:",
                     "Clustering:", "Phase 9B: Rolling Evaluation", "Windows Evaluated:",
                     "All-Pass Rate:", "Verdict Stability:"}) {
    KJ_EXPECT(summary.contains(kj::StringPtr(label)), label);
  }
  KJ_EXPECT(summary.contains("✓ PASS  (p=0.7419)"_kj), summary);
  KJ_EXPECT(summary.contains("✅ ALL PASSED"_kj));
}

KJ_TEST("Console summary without optional sections") {
  auto summary = render_console_summary(synthetic_verdict(250, false), make_context());
  KJ_EXPECT(!summary.contains("Phase 9A"_kj));
  KJ_EXPECT(!summary.contains("Phase 9B"_kj));
}

KJ_TEST("Verdict JSON export") {
  auto verdict = run_backtest_suite(test::exceedances_at(100, {3}), 0.99);
  auto json = verdict_to_json(verdict, make_context());

  auto doc = core::JsonDocument::parse(json);
  auto root = doc.root();
  KJ_EXPECT(root["symbol"_kj].get_string() == "PORTFOLIO"_kj);
  KJ_EXPECT(root["n_observations"_kj].get_int() == 100);
  KJ_EXPECT(root["overall_pass"_kj].get_bool() == false);
  KJ_EXPECT(root["kupiec"_kj]["status"_kj].get_string() == "INSUFFICIENT_DATA"_kj);
  KJ_EXPECT(root["kupiec"_kj]["p_value"_kj].is_null());
  KJ_EXPECT(root["basel_traffic_light"_kj]["zone"_kj].get_string() == "GREEN"_kj);
  KJ_EXPECT(root["rolling_evaluation"_kj].is_null());
}

KJ_TEST("Report file name") {
  KJ_EXPECT(report_file_name("20260102_030405"_kj) ==
            "var_backtest_suite_snapshot_20260102_030405.md"_kj);
}

KJ_TEST("write_report creates the output directory") {
  TempDir dir("peaktrade_reporter_test");
  VectorOutputStream log_stream;
  core::Logger logger(kj::heap<core::TextFormatter>(), kj::heap<core::StreamOutput>(log_stream));

  auto nested = kj::str(dir.path(), "/reports/var_backtest");
  auto path = write_report(nested, "snapshot.md"_kj, "# hello\n"_kj, logger);

  KJ_EXPECT(path.endsWith("reports/var_backtest/snapshot.md"_kj), path);
  KJ_EXPECT(test::read_file(path) == "# hello\n"_kj);
  KJ_EXPECT(log_stream.getString().contains("Report written"_kj));
}

KJ_TEST("write_report fails when the directory cannot be created") {
  TempDir dir("peaktrade_reporter_blocked");
  auto blocker = dir.file("blocker");
  test::write_file(blocker, "not a directory"_kj);

  VectorOutputStream log_stream;
  core::Logger logger(kj::heap<core::TextFormatter>(), kj::heap<core::StreamOutput>(log_stream));

  auto target = kj::str(blocker, "/reports");
  KJ_EXPECT(test::throws_with<core::ResourceException>(
      [&] { (void)write_report(target, "x.md"_kj, "x"_kj, logger); }, "output directory"_kj));
}

} // namespace
} // namespace peaktrade::backtest
