#include "peaktrade/backtest/reporter.h"

#include "peaktrade/backtest/types.h"
#include "peaktrade/core/error.h"
#include "peaktrade/core/json.h"

// std library includes with justifications
#include <cmath>      // std::isnan
#include <filesystem> // std::filesystem::create_directories - no KJ equivalent for host paths
#include <fstream>    // std::ofstream - file I/O (no KJ equivalent)
#include <sstream>    // std::ostringstream - string stream (no KJ equivalent)

#include <kj/common.h>
#include <kj/exception.h>
#include <kj/string.h>

namespace peaktrade::backtest {

namespace {

constexpr const char* kRule = "======================================================================";

const char* pass_mark(bool passed) {
  return passed ? "✓ PASS" : "✗ FAIL";
}

const char* tick(bool passed) {
  return passed ? "✓" : "✗";
}

// NaN marks a statistic that could not be computed
kj::String number_text(double value, int decimals) {
  return std::isnan(value) ? kj::str("n/a") : format_fixed(value, decimals);
}

kj::String p_value_text(double p) {
  return number_text(p, 4);
}

kj::String status_suffix(TestStatus status) {
  return status == TestStatus::InsufficientData ? kj::str(" (insufficient data)") : kj::str("");
}

// "✅ STABLE: ... over time." -> "✅ STABLE: ≥90% of windows passed all tests."
kj::String first_sentence(kj::StringPtr text) {
  KJ_IF_SOME(dot, text.findFirst('.')) {
    return kj::heapString(text.begin(), dot + 1);
  }
  return kj::heapString(text);
}

void write_test_section(std::ostringstream& md, const char* title, bool passed,
                        TestStatus status, double lr, double p, double critical) {
  md << "### " << title << "\n\n";
  md << "- **Result:** " << pass_mark(passed) << status_suffix(status).cStr() << "\n";
  md << "- **LR Statistic:** " << p_value_text(lr).cStr() << "\n";
  md << "- **p-value:** " << p_value_text(p).cStr() << "\n";
  md << "- **Critical Value:** " << format_fixed(critical, 4).cStr() << "\n\n";
}

void write_duration_section(std::ostringstream& md, const DurationDiagnosticResult& duration) {
  md << "---\n\n";
  md << "## Phase 9A: Duration Diagnostic (Optional)\n\n";
  md << "- **Status:** " << test_status_to_string(duration.status).cStr() << "\n";
  md << "- **Violations:** " << duration.n_violations << "\n";
  md << "- **Mean Duration:** " << number_text(duration.mean_duration, 2).cStr() << "\n";
  md << "- **Expected Duration:** " << number_text(duration.expected_duration, 2).cStr() << "\n";
  md << "- **Duration Ratio:** " << number_text(duration.duration_ratio, 4).cStr() << "\n";
  md << "- **Clustering Score:** " << number_text(duration.clustering_score, 4).cStr() << "\n";
  md << "- **Suspicious Clustering:** " << (duration.is_suspicious() ? "⚠️  YES" : "✓ NO")
     << "\n\n";

  KJ_IF_SOME(fit, duration.exponential_test) {
    md << "### Exponential Goodness of Fit\n\n";
    md << "- **Durations:** " << fit.n_durations << "\n";
    md << "- **Anderson-Darling A²:** " << number_text(fit.statistic, 4).cStr() << "\n";
    md << "- **Critical Value:** " << number_text(fit.critical_value, 4).cStr() << "\n";
    md << "- **Result:** " << pass_mark(fit.passed) << "\n\n";
  }

  md << "**Notes:** " << duration.notes.cStr() << "\n\n";
}

void write_rolling_section(std::ostringstream& md, const RollingEvaluationResult& rolling) {
  const auto& summary = rolling.summary;

  md << "---\n\n";
  md << "## Phase 9B: Rolling Evaluation (Optional)\n\n";
  md << "- **Windows Evaluated:** " << summary.n_windows << "\n";
  md << "- **Window Size:** " << rolling.window_size << "\n";
  md << "- **Step Size:** " << rolling.step_size << "\n\n";

  md << "### Pass Rates\n\n";
  md << "- **Kupiec POF:** " << format_percent(summary.kupiec_pass_rate, 1).cStr() << "\n";
  md << "- **Independence:** " << format_percent(summary.independence_pass_rate, 1).cStr()
     << "\n";
  md << "- **Conditional Coverage:** " << format_percent(summary.cc_pass_rate, 1).cStr() << "\n";
  md << "- **ALL Tests:** " << format_percent(summary.all_pass_rate, 1).cStr() << "\n\n";

  md << "### Worst p-values\n\n";
  md << "- **Kupiec POF:** " << format_fixed(summary.worst_kupiec_p_value, 4).cStr() << "\n";
  md << "- **Independence:** " << format_fixed(summary.worst_independence_p_value, 4).cStr()
     << "\n";
  md << "- **Conditional Coverage:** " << format_fixed(summary.worst_cc_p_value, 4).cStr()
     << "\n\n";

  md << "**Verdict Stability:** " << format_percent(summary.verdict_stability, 1).cStr()
     << "\n\n";
  md << "**Assessment:** " << summary.notes.cStr() << "\n\n";

  md << "### Window Details\n\n";
  md << "| Win | Start | End | N | Viol | UC | IND | CC | All |\n";
  md << "|-----|-------|-----|---|------|----|-----|----|----|\n";
  for (const auto& w : rolling.windows) {
    md << "| " << w.window_id << " | " << w.start_index << " | " << w.end_index << " | "
       << w.n_observations << " | " << w.n_violations << " | " << tick(w.kupiec.passed())
       << " | " << tick(w.independence.passed()) << " | "
       << tick(w.conditional_coverage.passed()) << " | " << tick(w.all_passed()) << " |\n";
  }
  if (rolling.windows.size() == 0) {
    md << "\n_No windows evaluated: input shorter than one window._\n";
  }
  md << "\n";
}

} // namespace

kj::String render_markdown_report(const BacktestVerdict& verdict, const ReportContext& context) {
  std::ostringstream md;

  // Header
  md << "# VaR Backtest Suite Snapshot\n\n";
  md << "**Generated:** " << context.generated_at.cStr() << "  \n";
  md << "**Symbol:** " << context.symbol.cStr() << "  \n";
  md << "**VaR Confidence:** " << format_percent(context.confidence, 1).cStr() << "  \n";
  md << "**Test Significance:** " << format_percent(context.test_alpha, 2).cStr() << "  \n\n";
  md << "---\n\n";

  // Summary
  md << "## Summary\n\n";
  md << "- **Observations:** " << verdict.n_observations << "\n";
  md << "- **Violations:** " << verdict.n_violations << "\n";
  md << "- **Violation Rate:** " << format_percent(verdict.violation_rate, 2).cStr() << "\n";
  md << "- **Expected Rate:** " << format_percent(1.0 - verdict.alpha, 2).cStr() << "\n\n";
  md << "---\n\n";

  // Core tests
  md << "## Core Tests\n\n";
  const auto& kupiec = verdict.kupiec;
  write_test_section(md, "Kupiec Proportion of Failures (POF)", kupiec.passed(), kupiec.status,
                     kupiec.lr_statistic, kupiec.p_value, kupiec.critical_value);
  const auto& ind = verdict.independence;
  write_test_section(md, "Christoffersen Independence Test", ind.passed(), ind.status,
                     ind.lr_statistic, ind.p_value, ind.critical_value);
  const auto& cc = verdict.conditional_coverage;
  write_test_section(md, "Christoffersen Conditional Coverage Test", cc.passed(), cc.status,
                     cc.lr_statistic, cc.p_value, cc.critical_value);

  md << "### Basel Traffic Light\n\n";
  md << "- **Zone:** " << basel_zone_to_string(verdict.traffic_light.zone).cStr() << "\n";
  md << "- **Window:** " << verdict.traffic_light.n_observations << " observations, "
     << verdict.traffic_light.n_violations << " violations\n";
  md << "- **Recommendation:** " << traffic_light_recommendation(verdict.traffic_light).cStr()
     << "\n\n";

  KJ_IF_SOME(duration, verdict.duration) {
    write_duration_section(md, duration);
  }
  KJ_IF_SOME(rolling, verdict.rolling) {
    write_rolling_section(md, rolling);
  }

  // Verdict
  md << "---\n\n";
  md << "## Overall Verdict\n\n";
  if (verdict.overall_pass) {
    md << "**Core Tests:** ✅ ALL PASSED\n\n";
    md << "The VaR model passes all core validation tests (Kupiec POF + Christoffersen IND/CC)"
          " and is outside the Basel RED zone.\n\n";
  } else {
    md << "**Core Tests:** ❌ SOME FAILED\n\n";
    md << "⚠️  The VaR model fails at least one core validation test. Review required.\n\n";
    if (verdict.traffic_light.is_red()) {
      md << "Basel traffic light is RED.\n\n";
    }
  }

  md << "---\n\n";
  md << "*Generated by PeakTrade VaR Backtest Suite*  \n";
  md << "*Backtest/Research only - NOT for live trading*\n";

  return kj::str(md.str().c_str());
}

kj::String render_console_summary(const BacktestVerdict& verdict, const ReportContext& context) {
  std::ostringstream out;

  out << "\n" << kRule << "\n";
  out << "VAR BACKTEST SUITE SUMMARY - " << context.symbol.cStr() << "\n";
  out << kRule << "\n";
  out << "VaR Confidence Level:  " << format_percent(context.confidence, 1).cStr() << "\n";
  out << "Observations:          " << verdict.n_observations << "\n";
  out << "Violations:            " << verdict.n_violations << "\n";
  out << "Violation Rate:        " << format_percent(verdict.violation_rate, 2).cStr() << "\n\n";

  out << "Core Tests:\n";
  out << "  Kupiec POF:          " << pass_mark(verdict.kupiec.passed())
      << "  (p=" << p_value_text(verdict.kupiec.p_value).cStr() << ")"
      << status_suffix(verdict.kupiec.status).cStr() << "\n";
  out << "  Independence:        " << pass_mark(verdict.independence.passed())
      << "  (p=" << p_value_text(verdict.independence.p_value).cStr() << ")"
      << status_suffix(verdict.independence.status).cStr() << "\n";
  out << "  Cond. Coverage:      " << pass_mark(verdict.conditional_coverage.passed())
      << "  (p=" << p_value_text(verdict.conditional_coverage.p_value).cStr() << ")"
      << status_suffix(verdict.conditional_coverage.status).cStr() << "\n";
  out << "  Basel Traffic Light: " << basel_zone_to_string(verdict.traffic_light.zone).cStr()
      << "\n\n";

  KJ_IF_SOME(duration, verdict.duration) {
    out << "Phase 9A: Duration Diagnostic (optional)\n";
    out << "  Duration Ratio:      " << p_value_text(duration.duration_ratio).cStr() << "\n";
    out << "  Clustering:          " << (duration.is_suspicious() ? "⚠️  YES" : "✓ NO") << "\n\n";
  }

  KJ_IF_SOME(rolling, verdict.rolling) {
    const auto& summary = rolling.summary;
    out << "Phase 9B: Rolling Evaluation (optional)\n";
    out << "  Windows Evaluated:   " << summary.n_windows << "\n";
    out << "  All-Pass Rate:       " << format_percent(summary.all_pass_rate, 1).cStr() << "\n";
    out << "  Verdict Stability:   " << format_percent(summary.verdict_stability, 1).cStr()
        << "\n";
    out << "  Assessment:          " << first_sentence(summary.notes).cStr() << "\n\n";
  }

  out << "Overall Verdict:\n";
  out << "  Core Tests:          " << (verdict.overall_pass ? "✅ ALL PASSED" : "❌ SOME FAILED")
      << "\n";
  if (verdict.traffic_light.is_red()) {
    out << "  Basel:               🔴 RED zone\n";
  }
  out << kRule << "\n\n";

  return kj::str(out.str().c_str());
}

kj::String verdict_to_json(const BacktestVerdict& verdict, const ReportContext& context) {
  auto builder = core::JsonBuilder::object();
  builder.put("symbol"_kj, context.symbol.asPtr())
      .put("generated_at"_kj, context.generated_at.asPtr())
      .put("confidence"_kj, context.confidence)
      .put("test_alpha"_kj, context.test_alpha)
      .put("n_observations"_kj, static_cast<uint64_t>(verdict.n_observations))
      .put("n_violations"_kj, static_cast<uint64_t>(verdict.n_violations))
      .put("violation_rate"_kj, verdict.violation_rate)
      .put("overall_pass"_kj, verdict.overall_pass);

  builder.put_object("kupiec"_kj, [&](core::JsonBuilder& b) {
    b.put("status"_kj, test_status_to_string(verdict.kupiec.status))
        .put("lr_statistic"_kj, verdict.kupiec.lr_statistic)
        .put("p_value"_kj, verdict.kupiec.p_value)
        .put("critical_value"_kj, verdict.kupiec.critical_value)
        .put("passed"_kj, verdict.kupiec.passed());
  });
  builder.put_object("independence"_kj, [&](core::JsonBuilder& b) {
    const auto& t = verdict.independence.transitions;
    b.put("status"_kj, test_status_to_string(verdict.independence.status))
        .put("n00"_kj, static_cast<uint64_t>(t.n00))
        .put("n01"_kj, static_cast<uint64_t>(t.n01))
        .put("n10"_kj, static_cast<uint64_t>(t.n10))
        .put("n11"_kj, static_cast<uint64_t>(t.n11))
        .put("lr_statistic"_kj, verdict.independence.lr_statistic)
        .put("p_value"_kj, verdict.independence.p_value)
        .put("passed"_kj, verdict.independence.passed());
  });
  builder.put_object("conditional_coverage"_kj, [&](core::JsonBuilder& b) {
    b.put("status"_kj, test_status_to_string(verdict.conditional_coverage.status))
        .put("lr_statistic"_kj, verdict.conditional_coverage.lr_statistic)
        .put("p_value"_kj, verdict.conditional_coverage.p_value)
        .put("passed"_kj, verdict.conditional_coverage.passed());
  });
  builder.put_object("basel_traffic_light"_kj, [&](core::JsonBuilder& b) {
    const auto& tl = verdict.traffic_light;
    b.put("zone"_kj, basel_zone_to_string(tl.zone))
        .put("n_observations"_kj, static_cast<uint64_t>(tl.n_observations))
        .put("n_violations"_kj, static_cast<uint64_t>(tl.n_violations))
        .put("green_threshold"_kj, static_cast<int64_t>(tl.thresholds.green))
        .put("yellow_threshold"_kj, static_cast<int64_t>(tl.thresholds.yellow))
        .put("capital_multiplier"_kj, tl.capital_multiplier);
  });

  KJ_IF_SOME(duration, verdict.duration) {
    builder.put_object("duration_diagnostic"_kj, [&](core::JsonBuilder& b) {
      b.put("status"_kj, test_status_to_string(duration.status))
          .put("mean_duration"_kj, duration.mean_duration)
          .put("expected_duration"_kj, duration.expected_duration)
          .put("duration_ratio"_kj, duration.duration_ratio)
          .put("clustering_score"_kj, duration.clustering_score)
          .put("suspicious"_kj, duration.is_suspicious());
    });
  }
  KJ_IF_SOME(rolling, verdict.rolling) {
    builder.put_object("rolling_evaluation"_kj, [&](core::JsonBuilder& b) {
      const auto& s = rolling.summary;
      b.put("window_size"_kj, static_cast<uint64_t>(rolling.window_size))
          .put("step_size"_kj, static_cast<uint64_t>(rolling.step_size))
          .put("n_windows"_kj, static_cast<uint64_t>(s.n_windows))
          .put("all_pass_rate"_kj, s.all_pass_rate)
          .put("verdict_stability"_kj, s.verdict_stability)
          .put("assessment"_kj, stability_assessment_to_string(s.assessment));
      b.put_array("windows"_kj, [&](core::JsonBuilder& arr) {
        for (const auto& w : rolling.windows) {
          arr.add_object([&](core::JsonBuilder& o) {
            o.put("window_id"_kj, static_cast<uint64_t>(w.window_id))
                .put("start"_kj, static_cast<uint64_t>(w.start_index))
                .put("end"_kj, static_cast<uint64_t>(w.end_index))
                .put("n_violations"_kj, static_cast<uint64_t>(w.n_violations))
                .put("all_passed"_kj, w.all_passed());
          });
        }
      });
    });
  }

  return builder.build(true);
}

kj::String report_file_name(kj::StringPtr timestamp) {
  return kj::str("var_backtest_suite_snapshot_", timestamp, ".md");
}

kj::String write_report(kj::StringPtr directory, kj::StringPtr file_name, kj::StringPtr content,
                        core::Logger& logger) {
  std::error_code ec;
  std::filesystem::create_directories(directory.cStr(), ec);
  if (ec) {
    throw core::ResourceException(
        kj::str("Cannot create output directory '", directory, "': ", ec.message().c_str()));
  }

  auto path = kj::str((std::filesystem::path(directory.cStr()) / file_name.cStr()).c_str());
  logger.info(kj::str("Writing report to: ", path));

  bool written = false;
  KJ_IF_SOME(exception, kj::runCatchingExceptions([&]() {
               std::ofstream out_file(path.cStr());
               if (!out_file.is_open()) {
                 return;
               }
               out_file << content.cStr();
               out_file.close();
               written = !out_file.fail();
             })) {
    throw core::ResourceException(
        kj::str("Failed to write report: ", exception.getDescription()));
  }
  if (!written) {
    throw core::ResourceException(kj::str("Failed to open file for writing: ", path));
  }

  logger.info(kj::str("Report written: ", path));
  return path;
}

} // namespace peaktrade::backtest
