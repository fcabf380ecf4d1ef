#include "peaktrade/var_suite/suite_app.h"

#include "peaktrade/backtest/exceedances.h"
#include "peaktrade/core/error.h"
#include "peaktrade/core/logger.h"
#include "peaktrade/core/time.h"
#include "peaktrade/var_suite/command_line.h"

#include <chrono>     // std::chrono::system_clock - report timestamps
#include <filesystem> // std::filesystem::path - split the JSON output path
#include <kj/debug.h>
#include <kj/exception.h>

namespace peaktrade::var_suite {

namespace {

void write_text(kj::OutputStream& stream, kj::StringPtr text) {
  stream.write(text.asBytes());
}

kj::StringPtr on_off(bool enabled) {
  return enabled ? "on"_kj : "off"_kj;
}

} // namespace

SuiteApp::SuiteApp(SuiteConfig config, kj::OutputStream& out, kj::OutputStream& err)
    : config_(kj::mv(config)), out_(out), err_(err),
      logger_(kj::heap<core::Logger>(kj::heap<core::TextFormatter>(),
                                     kj::heap<core::StreamOutput>(err))) {
  logger_->set_level(config_.verbose ? core::LogLevel::Debug : core::LogLevel::Info);
}

SuiteApp::~SuiteApp() = default;

int SuiteApp::run() {
  try {
    validate_config(config_);

    logger_->info(kj::str("VaR backtest suite starting (", config_.symbol,
                          ", confidence=", config_.confidence, ")"));

    logger_->info("Step 1/6: Loading data..."_kj);
    auto series = load_series();

    logger_->info("Step 2/6: Building exceedance sequence..."_kj);
    auto exceedances = backtest::build_exceedances(series.returns, series.var_forecasts);
    logger_->debug(kj::str("Exceedances: ", backtest::count_violations(exceedances), " of ",
                           exceedances.size()));

    logger_->info(kj::str("Step 3/6: Running tests (duration diagnostic ",
                          on_off(config_.enable_duration_diagnostic), ", rolling ",
                          on_off(config_.enable_rolling), ")..."));
    auto verdict = backtest::run_backtest_suite(exceedances, config_.confidence, suite_options());

    const auto now = std::chrono::system_clock::now();
    auto context = report_context(core::format_local_time(now, "%Y-%m-%d %H:%M:%S"_kj));

    logger_->info("Step 4/6: Printing summary..."_kj);
    write_text(out_, backtest::render_console_summary(verdict, context));

    if (config_.no_report) {
      logger_->info("Step 5/6: Markdown report skipped (--no-report)"_kj);
    } else {
      logger_->info("Step 5/6: Writing markdown report..."_kj);
      auto name = backtest::report_file_name(core::format_local_time(now, "%Y%m%d_%H%M%S"_kj));
      auto path = backtest::write_report(config_.output_dir, name,
                                         backtest::render_markdown_report(verdict, context),
                                         *logger_);
      logger_->info(kj::str("Report saved to: ", path));
    }

    KJ_IF_SOME(json_path, config_.json_output) {
      logger_->info("Step 6/6: Writing JSON verdict..."_kj);
      write_json(verdict, context, json_path);
    } else {
      logger_->debug("Step 6/6: JSON export not requested"_kj);
    }

    if (verdict.overall_pass) {
      logger_->info("Overall verdict: PASS"_kj);
      return kExitPass;
    }
    logger_->warn("Overall verdict: FAIL"_kj);
    return kExitFail;
  } catch (const core::PeakTradeException& e) {
    logger_->error(e.describe());
    write_text(err_, kj::str("Error: ", e.message(), "\n"));
    return kExitError;
  } catch (const kj::Exception& e) {
    logger_->error(e.getDescription());
    write_text(err_, kj::str("Error: ", e.getDescription(), "\n"));
    return kExitError;
  }
}

backtest::ReturnSeries SuiteApp::load_series() {
  if (config_.use_synthetic) {
    logger_->info(kj::str("Generating synthetic data (", config_.n_observations,
                          " observations)"));
    return backtest::generate_synthetic_series(config_.n_observations, config_.confidence);
  }

  auto& returns_path = KJ_ASSERT_NONNULL(config_.returns_file);
  auto& var_path = KJ_ASSERT_NONNULL(config_.var_file);

  logger_->info(kj::str("Loading returns from: ", returns_path));
  auto returns = backtest::load_series_csv(returns_path, *logger_);
  logger_->info(kj::str("Loading VaR estimates from: ", var_path));
  auto forecasts = backtest::load_series_csv(var_path, *logger_);
  logger_->info(kj::str("Loaded ", returns.size(), " returns and ", forecasts.size(),
                        " VaR estimates"));

  return backtest::ReturnSeries{kj::mv(returns), kj::mv(forecasts)};
}

backtest::SuiteOptions SuiteApp::suite_options() const {
  backtest::SuiteOptions options;
  options.test_alpha = config_.test_alpha;
  options.min_observations = config_.min_observations;
  options.basel_window = config_.basel_window;
  options.enable_duration_diagnostic = config_.enable_duration_diagnostic;
  options.enable_exponential_test = config_.enable_exponential_test;
  options.enable_rolling = config_.enable_rolling;
  options.rolling_window_size = config_.rolling_window_size;
  options.rolling_step_size = config_.rolling_step_size;
  return options;
}

backtest::ReportContext SuiteApp::report_context(kj::StringPtr generated_at) const {
  return backtest::ReportContext{kj::str(config_.symbol), config_.confidence, config_.test_alpha,
                                 kj::str(generated_at)};
}

void SuiteApp::write_json(const backtest::BacktestVerdict& verdict,
                          const backtest::ReportContext& context, kj::StringPtr path) {
  std::filesystem::path target(path.cStr());
  auto directory = target.has_parent_path() ? kj::str(target.parent_path().c_str()) : kj::str(".");
  auto file_name = kj::str(target.filename().c_str());
  (void)backtest::write_report(directory, file_name, backtest::verdict_to_json(verdict, context),
                               *logger_);
}

int run_cli(kj::ArrayPtr<const kj::StringPtr> args, kj::OutputStream& out, kj::OutputStream& err) {
  SuiteConfig config;
  try {
    config = parse_command_line(args);
  } catch (const core::PeakTradeException& e) {
    write_text(err, kj::str("Error: ", e.message(), "\n\n", usage_text()));
    return kExitError;
  }

  if (config.show_help) {
    write_text(out, usage_text());
    return kExitPass;
  }

  SuiteApp app(kj::mv(config), out, err);
  return app.run();
}

} // namespace peaktrade::var_suite
