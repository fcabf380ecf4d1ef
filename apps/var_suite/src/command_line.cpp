#include "peaktrade/var_suite/command_line.h"

#include "peaktrade/core/error.h"

#include <cerrno>
#include <cmath>
#include <cstdlib>

namespace peaktrade::var_suite {

namespace {

constexpr const char* kUsage =
    R"(Usage: peaktrade_var_suite [options]

Run the VaR backtest suite (Kupiec POF, Christoffersen independence and
conditional coverage, Basel traffic light) and write a markdown snapshot.

Data source:
  --returns-file <path>          CSV of realized returns (last column)
  --var-file <path>              CSV of VaR forecasts (required with --returns-file)
  --use-synthetic                Use deterministic synthetic data
  --n-observations <int>         Synthetic series length (default: 500)

Parameters:
  --symbol <name>                Symbol or portfolio name (default: PORTFOLIO)
  --confidence <float>           VaR confidence level (default: 0.99)
  --test-alpha <float>           Test significance level (default: 0.05)

Phase 9A:
  --enable-duration-diagnostic   Inter-exceedance duration diagnostic
  --enable-exponential-test      Add the exponential goodness-of-fit check

Phase 9B:
  --enable-rolling               Rolling-window evaluation
  --rolling-window-size <int>    Window size (default: 250)
  --rolling-step-size <int>      Step size (default: window size)

Output:
  --output-dir <path>            Report directory (default: reports/var_backtest)
  --no-report                    Skip the markdown report
  --json-output <path>           Also write the verdict as JSON

  --config <path>                JSON file with defaults for the options above
  -v, --verbose                  Debug logging
  -h, --help                     Show this help

Exit codes: 0 all core tests passed, 1 some failed, 2 usage or data error.
)";

struct FlagArg {
  kj::String name;
  kj::Maybe<kj::StringPtr> inline_value;
};

// "--flag=value" -> {"--flag", "value"}
FlagArg split_flag(kj::StringPtr arg) {
  if (arg.startsWith("--"_kj)) {
    KJ_IF_SOME(eq, arg.findFirst('=')) {
      return FlagArg{kj::heapString(arg.begin(), eq), arg.slice(eq + 1)};
    }
  }
  return FlagArg{kj::heapString(arg), kj::none};
}

double parse_double(kj::StringPtr flag, kj::StringPtr text) {
  char* end = nullptr;
  errno = 0;
  double value = std::strtod(text.cStr(), &end);
  if (text.size() == 0 || end != text.end() || errno == ERANGE || !std::isfinite(value)) {
    throw core::ValidationException(kj::str("Invalid number for ", flag, ": '", text, "'"));
  }
  return value;
}

size_t parse_size(kj::StringPtr flag, kj::StringPtr text) {
  char* end = nullptr;
  errno = 0;
  long long value = std::strtoll(text.cStr(), &end, 10);
  if (text.size() == 0 || end != text.end() || errno == ERANGE) {
    throw core::ValidationException(kj::str("Invalid integer for ", flag, ": '", text, "'"));
  }
  if (value < 0) {
    throw core::ValidationException(kj::str(flag, " must not be negative, got ", value));
  }
  return static_cast<size_t>(value);
}

size_t config_size(kj::StringPtr key, int64_t value) {
  if (value < 0) {
    throw core::ConfigException(kj::str("Config key '", key, "' must not be negative"));
  }
  return static_cast<size_t>(value);
}

// Typed config lookup that rejects a present key of the wrong type
template <typename T>
kj::Maybe<T> config_value(const core::Config& source, kj::StringPtr key, const char* expected) {
  if (!source.has_key(key)) {
    return kj::none;
  }
  KJ_IF_SOME(value, source.get<T>(key)) {
    return value;
  }
  throw core::ConfigException(kj::str("Config key '", key, "' must be ", expected));
}

kj::Maybe<kj::StringPtr> find_config_path(kj::ArrayPtr<const kj::StringPtr> args) {
  for (size_t i = 0; i < args.size(); ++i) {
    auto flag = split_flag(args[i]);
    if (flag.name != "--config"_kj) {
      continue;
    }
    KJ_IF_SOME(value, flag.inline_value) {
      return value;
    }
    if (i + 1 < args.size()) {
      return args[i + 1];
    }
    throw core::ValidationException("Missing value for --config"_kj);
  }
  return kj::none;
}

} // namespace

kj::StringPtr usage_text() {
  return kUsage;
}

void apply_config(SuiteConfig& config, const core::Config& source) {
  static constexpr const char* kKnownKeys[] = {"returns_file",
                                               "var_file",
                                               "use_synthetic",
                                               "n_observations",
                                               "symbol",
                                               "confidence",
                                               "test_alpha",
                                               "min_observations",
                                               "basel_window",
                                               "enable_duration_diagnostic",
                                               "enable_exponential_test",
                                               "enable_rolling",
                                               "rolling_window_size",
                                               "rolling_step_size",
                                               "output_dir",
                                               "no_report",
                                               "json_output",
                                               "verbose"};

  for (const auto& key : source.keys()) {
    bool known = false;
    for (const char* k : kKnownKeys) {
      known = known || key == kj::StringPtr(k);
    }
    if (!known) {
      throw core::ConfigException(kj::str("Unknown config key '", key, "'"));
    }
  }

  KJ_IF_SOME(v, config_value<kj::StringPtr>(source, "returns_file"_kj, "a string")) {
    config.returns_file = kj::str(v);
  }
  KJ_IF_SOME(v, config_value<kj::StringPtr>(source, "var_file"_kj, "a string")) {
    config.var_file = kj::str(v);
  }
  KJ_IF_SOME(v, config_value<bool>(source, "use_synthetic"_kj, "a boolean")) {
    config.use_synthetic = v;
  }
  KJ_IF_SOME(v, config_value<int64_t>(source, "n_observations"_kj, "an integer")) {
    config.n_observations = config_size("n_observations"_kj, v);
  }
  KJ_IF_SOME(v, config_value<kj::StringPtr>(source, "symbol"_kj, "a string")) {
    config.symbol = kj::str(v);
  }
  KJ_IF_SOME(v, config_value<double>(source, "confidence"_kj, "a number")) {
    config.confidence = v;
  }
  KJ_IF_SOME(v, config_value<double>(source, "test_alpha"_kj, "a number")) {
    config.test_alpha = v;
  }
  KJ_IF_SOME(v, config_value<int64_t>(source, "min_observations"_kj, "an integer")) {
    config.min_observations = config_size("min_observations"_kj, v);
  }
  KJ_IF_SOME(v, config_value<int64_t>(source, "basel_window"_kj, "an integer")) {
    config.basel_window = config_size("basel_window"_kj, v);
  }
  KJ_IF_SOME(v, config_value<bool>(source, "enable_duration_diagnostic"_kj, "a boolean")) {
    config.enable_duration_diagnostic = v;
  }
  KJ_IF_SOME(v, config_value<bool>(source, "enable_exponential_test"_kj, "a boolean")) {
    config.enable_exponential_test = v;
  }
  KJ_IF_SOME(v, config_value<bool>(source, "enable_rolling"_kj, "a boolean")) {
    config.enable_rolling = v;
  }
  KJ_IF_SOME(v, config_value<int64_t>(source, "rolling_window_size"_kj, "an integer")) {
    config.rolling_window_size = config_size("rolling_window_size"_kj, v);
  }
  KJ_IF_SOME(v, config_value<int64_t>(source, "rolling_step_size"_kj, "an integer")) {
    config.rolling_step_size = config_size("rolling_step_size"_kj, v);
  }
  KJ_IF_SOME(v, config_value<kj::StringPtr>(source, "output_dir"_kj, "a string")) {
    config.output_dir = kj::str(v);
  }
  KJ_IF_SOME(v, config_value<bool>(source, "no_report"_kj, "a boolean")) {
    config.no_report = v;
  }
  KJ_IF_SOME(v, config_value<kj::StringPtr>(source, "json_output"_kj, "a string")) {
    config.json_output = kj::str(v);
  }
  KJ_IF_SOME(v, config_value<bool>(source, "verbose"_kj, "a boolean")) {
    config.verbose = v;
  }
}

SuiteConfig parse_command_line(kj::ArrayPtr<const kj::StringPtr> args) {
  SuiteConfig config;

  KJ_IF_SOME(path, find_config_path(args)) {
    core::Config file;
    file.load_from_file(path);
    apply_config(config, file);
    config.config_file = kj::str(path);
  }

  for (size_t i = 0; i < args.size(); ++i) {
    auto flag = split_flag(args[i]);
    const kj::StringPtr name = flag.name;

    auto value = [&]() -> kj::StringPtr {
      KJ_IF_SOME(v, flag.inline_value) {
        return v;
      }
      if (i + 1 >= args.size()) {
        throw core::ValidationException(kj::str("Missing value for ", name));
      }
      return args[++i];
    };
    auto no_value = [&]() {
      if (flag.inline_value != kj::none) {
        throw core::ValidationException(kj::str(name, " does not take a value"));
      }
    };

    if (name == "-h"_kj || name == "--help"_kj) {
      no_value();
      config.show_help = true;
    } else if (name == "-v"_kj || name == "--verbose"_kj) {
      no_value();
      config.verbose = true;
    } else if (name == "--config"_kj) {
      (void)value(); // applied above
    } else if (name == "--returns-file"_kj) {
      config.returns_file = kj::str(value());
    } else if (name == "--var-file"_kj) {
      config.var_file = kj::str(value());
    } else if (name == "--use-synthetic"_kj) {
      no_value();
      config.use_synthetic = true;
    } else if (name == "--n-observations"_kj) {
      config.n_observations = parse_size(name, value());
    } else if (name == "--symbol"_kj) {
      config.symbol = kj::str(value());
    } else if (name == "--confidence"_kj) {
      config.confidence = parse_double(name, value());
    } else if (name == "--test-alpha"_kj) {
      config.test_alpha = parse_double(name, value());
    } else if (name == "--enable-duration-diagnostic"_kj) {
      no_value();
      config.enable_duration_diagnostic = true;
    } else if (name == "--enable-exponential-test"_kj) {
      no_value();
      config.enable_exponential_test = true;
    } else if (name == "--enable-rolling"_kj) {
      no_value();
      config.enable_rolling = true;
    } else if (name == "--rolling-window-size"_kj) {
      config.rolling_window_size = parse_size(name, value());
    } else if (name == "--rolling-step-size"_kj) {
      config.rolling_step_size = parse_size(name, value());
    } else if (name == "--output-dir"_kj) {
      config.output_dir = kj::str(value());
    } else if (name == "--no-report"_kj) {
      no_value();
      config.no_report = true;
    } else if (name == "--json-output"_kj) {
      config.json_output = kj::str(value());
    } else {
      throw core::ValidationException(kj::str("Unknown argument: ", args[i]));
    }
  }

  return config;
}

void validate_config(const SuiteConfig& config) {
  const bool has_returns = config.returns_file != kj::none;
  const bool has_var = config.var_file != kj::none;

  if (!config.use_synthetic) {
    if (!has_returns && !has_var) {
      throw core::ValidationException(
          "Provide --returns-file and --var-file, or use --use-synthetic"_kj);
    }
    if (has_returns && !has_var) {
      throw core::ValidationException("--var-file is required when --returns-file is given"_kj);
    }
    if (has_var && !has_returns) {
      throw core::ValidationException("--returns-file is required when --var-file is given"_kj);
    }
  }

  if (!(config.confidence > 0.0 && config.confidence < 1.0)) {
    throw core::ValidationException(
        kj::str("--confidence must lie in (0, 1), got ", config.confidence));
  }
  if (!(config.test_alpha > 0.0 && config.test_alpha < 1.0)) {
    throw core::ValidationException(
        kj::str("--test-alpha must lie in (0, 1), got ", config.test_alpha));
  }
  if (config.use_synthetic && config.n_observations < config.min_observations) {
    throw core::ValidationException(kj::str("--n-observations must be at least ",
                                            config.min_observations, ", got ",
                                            config.n_observations));
  }
  if (config.basel_window == 0) {
    throw core::ValidationException("basel_window must be positive"_kj);
  }
}

} // namespace peaktrade::var_suite
