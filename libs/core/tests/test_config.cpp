#include "kj/test.h"
#include "peaktrade/core/config.h"
#include "test_utilities.h"

#include <kj/string.h>

using namespace peaktrade::core;

namespace {

KJ_TEST("Config: Load from string") {
  Config config;
  config.load_from_string(R"({
      "symbol": "SPY",
      "confidence": 0.975,
      "n_observations": 750,
      "enable_rolling": true,
      "weights": [0.5, 0.5],
      "symbols": ["SPY", "QQQ"]
  })"_kj);

  KJ_EXPECT(config.size() == 6);
  KJ_EXPECT(config.get_or<kj::StringPtr>("symbol"_kj, "PORTFOLIO"_kj) == "SPY");
  KJ_EXPECT(config.get_or<double>("confidence"_kj, 0.99) == 0.975);
  KJ_EXPECT(config.get_or<int64_t>("n_observations"_kj, 500) == 750);
  KJ_EXPECT(config.get_or<bool>("enable_rolling"_kj, false));

  KJ_IF_SOME(weights, config.get<kj::ArrayPtr<const double>>("weights"_kj)) {
    KJ_EXPECT(weights.size() == 2);
    KJ_EXPECT(weights[1] == 0.5);
  }
  else {
    KJ_FAIL_EXPECT("weights not found");
  }
  KJ_IF_SOME(symbols, config.get<kj::ArrayPtr<const kj::String>>("symbols"_kj)) {
    KJ_EXPECT(symbols.size() == 2);
    KJ_EXPECT(symbols[1] == "QQQ");
  }
  else {
    KJ_FAIL_EXPECT("symbols not found");
  }
}

KJ_TEST("Config: Integers widen to double") {
  Config config;
  config.load_from_string(R"({"test_alpha": 1})"_kj);
  KJ_EXPECT(config.get_or<double>("test_alpha"_kj, 0.05) == 1.0);
}

KJ_TEST("Config: Type mismatch falls back to default") {
  Config config;
  config.load_from_string(R"({"confidence": "high"})"_kj);
  KJ_EXPECT(config.get<double>("confidence"_kj) == kj::none);
  KJ_EXPECT(config.get_or<double>("confidence"_kj, 0.99) == 0.99);
}

KJ_TEST("Config: Set, remove and merge") {
  Config base;
  base.set("symbol"_kj, kj::str("SPY"));
  base.set("confidence"_kj, 0.99);
  KJ_EXPECT(base.has_key("symbol"_kj));

  Config overlay;
  overlay.set("confidence"_kj, 0.95);
  overlay.set("no_report"_kj, true);

  base.merge(overlay);
  KJ_EXPECT(base.size() == 3);
  KJ_EXPECT(base.get_or<double>("confidence"_kj, 0.0) == 0.95);
  KJ_EXPECT(base.get_or<kj::StringPtr>("symbol"_kj, ""_kj) == "SPY");

  base.remove("symbol"_kj);
  KJ_EXPECT(!base.has_key("symbol"_kj));

  auto keys = base.keys();
  KJ_EXPECT(keys.size() == 2);
  KJ_EXPECT(keys[0] == "confidence");
}

KJ_TEST("Config: Serializes to JSON") {
  Config config;
  config.set("n_observations"_kj, int64_t{250});
  auto text = config.to_string();
  KJ_EXPECT(text.contains("\"n_observations\""));
  KJ_EXPECT(text.contains("250"));

  Config reloaded;
  reloaded.load_from_string(text);
  KJ_EXPECT(reloaded.get_or<int64_t>("n_observations"_kj, 0) == 250);
}

KJ_TEST("Config: Non-object root is rejected") {
  Config config;
  bool thrown = false;
  try {
    config.load_from_string("[1, 2, 3]"_kj);
  } catch (const ConfigException& e) {
    thrown = true;
    KJ_EXPECT(e.message().contains("JSON object"));
    KJ_EXPECT(e.code() == ErrorCode::Configuration);
  }
  KJ_EXPECT(thrown);
  KJ_EXPECT(config.empty());
}

KJ_TEST("Config: Arrays must hold one element type") {
  Config config;
  KJ_EXPECT(peaktrade::test::throws_with<ConfigException>(
      [&] { config.load_from_string(R"({"windows": [250, "x"]})"_kj); },
      "Mixed element types in array for config key 'windows'"_kj));
  KJ_EXPECT(peaktrade::test::throws_with<ConfigException>(
      [&] { config.load_from_string(R"({"flags": [true, 1]})"_kj); }, "'flags'"_kj));

  config.load_from_string(R"({"alphas": [1, 0.5], "sizes": [250, 500]})"_kj);
  KJ_IF_SOME(alphas, config.get<kj::ArrayPtr<const double>>("alphas"_kj)) {
    KJ_EXPECT(alphas.size() == 2);
    KJ_EXPECT(alphas[0] == 1.0);
    KJ_EXPECT(alphas[1] == 0.5);
  }
  else {
    KJ_FAIL_EXPECT("mixed numeric array should widen to double");
  }
  KJ_EXPECT(config.has_key("sizes"_kj));
  KJ_EXPECT(config.get<kj::ArrayPtr<const double>>("sizes"_kj) == kj::none);
}

KJ_TEST("Config: Malformed and missing files are rejected") {
  Config config;
  bool malformed = false;
  try {
    config.load_from_string("{not json"_kj);
  } catch (const ConfigException&) {
    malformed = true;
  }
  KJ_EXPECT(malformed);

  bool missing = false;
  try {
    config.load_from_file("/nonexistent_peaktrade/config.json"_kj);
  } catch (const ConfigException& e) {
    missing = true;
    KJ_EXPECT(e.message().contains("Cannot load config"));
  }
  KJ_EXPECT(missing);
}

KJ_TEST("Config: Load from file") {
  peaktrade::test::TempDir dir("peaktrade_config_test");
  auto path = dir.file("suite.json");
  peaktrade::test::write_file(path, R"({"output_dir": "out/reports"})"_kj);

  Config config;
  config.load_from_file(path);
  KJ_EXPECT(config.get_or<kj::StringPtr>("output_dir"_kj, ""_kj) == "out/reports");
}

} // namespace
