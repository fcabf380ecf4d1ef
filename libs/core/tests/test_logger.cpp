#include "kj/test.h"
#include "peaktrade/core/error.h"
#include "peaktrade/core/json.h"
#include "peaktrade/core/logger.h"
#include "test_utilities.h"

#include <kj/memory.h>
#include <kj/string.h>

using namespace peaktrade::core;
using peaktrade::test::TempDir;
using peaktrade::test::VectorOutputStream;

namespace {

LogEntry make_entry(LogLevel level, kj::StringPtr message) {
  return LogEntry{.level = level,
                  .timestamp = kj::str("2026-01-01T12:00:00.000Z"),
                  .file = kj::str("test.cpp"),
                  .line = 42,
                  .function = kj::str("test_func"),
                  .message = kj::str(message),
                  .time_point = std::chrono::system_clock::now()};
}

// ============================================================================
// LogLevel Tests
// ============================================================================

KJ_TEST("LogLevel: ToString") {
  KJ_EXPECT(to_string(LogLevel::Trace) == "TRACE");
  KJ_EXPECT(to_string(LogLevel::Debug) == "DEBUG");
  KJ_EXPECT(to_string(LogLevel::Info) == "INFO");
  KJ_EXPECT(to_string(LogLevel::Warn) == "WARN");
  KJ_EXPECT(to_string(LogLevel::Error) == "ERROR");
  KJ_EXPECT(to_string(LogLevel::Critical) == "CRITICAL");
  KJ_EXPECT(to_string(LogLevel::Off) == "OFF");
}

// ============================================================================
// Formatter Tests
// ============================================================================

KJ_TEST("TextFormatter: Format") {
  TextFormatter formatter(false, false);
  auto formatted = formatter.format(make_entry(LogLevel::Info, "Test message"));

  KJ_EXPECT(formatted.size() > 0);
  KJ_EXPECT(formatted.contains("[INFO]"));
  KJ_EXPECT(formatted.contains("test.cpp:42"));
  KJ_EXPECT(formatted.contains("Test message"));
  KJ_EXPECT(!formatted.contains("test_func"));
}

KJ_TEST("TextFormatter: WithFunction") {
  TextFormatter formatter(true, false);
  auto formatted = formatter.format(make_entry(LogLevel::Debug, "Debug message"));
  KJ_EXPECT(formatted.contains("test_func"));
}

KJ_TEST("TextFormatter: WithColor") {
  TextFormatter formatter(false, true);
  auto formatted = formatter.format(make_entry(LogLevel::Error, "Error message"));
  KJ_EXPECT(formatted.contains("\033[31m"));
  KJ_EXPECT(formatted.contains("\033[0m"));
}

KJ_TEST("JsonFormatter: Produces parseable object") {
  JsonFormatter formatter(false);
  auto formatted = formatter.format(make_entry(LogLevel::Warn, "quote \" inside"));

  auto doc = JsonDocument::parse(formatted);
  auto root = doc.root();
  KJ_EXPECT(root.is_object());
  KJ_EXPECT(root["level"_kj].get_string() == "WARN");
  KJ_EXPECT(root["line"_kj].get_int() == 42);
  KJ_EXPECT(root["message"_kj].get_string() == "quote \" inside");
  KJ_EXPECT(formatter.name() == "JsonFormatter");
}

// ============================================================================
// Output Tests
// ============================================================================

KJ_TEST("StreamOutput: Writes one line per entry") {
  VectorOutputStream stream;
  StreamOutput output(stream);

  output.write("first", make_entry(LogLevel::Info, "first"));
  output.write("second", make_entry(LogLevel::Info, "second"));

  KJ_EXPECT(stream.getString() == "first\nsecond\n");
}

KJ_TEST("FileOutput: Basic write") {
  TempDir dir("peaktrade_logger_test");
  auto path = dir.file("test.log");

  {
    FileOutput output(path);
    KJ_EXPECT(output.is_open());
    KJ_EXPECT(output.current_path() == path);
    output.write("Test log line", make_entry(LogLevel::Info, "Test log line"));
    output.flush();
  }

  auto content = peaktrade::test::read_file(path);
  KJ_EXPECT(content.contains("Test log line"));
}

KJ_TEST("FileOutput: Unopenable path throws") {
  bool thrown = false;
  try {
    FileOutput output("/nonexistent_peaktrade_dir/sub/test.log"_kj);
  } catch (const ResourceException& e) {
    thrown = true;
    KJ_EXPECT(e.message().contains("Failed to open log file"));
  }
  KJ_EXPECT(thrown);
}

KJ_TEST("MultiOutput: Fans out to every destination") {
  VectorOutputStream a;
  VectorOutputStream b;
  MultiOutput multi;
  multi.add_output(kj::heap<StreamOutput>(a));
  multi.add_output(kj::heap<StreamOutput>(b));
  KJ_EXPECT(multi.output_count() == 2);

  multi.write("line", make_entry(LogLevel::Info, "line"));
  KJ_EXPECT(a.getString() == "line\n");
  KJ_EXPECT(b.getString() == "line\n");

  multi.clear_outputs();
  KJ_EXPECT(multi.output_count() == 0);
}

// ============================================================================
// Logger Tests
// ============================================================================

KJ_TEST("Logger: Level filtering") {
  VectorOutputStream stream;
  Logger logger(kj::heap<TextFormatter>(), kj::heap<StreamOutput>(stream));
  KJ_EXPECT(logger.level() == LogLevel::Info);

  logger.debug("hidden debug");
  logger.info("visible info");
  logger.warn("visible warn");

  auto text = stream.getString();
  KJ_EXPECT(!text.contains("hidden debug"));
  KJ_EXPECT(text.contains("visible info"));
  KJ_EXPECT(text.contains("[WARN]"));

  logger.set_level(LogLevel::Trace);
  logger.trace("now visible");
  KJ_EXPECT(stream.getString().contains("now visible"));
}

KJ_TEST("Logger: Off suppresses everything") {
  VectorOutputStream stream;
  Logger logger(kj::heap<TextFormatter>(), kj::heap<StreamOutput>(stream));
  logger.set_level(LogLevel::Off);

  logger.critical("nothing");
  KJ_EXPECT(stream.getString().size() == 0);
}

KJ_TEST("Logger: Records caller location") {
  VectorOutputStream stream;
  Logger logger(kj::heap<TextFormatter>(), kj::heap<StreamOutput>(stream));
  logger.error("located");

  KJ_EXPECT(stream.getString().contains("test_logger.cpp"));
}

KJ_TEST("Logger: Formatter and outputs can be swapped") {
  VectorOutputStream first;
  VectorOutputStream second;
  Logger logger(kj::heap<TextFormatter>(), kj::heap<StreamOutput>(first));

  logger.set_formatter(kj::heap<JsonFormatter>());
  logger.add_output(kj::heap<StreamOutput>(second));
  logger.info("both");

  KJ_EXPECT(first.getString().contains("\"message\":\"both\""));
  KJ_EXPECT(second.getString().contains("\"message\":\"both\""));

  logger.set_output(kj::heap<StreamOutput>(second));
  logger.info("only second");
  KJ_EXPECT(!first.getString().contains("only second"));
  KJ_EXPECT(second.getString().contains("only second"));
}

} // namespace
