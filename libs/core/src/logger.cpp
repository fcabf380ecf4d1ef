#include "peaktrade/core/logger.h"

#include "peaktrade/core/error.h"
#include "peaktrade/core/json.h"
#include "peaktrade/core/time.h"

#include <cstdio>
#include <ctime>
#include <iostream>
#include <kj/common.h>
#include <kj/debug.h>
#include <kj/memory.h>

namespace peaktrade::core {

// ============================================================================
// to_string(LogLevel) Implementation
// ============================================================================

kj::StringPtr to_string(LogLevel level) {
  switch (level) {
  case LogLevel::Trace:
    return "TRACE"_kj;
  case LogLevel::Debug:
    return "DEBUG"_kj;
  case LogLevel::Info:
    return "INFO"_kj;
  case LogLevel::Warn:
    return "WARN"_kj;
  case LogLevel::Error:
    return "ERROR"_kj;
  case LogLevel::Critical:
    return "CRITICAL"_kj;
  case LogLevel::Off:
    return "OFF"_kj;
  }
  return "UNKNOWN"_kj;
}

// ============================================================================
// TextFormatter Implementation
// ============================================================================

kj::String TextFormatter::colorize(LogLevel level, kj::StringPtr text) const {
  if (!use_color_) {
    return kj::heapString(text);
  }

  kj::StringPtr color_code;
  switch (level) {
  case LogLevel::Trace:
    color_code = "\033[90m"_kj; // Gray
    break;
  case LogLevel::Debug:
    color_code = "\033[36m"_kj; // Cyan
    break;
  case LogLevel::Info:
    color_code = "\033[32m"_kj; // Green
    break;
  case LogLevel::Warn:
    color_code = "\033[33m"_kj; // Yellow
    break;
  case LogLevel::Error:
    color_code = "\033[31m"_kj; // Red
    break;
  case LogLevel::Critical:
    color_code = "\033[35m"_kj; // Magenta
    break;
  default:
    color_code = "\033[0m"_kj;
  }

  return kj::str(color_code, text, "\033[0m"_kj);
}

kj::String TextFormatter::format(const LogEntry& entry) const {
  auto time_t_sec = std::chrono::system_clock::to_time_t(entry.time_point);
  auto ms =
      std::chrono::duration_cast<std::chrono::milliseconds>(entry.time_point.time_since_epoch()) %
      1000;
  std::tm tm{};
  localtime_r(&time_t_sec, &tm);

  char timestamp[64];
  std::snprintf(timestamp, sizeof(timestamp), "[%04d-%02d-%02d %02d:%02d:%02d.%03d]",
                tm.tm_year + 1900, tm.tm_mon + 1, tm.tm_mday, tm.tm_hour, tm.tm_min, tm.tm_sec,
                static_cast<int>(ms.count()));

  kj::String label = kj::str("["_kj, to_string(entry.level), "]"_kj);
  kj::String level_part = use_color_ ? colorize(entry.level, label) : kj::mv(label);

  kj::String location = include_function_
                            ? kj::str(entry.file, ":"_kj, entry.line, " "_kj, entry.function)
                            : kj::str(entry.file, ":"_kj, entry.line);

  return kj::str(timestamp, " "_kj, level_part, " "_kj, location, " - "_kj, entry.message);
}

// ============================================================================
// JsonFormatter Implementation
// ============================================================================

kj::String JsonFormatter::format(const LogEntry& entry) const {
  auto builder = JsonBuilder::object();
  builder.put("timestamp"_kj, entry.timestamp.asPtr())
      .put("level"_kj, to_string(entry.level))
      .put("file"_kj, entry.file.asPtr())
      .put("line"_kj, static_cast<int64_t>(entry.line))
      .put("function"_kj, entry.function.asPtr())
      .put("message"_kj, entry.message.asPtr());
  return builder.build(pretty_);
}

// ============================================================================
// ConsoleOutput / StreamOutput Implementation
// ============================================================================

void ConsoleOutput::write(kj::StringPtr formatted, const LogEntry& entry) {
  std::ostream* out = &std::cout;
  if (use_stderr_ || entry.level == LogLevel::Error || entry.level == LogLevel::Critical) {
    out = &std::cerr;
  }

  out->write(formatted.begin(), static_cast<std::streamsize>(formatted.size()));
  *out << std::endl;
}

void ConsoleOutput::flush() {
  std::cout.flush();
  std::cerr.flush();
}

void StreamOutput::write(kj::StringPtr formatted, const LogEntry& /* entry */) {
  auto line = kj::str(formatted, "\n");
  stream_.write(line.asBytes());
}

// ============================================================================
// FileOutput Implementation
// ============================================================================

FileOutput::FileOutput(kj::StringPtr file_path) : guarded_(file_path) {
  auto lock = guarded_.lockExclusive();
  lock->file_stream.open(lock->file_path.cStr(), std::ios::out | std::ios::app);
  if (!lock->file_stream.is_open()) {
    throw ResourceException(kj::str("Failed to open log file: ", lock->file_path));
  }
}

FileOutput::~FileOutput() noexcept {
  auto lock = guarded_.lockExclusive();
  if (lock->file_stream.is_open()) {
    lock->file_stream.close();
  }
}

void FileOutput::write(kj::StringPtr formatted, const LogEntry& /* entry */) {
  auto lock = guarded_.lockExclusive();
  if (!lock->file_stream.is_open()) {
    return;
  }
  lock->file_stream.write(formatted.begin(), static_cast<std::streamsize>(formatted.size()));
  lock->file_stream << '\n';
  lock->bytes_written += formatted.size() + 1;
}

void FileOutput::flush() {
  auto lock = guarded_.lockExclusive();
  if (lock->file_stream.is_open()) {
    lock->file_stream.flush();
  }
}

bool FileOutput::is_open() const {
  return guarded_.lockExclusive()->file_stream.is_open();
}

kj::String FileOutput::current_path() const {
  return kj::str(guarded_.lockExclusive()->file_path);
}

// ============================================================================
// MultiOutput Implementation
// ============================================================================

void MultiOutput::add_output(kj::Own<LogOutput> output) {
  guarded_.lockExclusive()->outputs.add(kj::mv(output));
}

void MultiOutput::clear_outputs() {
  guarded_.lockExclusive()->outputs.clear();
}

void MultiOutput::write(kj::StringPtr formatted, const LogEntry& entry) {
  auto lock = guarded_.lockExclusive();
  for (auto& output : lock->outputs) {
    output->write(formatted, entry);
  }
}

void MultiOutput::flush() {
  auto lock = guarded_.lockExclusive();
  for (auto& output : lock->outputs) {
    output->flush();
  }
}

bool MultiOutput::is_open() const {
  return !guarded_.lockExclusive()->outputs.empty();
}

size_t MultiOutput::output_count() const {
  return guarded_.lockExclusive()->outputs.size();
}

// ============================================================================
// Logger Implementation
// ============================================================================

Logger::Logger(kj::Own<LogFormatter> formatter, kj::Own<LogOutput> output)
    : guarded_(kj::mv(formatter), kj::mv(output)) {}

Logger::~Logger() = default;

void Logger::set_level(LogLevel level) {
  guarded_.lockExclusive()->level = level;
}

LogLevel Logger::level() const {
  return guarded_.lockExclusive()->level;
}

void Logger::set_formatter(kj::Own<LogFormatter> formatter) {
  guarded_.lockExclusive()->formatter = kj::mv(formatter);
}

void Logger::set_output(kj::Own<LogOutput> output) {
  auto lock = guarded_.lockExclusive();
  lock->multi_output = kj::heap<MultiOutput>();
  lock->multi_output->add_output(kj::mv(output));
}

void Logger::add_output(kj::Own<LogOutput> output) {
  guarded_.lockExclusive()->multi_output->add_output(kj::mv(output));
}

void Logger::log(LogLevel level, kj::StringPtr message, const std::source_location& location) {
  auto lock = guarded_.lockExclusive();
  if (lock->level == LogLevel::Off || level == LogLevel::Off ||
      static_cast<int>(level) < static_cast<int>(lock->level)) {
    return;
  }

  // Strip directories from the file name
  kj::StringPtr file_path(location.file_name());
  const char* begin = file_path.begin();
  const char* base = file_path.end();
  while (base > begin && base[-1] != '/' && base[-1] != '\\') {
    --base;
  }

  LogEntry entry{.level = level,
                 .timestamp = now_utc_iso8601(),
                 .file = kj::heapString(base, static_cast<size_t>(file_path.end() - base)),
                 .line = static_cast<int_least32_t>(location.line()),
                 .function = kj::heapString(location.function_name()),
                 .message = kj::heapString(message),
                 .time_point = std::chrono::system_clock::now()};

  auto formatted = lock->formatter->format(entry);
  lock->multi_output->write(formatted, entry);
}

void Logger::trace(kj::StringPtr message, const std::source_location& location) {
  log(LogLevel::Trace, message, location);
}

void Logger::debug(kj::StringPtr message, const std::source_location& location) {
  log(LogLevel::Debug, message, location);
}

void Logger::info(kj::StringPtr message, const std::source_location& location) {
  log(LogLevel::Info, message, location);
}

void Logger::warn(kj::StringPtr message, const std::source_location& location) {
  log(LogLevel::Warn, message, location);
}

void Logger::error(kj::StringPtr message, const std::source_location& location) {
  log(LogLevel::Error, message, location);
}

void Logger::critical(kj::StringPtr message, const std::source_location& location) {
  log(LogLevel::Critical, message, location);
}

void Logger::flush() {
  guarded_.lockExclusive()->multi_output->flush();
}

// ============================================================================
// Global Logger
// ============================================================================

namespace {

struct GlobalLoggerState {
  kj::Maybe<kj::Own<Logger>> logger{kj::none};
};

kj::MutexGuarded<GlobalLoggerState> g_global_logger;

} // namespace

Logger& global_logger() {
  auto lock = g_global_logger.lockExclusive();
  KJ_IF_SOME(logger, lock->logger) {
    return *logger;
  }
  auto new_logger = kj::heap<Logger>(kj::heap<TextFormatter>(), kj::heap<ConsoleOutput>());
  Logger& ref = *new_logger;
  lock->logger = kj::mv(new_logger);
  return ref;
}

} // namespace peaktrade::core
