/**
 * @file logger.h
 * @brief Logging system for the PeakTrade risk tooling
 *
 * Provides log levels, formatters (text and JSON), output destinations
 * (console, arbitrary kj::OutputStream, file, fan-out) and a thread-safe
 * Logger that records the caller's source location.
 */

#pragma once

#include <chrono>
#include <cstdint>
#include <fstream>
#include <kj/common.h>
#include <kj/io.h>
#include <kj/memory.h>
#include <kj/mutex.h>
#include <kj/string.h>
#include <kj/vector.h>
#include <source_location>

namespace peaktrade::core {

/**
 * @brief Log level enumeration
 *
 * Ordered from Trace (most detailed) to Critical (most severe). Off disables
 * all output.
 */
enum class LogLevel : std::uint8_t {
  Trace = 0,    ///< Most detailed diagnostic information
  Debug = 1,    ///< Development diagnostics
  Info = 2,     ///< Normal runtime information
  Warn = 3,     ///< Potential issues
  Error = 4,    ///< Errors
  Critical = 5, ///< Errors that prevent the program from continuing
  Off = 6,      ///< Disable all output
};

/**
 * @brief Convert LogLevel to its upper-case name
 */
[[nodiscard]] kj::StringPtr to_string(LogLevel level);

/**
 * @brief Log entry containing all log information
 */
struct LogEntry {
  LogLevel level;
  kj::String timestamp;
  kj::String file;
  int_least32_t line;
  kj::String function;
  kj::String message;
  std::chrono::system_clock::time_point time_point;
};

/**
 * @brief Base class for log formatters
 */
class LogFormatter {
public:
  virtual ~LogFormatter() = default;

  [[nodiscard]] virtual kj::String format(const LogEntry& entry) const = 0;
  [[nodiscard]] virtual kj::StringPtr name() const = 0;
};

/**
 * @brief Human-readable formatter
 *
 * Format: [YYYY-MM-DD HH:MM:SS.mmm] [LEVEL] file:line - message
 */
class TextFormatter final : public LogFormatter {
public:
  /**
   * @param include_function Whether to include the function name
   * @param use_color Whether to wrap the level in ANSI colour codes
   */
  explicit TextFormatter(bool include_function = false, bool use_color = false)
      : include_function_(include_function), use_color_(use_color) {}

  [[nodiscard]] kj::String format(const LogEntry& entry) const override;
  [[nodiscard]] kj::StringPtr name() const override {
    return "TextFormatter"_kj;
  }

private:
  bool include_function_;
  bool use_color_;

  [[nodiscard]] kj::String colorize(LogLevel level, kj::StringPtr text) const;
};

/**
 * @brief Structured formatter emitting one JSON object per entry
 *
 * Fields: timestamp, level, file, line, function, message
 */
class JsonFormatter final : public LogFormatter {
public:
  explicit JsonFormatter(bool pretty = false) : pretty_(pretty) {}

  [[nodiscard]] kj::String format(const LogEntry& entry) const override;
  [[nodiscard]] kj::StringPtr name() const override {
    return "JsonFormatter"_kj;
  }

private:
  bool pretty_;
};

/**
 * @brief Base class for log output destinations
 */
class LogOutput {
public:
  virtual ~LogOutput() = default;

  virtual void write(kj::StringPtr formatted, const LogEntry& entry) = 0;
  virtual void flush() = 0;
  [[nodiscard]] virtual bool is_open() const = 0;
};

/**
 * @brief Console destination
 *
 * Error and Critical entries go to stderr, the rest to stdout, unless
 * use_stderr routes everything to stderr.
 */
class ConsoleOutput final : public LogOutput {
public:
  explicit ConsoleOutput(bool use_stderr = false) : use_stderr_(use_stderr) {}

  void write(kj::StringPtr formatted, const LogEntry& entry) override;
  void flush() override;
  [[nodiscard]] bool is_open() const override {
    return true;
  }

private:
  bool use_stderr_;
};

/**
 * @brief Destination writing to a caller-owned kj::OutputStream
 *
 * The stream must outlive the output.
 */
class StreamOutput final : public LogOutput {
public:
  explicit StreamOutput(kj::OutputStream& stream) : stream_(stream) {}

  void write(kj::StringPtr formatted, const LogEntry& entry) override;
  void flush() override {}
  [[nodiscard]] bool is_open() const override {
    return true;
  }

private:
  kj::OutputStream& stream_;
};

/**
 * @brief Append-mode file destination
 */
class FileOutput final : public LogOutput {
public:
  /**
   * @throws ResourceException if the file cannot be opened
   */
  explicit FileOutput(kj::StringPtr file_path);
  ~FileOutput() noexcept override;

  void write(kj::StringPtr formatted, const LogEntry& entry) override;
  void flush() override;
  [[nodiscard]] bool is_open() const override;

  [[nodiscard]] kj::String current_path() const;

private:
  struct FileOutputState {
    kj::String file_path;
    std::ofstream file_stream;
    size_t bytes_written{0};

    explicit FileOutputState(kj::StringPtr path) : file_path(kj::str(path)) {}
  };

  kj::MutexGuarded<FileOutputState> guarded_;
};

/**
 * @brief Fan-out destination writing to several outputs
 */
class MultiOutput final : public LogOutput {
public:
  MultiOutput() = default;

  void add_output(kj::Own<LogOutput> output);
  void clear_outputs();

  void write(kj::StringPtr formatted, const LogEntry& entry) override;
  void flush() override;
  [[nodiscard]] bool is_open() const override;

  [[nodiscard]] size_t output_count() const;

private:
  struct MultiOutputState {
    kj::Vector<kj::Own<LogOutput>> outputs;
  };

  kj::MutexGuarded<MultiOutputState> guarded_;
};

/**
 * @brief Thread-safe logger
 *
 * Entries below the configured level are dropped before formatting.
 */
class Logger final {
public:
  Logger(kj::Own<LogFormatter> formatter = kj::heap<TextFormatter>(),
         kj::Own<LogOutput> output = kj::heap<ConsoleOutput>());

  ~Logger();

  void set_level(LogLevel level);
  [[nodiscard]] LogLevel level() const;

  void set_formatter(kj::Own<LogFormatter> formatter);

  /**
   * @brief Replace all destinations with a single one
   */
  void set_output(kj::Own<LogOutput> output);
  void add_output(kj::Own<LogOutput> output);

  void log(LogLevel level, kj::StringPtr message,
           const std::source_location& location = std::source_location::current());

  void trace(kj::StringPtr message,
             const std::source_location& location = std::source_location::current());
  void debug(kj::StringPtr message,
             const std::source_location& location = std::source_location::current());
  void info(kj::StringPtr message,
            const std::source_location& location = std::source_location::current());
  void warn(kj::StringPtr message,
            const std::source_location& location = std::source_location::current());
  void error(kj::StringPtr message,
             const std::source_location& location = std::source_location::current());
  void critical(kj::StringPtr message,
                const std::source_location& location = std::source_location::current());

  void flush();

private:
  struct LoggerState {
    kj::Own<LogFormatter> formatter;
    kj::Own<MultiOutput> multi_output;
    LogLevel level;

    LoggerState(kj::Own<LogFormatter> fmt, kj::Own<LogOutput> out)
        : formatter(kj::mv(fmt)), multi_output(kj::heap<MultiOutput>()), level(LogLevel::Info) {
      multi_output->add_output(kj::mv(out));
    }
  };

  kj::MutexGuarded<LoggerState> guarded_;
};

/**
 * @brief Process-wide logger (text to the console, Info level)
 */
[[nodiscard]] Logger& global_logger();

inline void info_global(kj::StringPtr message,
                        const std::source_location& location = std::source_location::current()) {
  global_logger().info(message, location);
}

inline void warn_global(kj::StringPtr message,
                        const std::source_location& location = std::source_location::current()) {
  global_logger().warn(message, location);
}

inline void error_global(kj::StringPtr message,
                         const std::source_location& location = std::source_location::current()) {
  global_logger().error(message, location);
}

} // namespace peaktrade::core
