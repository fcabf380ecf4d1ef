#pragma once

#include <kj/common.h>
#include <kj/debug.h>
#include <kj/exception.h>
#include <kj/string.h>
#include <source_location>

namespace peaktrade::core {

/**
 * @brief Failure category of a PeakTradeException
 */
enum class ErrorCode : int {
  Unknown = 0,
  Parse = 1,
  Validation = 2,
  Resource = 3,
  Configuration = 4,
};

/// "Validation Error", "Parse Error", ...
[[nodiscard]] kj::StringPtr to_string(ErrorCode code);

/**
 * @brief Base exception class using KJ exception infrastructure
 *
 * Captures the throw site through std::source_location and converts to
 * kj::Exception so it can travel through KJ's exception machinery.
 *
 * Usage:
 *   throw ValidationException(kj::str("alpha must lie in (0.5, 1.0), got ", alpha));
 */
class PeakTradeException {
public:
  explicit PeakTradeException(kj::StringPtr message,
                              kj::Exception::Type type = kj::Exception::Type::FAILED,
                              const std::source_location& location = std::source_location::current())
      : message_(kj::str(message)), file_(kj::str(location.file_name())), line_(location.line()),
        function_(kj::str(location.function_name())), type_(type) {}

  explicit PeakTradeException(kj::Exception&& e)
      : message_(kj::str(e.getDescription())), file_(kj::str(e.getFile())), line_(e.getLine()),
        function_(kj::str("")), type_(e.getType()) {}

  virtual ~PeakTradeException() = default;

  PeakTradeException(PeakTradeException&&) = default;
  PeakTradeException& operator=(PeakTradeException&&) = default;

  PeakTradeException(const PeakTradeException& other)
      : message_(kj::str(other.message_)), file_(kj::str(other.file_)), line_(other.line_),
        function_(kj::str(other.function_)), type_(other.type_) {}

  PeakTradeException& operator=(const PeakTradeException& other) {
    if (this != &other) {
      message_ = kj::str(other.message_);
      file_ = kj::str(other.file_);
      line_ = other.line_;
      function_ = kj::str(other.function_);
      type_ = other.type_;
    }
    return *this;
  }

  [[nodiscard]] kj::StringPtr message() const noexcept {
    return message_;
  }
  [[nodiscard]] kj::StringPtr file() const noexcept {
    return file_;
  }
  [[nodiscard]] int line() const noexcept {
    return line_;
  }
  [[nodiscard]] kj::StringPtr function() const noexcept {
    return function_;
  }
  [[nodiscard]] kj::Exception::Type type() const noexcept {
    return type_;
  }
  [[nodiscard]] virtual ErrorCode code() const noexcept {
    return ErrorCode::Unknown;
  }

  [[nodiscard]] const char* what() const noexcept {
    return message_.cStr();
  }

  [[nodiscard]] kj::Exception toKjException() const {
    return kj::Exception(type_, file_.cStr(), line_, kj::str(message_));
  }

  [[noreturn]] void throwException() const {
    kj::throwFatalException(toKjException());
  }

  /// "<category>: <message>"
  [[nodiscard]] kj::String describe() const;

protected:
  kj::String message_;
  kj::String file_;
  int line_;
  kj::String function_;
  kj::Exception::Type type_;
};

/**
 * @brief Parse error (malformed CSV rows, invalid JSON documents)
 */
class ParseException : public PeakTradeException {
public:
  explicit ParseException(kj::StringPtr message,
                          const std::source_location& location = std::source_location::current())
      : PeakTradeException(message, kj::Exception::Type::FAILED, location) {}

  [[nodiscard]] ErrorCode code() const noexcept override {
    return ErrorCode::Parse;
  }
};

/**
 * @brief Validation error (invalid input, constraint violations)
 */
class ValidationException : public PeakTradeException {
public:
  explicit ValidationException(kj::StringPtr message,
                               const std::source_location& location = std::source_location::current())
      : PeakTradeException(message, kj::Exception::Type::FAILED, location) {}

  [[nodiscard]] ErrorCode code() const noexcept override {
    return ErrorCode::Validation;
  }
};

/**
 * @brief Resource error (file cannot be opened, directory cannot be created)
 */
class ResourceException : public PeakTradeException {
public:
  explicit ResourceException(kj::StringPtr message,
                             const std::source_location& location = std::source_location::current())
      : PeakTradeException(message, kj::Exception::Type::FAILED, location) {}

  [[nodiscard]] ErrorCode code() const noexcept override {
    return ErrorCode::Resource;
  }
};

#define PEAKTRADE_REQUIRE(condition, ...) KJ_REQUIRE(condition, ##__VA_ARGS__)
#define PEAKTRADE_FAIL_REQUIRE(...) KJ_FAIL_REQUIRE(__VA_ARGS__)
#define PEAKTRADE_ASSERT(condition, ...) KJ_ASSERT(condition, ##__VA_ARGS__)

} // namespace peaktrade::core
