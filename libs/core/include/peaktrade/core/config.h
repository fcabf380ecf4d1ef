#pragma once

#include "peaktrade/core/error.h"

#include <cstdint>
#include <kj/array.h>
#include <kj/common.h>
#include <kj/map.h>
#include <kj/memory.h>
#include <kj/one-of.h>
#include <kj/string.h>
#include <source_location>
#include <type_traits>

namespace peaktrade::core {

/**
 * @brief Flat key/value configuration loaded from a JSON object
 *
 * Nested objects are not supported; each top-level member becomes one key.
 */
class Config final {
public:
  using Value = kj::OneOf<bool, int64_t, double, kj::String, kj::Array<bool>, kj::Array<int64_t>,
                          kj::Array<double>, kj::Array<kj::String>>;

  Config() = default;

  /**
   * @brief Replace the contents with the members of a JSON file
   * @throws ConfigException if the file cannot be read, is not valid JSON, or
   *         the root is not an object
   */
  void load_from_file(kj::StringPtr file_path);

  /**
   * @brief Replace the contents with the members of a JSON text
   * @throws ConfigException on malformed input
   */
  void load_from_string(kj::StringPtr json_content);

  [[nodiscard]] kj::String to_string() const;

  [[nodiscard]] bool has_key(kj::StringPtr key) const;
  void set(kj::StringPtr key, Value value);
  void remove(kj::StringPtr key);

  /**
   * @brief Typed lookup
   *
   * Returns kj::none when the key is absent or holds another type. Integer
   * values widen to double.
   */
  template <typename T> [[nodiscard]] kj::Maybe<T> get(kj::StringPtr key) const {
    KJ_IF_SOME(value, config_.find(key)) {
      if constexpr (std::is_same_v<T, bool>) {
        if (value.template is<bool>()) {
          return value.template get<bool>();
        }
      } else if constexpr (std::is_same_v<T, int64_t>) {
        if (value.template is<int64_t>()) {
          return value.template get<int64_t>();
        }
      } else if constexpr (std::is_same_v<T, double>) {
        if (value.template is<double>()) {
          return value.template get<double>();
        }
        if (value.template is<int64_t>()) {
          return static_cast<double>(value.template get<int64_t>());
        }
      } else if constexpr (std::is_same_v<T, kj::StringPtr>) {
        if (value.template is<kj::String>()) {
          return value.template get<kj::String>().asPtr();
        }
      } else if constexpr (std::is_same_v<T, kj::ArrayPtr<const double>>) {
        if (value.template is<kj::Array<double>>()) {
          return value.template get<kj::Array<double>>().asPtr();
        }
      } else if constexpr (std::is_same_v<T, kj::ArrayPtr<const kj::String>>) {
        if (value.template is<kj::Array<kj::String>>()) {
          return value.template get<kj::Array<kj::String>>().asPtr();
        }
      } else {
        static_assert(kj::isSameType<T, void>(), "Unsupported config get<T>() type");
      }
      return kj::none;
    }
    return kj::none;
  }

  template <typename T> T get_or(kj::StringPtr key, T default_value) const {
    KJ_IF_SOME(value, get<T>(key)) {
      return kj::mv(value);
    }
    return kj::mv(default_value);
  }

  /**
   * @brief Overlay another configuration; keys in other win
   */
  void merge(const Config& other);

  [[nodiscard]] kj::Array<kj::String> keys() const;

  [[nodiscard]] bool empty() const {
    return config_.size() == 0;
  }

  [[nodiscard]] size_t size() const {
    return config_.size();
  }

private:
  kj::TreeMap<kj::String, Value> config_;
};

/**
 * @brief Configuration-related exception
 */
class ConfigException : public PeakTradeException {
public:
  explicit ConfigException(kj::StringPtr message,
                           const std::source_location& location = std::source_location::current())
      : PeakTradeException(message, kj::Exception::Type::FAILED, location) {}

  [[nodiscard]] ErrorCode code() const noexcept override {
    return ErrorCode::Configuration;
  }
};

} // namespace peaktrade::core
