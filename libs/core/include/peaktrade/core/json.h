/**
 * @file json.h
 * @brief JSON reading and writing on top of yyjson
 *
 * Usage:
 *   auto doc = JsonDocument::parse(text);
 *   double confidence = doc.root()["confidence"].get_double(0.99);
 *
 *   auto builder = JsonBuilder::object();
 *   builder.put("symbol", "PORTFOLIO").put("overall_pass", true);
 *   kj::String json = builder.build();
 */

#pragma once

#include <cstddef>
#include <cstdint>
#include <kj/common.h>
#include <kj/function.h>
#include <kj/memory.h>
#include <kj/string.h>
#include <kj/vector.h>

// Forward declarations for yyjson types to avoid including the C header
struct yyjson_doc;
struct yyjson_val;
struct yyjson_mut_doc;
struct yyjson_mut_val;

namespace peaktrade::core {

/**
 * @brief RAII wrapper for yyjson_mut_doc* (mutable document)
 *
 * Move-only; calls yyjson_mut_doc_free() on destruction.
 */
class YyJsonMutDoc {
public:
  YyJsonMutDoc() noexcept : doc_(nullptr) {}
  explicit YyJsonMutDoc(yyjson_mut_doc* doc) noexcept : doc_(doc) {}

  ~YyJsonMutDoc() noexcept;

  YyJsonMutDoc(YyJsonMutDoc&& other) noexcept : doc_(other.doc_) {
    other.doc_ = nullptr;
  }

  YyJsonMutDoc& operator=(YyJsonMutDoc&& other) noexcept {
    if (this != &other) {
      reset();
      doc_ = other.doc_;
      other.doc_ = nullptr;
    }
    return *this;
  }

  YyJsonMutDoc(const YyJsonMutDoc&) = delete;
  YyJsonMutDoc& operator=(const YyJsonMutDoc&) = delete;

  [[nodiscard]] yyjson_mut_doc* get() const noexcept {
    return doc_;
  }

  void reset(yyjson_mut_doc* doc = nullptr) noexcept;

  [[nodiscard]] explicit operator bool() const noexcept {
    return doc_ != nullptr;
  }

private:
  yyjson_mut_doc* doc_;
};

class JsonValue;

/**
 * @brief Owning handle of a parsed (immutable) yyjson document
 */
class JsonDocument {
public:
  JsonDocument();
  ~JsonDocument();

  JsonDocument(const JsonDocument&) = delete;
  JsonDocument& operator=(const JsonDocument&) = delete;
  JsonDocument(JsonDocument&& other) noexcept;
  JsonDocument& operator=(JsonDocument&& other) noexcept;

  /**
   * @brief Parse JSON text
   * @throws ParseException if the text is not valid JSON
   */
  static JsonDocument parse(kj::StringPtr str);

  /**
   * @brief Read and parse a JSON file
   * @throws ResourceException if the file cannot be read
   * @throws ParseException if the content is not valid JSON
   */
  static JsonDocument parse_file(kj::StringPtr path);

  [[nodiscard]] JsonValue root() const;

  [[nodiscard]] bool is_valid() const {
    return doc_ != nullptr;
  }

private:
  explicit JsonDocument(yyjson_doc* doc);
  yyjson_doc* doc_;
};

/**
 * @brief Non-owning read-only view of a JSON value
 *
 * Valid while the owning JsonDocument is alive. Accessors on a missing or
 * mistyped value return the supplied default.
 */
class JsonValue {
public:
  explicit JsonValue(yyjson_val* val = nullptr);

  [[nodiscard]] bool is_null() const;
  [[nodiscard]] bool is_bool() const;
  [[nodiscard]] bool is_number() const;
  [[nodiscard]] bool is_int() const;
  [[nodiscard]] bool is_real() const;
  [[nodiscard]] bool is_string() const;
  [[nodiscard]] bool is_array() const;
  [[nodiscard]] bool is_object() const;

  [[nodiscard]] bool get_bool(bool default_val = false) const;
  [[nodiscard]] int64_t get_int(int64_t default_val = 0) const;
  [[nodiscard]] double get_double(double default_val = 0.0) const;
  [[nodiscard]] kj::String get_string(kj::StringPtr default_val = ""_kj) const;

  /**
   * @brief Number of elements (array) or members (object), 0 otherwise
   */
  [[nodiscard]] size_t size() const;

  JsonValue operator[](size_t index) const;
  JsonValue operator[](kj::StringPtr key) const;

  [[nodiscard]] kj::Maybe<JsonValue> get(kj::StringPtr key) const;

  void for_each_array(kj::Function<void(const JsonValue&)> callback) const;
  void for_each_object(kj::Function<void(kj::StringPtr, const JsonValue&)> callback) const;

  [[nodiscard]] kj::Vector<kj::String> keys() const;

  [[nodiscard]] bool is_valid() const {
    return val_ != nullptr;
  }

private:
  yyjson_val* val_;
};

/**
 * @brief Fluent builder for JSON objects and arrays
 *
 * put() applies to objects, add() to arrays; calls of the wrong kind are
 * ignored.
 */
class JsonBuilder {
public:
  static JsonBuilder object();
  static JsonBuilder array();

  ~JsonBuilder();
  JsonBuilder(const JsonBuilder&) = delete;
  JsonBuilder& operator=(const JsonBuilder&) = delete;
  JsonBuilder(JsonBuilder&& other) noexcept;
  JsonBuilder& operator=(JsonBuilder&& other) noexcept;

  JsonBuilder& put(kj::StringPtr key, const char* value);
  JsonBuilder& put(kj::StringPtr key, kj::StringPtr value);
  JsonBuilder& put(kj::StringPtr key, bool value);
  JsonBuilder& put(kj::StringPtr key, int value);
  JsonBuilder& put(kj::StringPtr key, int64_t value);
  JsonBuilder& put(kj::StringPtr key, uint64_t value);
  JsonBuilder& put(kj::StringPtr key, double value);
  JsonBuilder& put(kj::StringPtr key, std::nullptr_t);

  JsonBuilder& put_object(kj::StringPtr key, kj::Function<void(JsonBuilder&)> builder);
  JsonBuilder& put_array(kj::StringPtr key, kj::Function<void(JsonBuilder&)> builder);

  JsonBuilder& add(const char* value);
  JsonBuilder& add(kj::StringPtr value);
  JsonBuilder& add(bool value);
  JsonBuilder& add(int value);
  JsonBuilder& add(int64_t value);
  JsonBuilder& add(uint64_t value);
  JsonBuilder& add(double value);

  JsonBuilder& add_object(kj::Function<void(JsonBuilder&)> builder);

  /**
   * @brief Serialize the document
   * @param pretty Indent with yyjson's pretty writer
   */
  [[nodiscard]] kj::String build(bool pretty = false) const;

private:
  enum class Type { Object, Array };
  explicit JsonBuilder(Type type);

  void attach(kj::StringPtr key, yyjson_mut_val* value);
  JsonBuilder& nest(kj::Maybe<kj::StringPtr> key, bool object,
                    kj::Function<void(JsonBuilder&)>& builder);

  struct Impl;
  kj::Own<Impl> impl_;
};

} // namespace peaktrade::core
