#include "peaktrade/core/json.h"

#include "peaktrade/core/error.h"

#include <cmath>
#include <cstdlib>
#include <fstream>
#include <kj/common.h>
#include <kj/debug.h>
#include <kj/memory.h>
#include <kj/string.h>
#include <yyjson.h>

namespace peaktrade::core {

// ============================================================================
// YyJsonMutDoc Implementation
// ============================================================================

YyJsonMutDoc::~YyJsonMutDoc() noexcept {
  if (doc_) {
    yyjson_mut_doc_free(doc_);
  }
}

void YyJsonMutDoc::reset(yyjson_mut_doc* doc) noexcept {
  if (doc_) {
    yyjson_mut_doc_free(doc_);
  }
  doc_ = doc;
}

// ============================================================================
// JsonDocument Implementation
// ============================================================================

JsonDocument::JsonDocument() : doc_(nullptr) {}

JsonDocument::JsonDocument(yyjson_doc* doc) : doc_(doc) {}

JsonDocument::~JsonDocument() {
  if (doc_) {
    yyjson_doc_free(doc_);
  }
}

JsonDocument::JsonDocument(JsonDocument&& other) noexcept : doc_(other.doc_) {
  other.doc_ = nullptr;
}

JsonDocument& JsonDocument::operator=(JsonDocument&& other) noexcept {
  if (this != &other) {
    if (doc_) {
      yyjson_doc_free(doc_);
    }
    doc_ = other.doc_;
    other.doc_ = nullptr;
  }
  return *this;
}

JsonDocument JsonDocument::parse(kj::StringPtr str) {
  yyjson_read_err err;
  yyjson_doc* doc = yyjson_read_opts(const_cast<char*>(str.cStr()), str.size(), 0, nullptr, &err);
  if (!doc) {
    throw ParseException(kj::str("JSON parse error at byte ", err.pos, ": ",
                                 err.msg ? err.msg : "unknown error"));
  }
  return JsonDocument(doc);
}

JsonDocument JsonDocument::parse_file(kj::StringPtr path_str) {
  std::ifstream file(path_str.cStr(), std::ios::binary | std::ios::ate);
  if (!file.is_open()) {
    throw ResourceException(kj::str("Failed to open file: ", path_str));
  }

  std::streamsize size = file.tellg();
  if (size < 0) {
    throw ResourceException(kj::str("Failed to get file size: ", path_str));
  }
  file.seekg(0, std::ios::beg);

  // One extra byte for the NUL terminator kj::StringPtr requires
  auto buf = kj::heapArray<char>(static_cast<size_t>(size) + 1);
  file.read(buf.begin(), size);
  if (!file.good() && !file.eof()) {
    throw ResourceException(kj::str("Failed to read file: ", path_str));
  }
  buf[static_cast<size_t>(size)] = '\0';

  return parse(kj::StringPtr(buf.begin(), static_cast<size_t>(size)));
}

JsonValue JsonDocument::root() const {
  if (!doc_) {
    return JsonValue(nullptr);
  }
  return JsonValue(yyjson_doc_get_root(doc_));
}

// ============================================================================
// JsonValue Implementation
// ============================================================================

JsonValue::JsonValue(yyjson_val* val) : val_(val) {}

bool JsonValue::is_null() const {
  return val_ && yyjson_is_null(val_);
}

bool JsonValue::is_bool() const {
  return val_ && yyjson_is_bool(val_);
}

bool JsonValue::is_number() const {
  return val_ && yyjson_is_num(val_);
}

bool JsonValue::is_int() const {
  return val_ && yyjson_is_int(val_);
}

bool JsonValue::is_real() const {
  return val_ && yyjson_is_real(val_);
}

bool JsonValue::is_string() const {
  return val_ && yyjson_is_str(val_);
}

bool JsonValue::is_array() const {
  return val_ && yyjson_is_arr(val_);
}

bool JsonValue::is_object() const {
  return val_ && yyjson_is_obj(val_);
}

bool JsonValue::get_bool(bool default_val) const {
  if (!is_bool()) {
    return default_val;
  }
  return yyjson_get_bool(val_);
}

int64_t JsonValue::get_int(int64_t default_val) const {
  if (val_ == nullptr) {
    return default_val;
  }
  if (yyjson_is_sint(val_)) {
    return yyjson_get_sint(val_);
  }
  if (yyjson_is_uint(val_)) {
    return static_cast<int64_t>(yyjson_get_uint(val_));
  }
  if (yyjson_is_real(val_)) {
    return static_cast<int64_t>(yyjson_get_real(val_));
  }
  return default_val;
}

double JsonValue::get_double(double default_val) const {
  if (is_real()) {
    return yyjson_get_real(val_);
  }
  if (yyjson_is_sint(val_)) {
    return static_cast<double>(yyjson_get_sint(val_));
  }
  if (yyjson_is_uint(val_)) {
    return static_cast<double>(yyjson_get_uint(val_));
  }
  return default_val;
}

kj::String JsonValue::get_string(kj::StringPtr default_val) const {
  if (!is_string()) {
    return kj::str(default_val);
  }
  const char* str = yyjson_get_str(val_);
  if (str == nullptr) {
    return kj::str(default_val);
  }
  return kj::heapString(str, yyjson_get_len(val_));
}

size_t JsonValue::size() const {
  if (is_array()) {
    return yyjson_arr_size(val_);
  }
  if (is_object()) {
    return yyjson_obj_size(val_);
  }
  return 0;
}

JsonValue JsonValue::operator[](size_t index) const {
  if (!is_array()) {
    return JsonValue(nullptr);
  }
  return JsonValue(yyjson_arr_get(val_, index));
}

JsonValue JsonValue::operator[](kj::StringPtr key) const {
  if (!is_object()) {
    return JsonValue(nullptr);
  }
  return JsonValue(yyjson_obj_getn(val_, key.cStr(), key.size()));
}

kj::Maybe<JsonValue> JsonValue::get(kj::StringPtr key) const {
  auto child = (*this)[key];
  if (!child.is_valid()) {
    return kj::none;
  }
  return child;
}

void JsonValue::for_each_array(kj::Function<void(const JsonValue&)> callback) const {
  if (!is_array()) {
    return;
  }
  size_t idx, max;
  yyjson_val* item;
  yyjson_arr_foreach(val_, idx, max, item) {
    callback(JsonValue(item));
  }
}

void JsonValue::for_each_object(
    kj::Function<void(kj::StringPtr, const JsonValue&)> callback) const {
  if (!is_object()) {
    return;
  }
  size_t idx, max;
  yyjson_val* key;
  yyjson_val* val;
  yyjson_obj_foreach(val_, idx, max, key, val) {
    callback(kj::StringPtr(yyjson_get_str(key), yyjson_get_len(key)), JsonValue(val));
  }
}

kj::Vector<kj::String> JsonValue::keys() const {
  kj::Vector<kj::String> result;
  for_each_object([&result](kj::StringPtr key, const JsonValue&) { result.add(kj::str(key)); });
  return result;
}

// ============================================================================
// JsonBuilder Implementation
// ============================================================================

struct JsonBuilder::Impl {
  YyJsonMutDoc doc;
  yyjson_mut_val* root{nullptr};
  yyjson_mut_val* current{nullptr};
  bool is_object{true};
};

JsonBuilder::JsonBuilder(Type type) : impl_(kj::heap<Impl>()) {
  impl_->is_object = (type == Type::Object);
  impl_->doc.reset(yyjson_mut_doc_new(nullptr));
  impl_->root = impl_->is_object ? yyjson_mut_obj(impl_->doc.get())
                                 : yyjson_mut_arr(impl_->doc.get());
  impl_->current = impl_->root;
}

JsonBuilder::~JsonBuilder() = default;

JsonBuilder::JsonBuilder(JsonBuilder&& other) noexcept : impl_(kj::mv(other.impl_)) {}

JsonBuilder& JsonBuilder::operator=(JsonBuilder&& other) noexcept {
  if (this != &other) {
    impl_ = kj::mv(other.impl_);
  }
  return *this;
}

JsonBuilder JsonBuilder::object() {
  return JsonBuilder(Type::Object);
}

JsonBuilder JsonBuilder::array() {
  return JsonBuilder(Type::Array);
}

void JsonBuilder::attach(kj::StringPtr key, yyjson_mut_val* value) {
  if (!impl_->is_object || value == nullptr) {
    return;
  }
  yyjson_mut_val* key_val = yyjson_mut_strncpy(impl_->doc.get(), key.cStr(), key.size());
  if (key_val) {
    yyjson_mut_obj_add(impl_->current, key_val, value);
  }
}

JsonBuilder& JsonBuilder::put(kj::StringPtr key, const char* value) {
  return put(key, kj::StringPtr(value));
}

JsonBuilder& JsonBuilder::put(kj::StringPtr key, kj::StringPtr value) {
  attach(key, yyjson_mut_strncpy(impl_->doc.get(), value.cStr(), value.size()));
  return *this;
}

JsonBuilder& JsonBuilder::put(kj::StringPtr key, bool value) {
  attach(key, yyjson_mut_bool(impl_->doc.get(), value));
  return *this;
}

JsonBuilder& JsonBuilder::put(kj::StringPtr key, int value) {
  attach(key, yyjson_mut_sint(impl_->doc.get(), value));
  return *this;
}

JsonBuilder& JsonBuilder::put(kj::StringPtr key, int64_t value) {
  attach(key, yyjson_mut_sint(impl_->doc.get(), value));
  return *this;
}

JsonBuilder& JsonBuilder::put(kj::StringPtr key, uint64_t value) {
  attach(key, yyjson_mut_uint(impl_->doc.get(), value));
  return *this;
}

// Non-finite reals are written as null; yyjson rejects NaN and Inf by default
JsonBuilder& JsonBuilder::put(kj::StringPtr key, double value) {
  attach(key, std::isfinite(value) ? yyjson_mut_real(impl_->doc.get(), value)
                                   : yyjson_mut_null(impl_->doc.get()));
  return *this;
}

JsonBuilder& JsonBuilder::put(kj::StringPtr key, std::nullptr_t) {
  attach(key, yyjson_mut_null(impl_->doc.get()));
  return *this;
}

JsonBuilder& JsonBuilder::nest(kj::Maybe<kj::StringPtr> key, bool object,
                               kj::Function<void(JsonBuilder&)>& builder) {
  yyjson_mut_val* nested =
      object ? yyjson_mut_obj(impl_->doc.get()) : yyjson_mut_arr(impl_->doc.get());
  yyjson_mut_val* saved_current = impl_->current;
  bool saved_is_object = impl_->is_object;

  impl_->current = nested;
  impl_->is_object = object;
  builder(*this);
  impl_->current = saved_current;
  impl_->is_object = saved_is_object;

  KJ_IF_SOME(k, key) {
    attach(k, nested);
  }
  else if (!impl_->is_object) {
    yyjson_mut_arr_append(impl_->current, nested);
  }
  return *this;
}

JsonBuilder& JsonBuilder::put_object(kj::StringPtr key, kj::Function<void(JsonBuilder&)> builder) {
  if (!impl_->is_object) {
    return *this;
  }
  return nest(key, true, builder);
}

JsonBuilder& JsonBuilder::put_array(kj::StringPtr key, kj::Function<void(JsonBuilder&)> builder) {
  if (!impl_->is_object) {
    return *this;
  }
  return nest(key, false, builder);
}

JsonBuilder& JsonBuilder::add(const char* value) {
  return add(kj::StringPtr(value));
}

JsonBuilder& JsonBuilder::add(kj::StringPtr value) {
  if (!impl_->is_object) {
    yyjson_mut_arr_add_strncpy(impl_->doc.get(), impl_->current, value.cStr(), value.size());
  }
  return *this;
}

JsonBuilder& JsonBuilder::add(bool value) {
  if (!impl_->is_object) {
    yyjson_mut_arr_add_bool(impl_->doc.get(), impl_->current, value);
  }
  return *this;
}

JsonBuilder& JsonBuilder::add(int value) {
  return add(static_cast<int64_t>(value));
}

JsonBuilder& JsonBuilder::add(int64_t value) {
  if (!impl_->is_object) {
    yyjson_mut_arr_add_sint(impl_->doc.get(), impl_->current, value);
  }
  return *this;
}

JsonBuilder& JsonBuilder::add(uint64_t value) {
  if (!impl_->is_object) {
    yyjson_mut_arr_add_uint(impl_->doc.get(), impl_->current, value);
  }
  return *this;
}

JsonBuilder& JsonBuilder::add(double value) {
  if (!impl_->is_object) {
    if (std::isfinite(value)) {
      yyjson_mut_arr_add_real(impl_->doc.get(), impl_->current, value);
    } else {
      yyjson_mut_arr_add_null(impl_->doc.get(), impl_->current);
    }
  }
  return *this;
}

JsonBuilder& JsonBuilder::add_object(kj::Function<void(JsonBuilder&)> builder) {
  if (impl_->is_object) {
    return *this;
  }
  return nest(kj::none, true, builder);
}

kj::String JsonBuilder::build(bool pretty) const {
  if (!impl_->doc || impl_->root == nullptr) {
    return kj::str("");
  }
  yyjson_mut_doc_set_root(impl_->doc.get(), impl_->root);
  size_t len = 0;
  yyjson_write_flag flags = pretty ? YYJSON_WRITE_PRETTY : 0;
  yyjson_write_err err;
  char* json = yyjson_mut_write_opts(impl_->doc.get(), flags, nullptr, &len, &err);
  if (json == nullptr) {
    return kj::str("");
  }
  kj::String result = kj::heapString(json, len);
  std::free(json);
  return result;
}

} // namespace peaktrade::core
