#include "peaktrade/core/config.h"

#include "peaktrade/core/json.h"

#include <kj/common.h>
#include <kj/debug.h>
#include <kj/exception.h>
#include <kj/memory.h>

namespace peaktrade::core {

namespace {

// Every element must satisfy `accept`; a mixed array is rejected, not coerced
template <typename T, typename Accept, typename Read>
kj::Array<T> json_array(kj::StringPtr key, const JsonValue& j, Accept accept, Read read) {
  auto builder = kj::heapArrayBuilder<T>(j.size());
  j.for_each_array([&](const JsonValue& val) {
    if (!accept(val)) {
      throw ConfigException(kj::str("Mixed element types in array for config key '", key, "'"));
    }
    builder.add(read(val));
  });
  return builder.finish();
}

Config::Value json_to_value(kj::StringPtr key, const JsonValue& j) {
  if (j.is_bool()) {
    return j.get_bool();
  } else if (j.is_int()) {
    return j.get_int();
  } else if (j.is_real()) {
    return j.get_double();
  } else if (j.is_string()) {
    return j.get_string();
  } else if (j.is_array()) {
    if (j.size() == 0) {
      return kj::heapArray<kj::String>(0);
    }
    auto first = j[static_cast<size_t>(0)];
    if (first.is_bool()) {
      return json_array<bool>(
          key, j, [](const JsonValue& v) { return v.is_bool(); },
          [](const JsonValue& v) { return v.get_bool(); });
    } else if (first.is_int() || first.is_real()) {
      bool all_int = true;
      j.for_each_array([&](const JsonValue& v) { all_int = all_int && v.is_int(); });
      if (all_int) {
        return json_array<int64_t>(
            key, j, [](const JsonValue& v) { return v.is_int(); },
            [](const JsonValue& v) { return v.get_int(); });
      }
      // Integers widen to double alongside reals
      return json_array<double>(
          key, j, [](const JsonValue& v) { return v.is_int() || v.is_real(); },
          [](const JsonValue& v) { return v.get_double(); });
    } else if (first.is_string()) {
      return json_array<kj::String>(
          key, j, [](const JsonValue& v) { return v.is_string(); },
          [](const JsonValue& v) { return v.get_string(); });
    }
  }
  throw ConfigException(kj::str("Unsupported JSON type for config key '", key, "'"));
}

Config::Value clone_value(const Config::Value& v) {
  KJ_SWITCH_ONEOF(v) {
    KJ_CASE_ONEOF(b, bool) {
      return b;
    }
    KJ_CASE_ONEOF(i, int64_t) {
      return i;
    }
    KJ_CASE_ONEOF(d, double) {
      return d;
    }
    KJ_CASE_ONEOF(s, kj::String) {
      return kj::str(s);
    }
    KJ_CASE_ONEOF(a, kj::Array<bool>) {
      return kj::heapArray<bool>(a.asPtr());
    }
    KJ_CASE_ONEOF(a, kj::Array<int64_t>) {
      return kj::heapArray<int64_t>(a.asPtr());
    }
    KJ_CASE_ONEOF(a, kj::Array<double>) {
      return kj::heapArray<double>(a.asPtr());
    }
    KJ_CASE_ONEOF(a, kj::Array<kj::String>) {
      auto builder = kj::heapArrayBuilder<kj::String>(a.size());
      for (const auto& item : a) {
        builder.add(kj::str(item));
      }
      return builder.finish();
    }
  }
  KJ_UNREACHABLE;
}

void load_document(kj::TreeMap<kj::String, Config::Value>& config, const JsonDocument& doc) {
  auto root = doc.root();
  if (!root.is_object()) {
    throw ConfigException("Configuration root must be a JSON object");
  }
  config.clear();
  root.for_each_object([&config](kj::StringPtr key, const JsonValue& value) {
    config.upsert(kj::str(key), json_to_value(key, value));
  });
}

} // namespace

void Config::load_from_file(kj::StringPtr file_path) {
  JsonDocument doc;
  try {
    doc = JsonDocument::parse_file(file_path);
  } catch (const PeakTradeException& e) {
    throw ConfigException(kj::str("Cannot load config '", file_path, "': ", e.message()));
  }
  load_document(config_, doc);
}

void Config::load_from_string(kj::StringPtr json_content) {
  JsonDocument doc;
  try {
    doc = JsonDocument::parse(json_content);
  } catch (const ParseException& e) {
    throw ConfigException(kj::str("Cannot parse config: ", e.message()));
  }
  load_document(config_, doc);
}

kj::String Config::to_string() const {
  auto builder = JsonBuilder::object();
  for (const auto& entry : config_) {
    kj::StringPtr key = entry.key;
    KJ_SWITCH_ONEOF(entry.value) {
      KJ_CASE_ONEOF(b, bool) {
        builder.put(key, b);
      }
      KJ_CASE_ONEOF(i, int64_t) {
        builder.put(key, i);
      }
      KJ_CASE_ONEOF(d, double) {
        builder.put(key, d);
      }
      KJ_CASE_ONEOF(s, kj::String) {
        builder.put(key, s.asPtr());
      }
      KJ_CASE_ONEOF(a, kj::Array<bool>) {
        builder.put_array(key, [&a](JsonBuilder& b) {
          for (auto item : a) {
            b.add(item);
          }
        });
      }
      KJ_CASE_ONEOF(a, kj::Array<int64_t>) {
        builder.put_array(key, [&a](JsonBuilder& b) {
          for (auto item : a) {
            b.add(item);
          }
        });
      }
      KJ_CASE_ONEOF(a, kj::Array<double>) {
        builder.put_array(key, [&a](JsonBuilder& b) {
          for (auto item : a) {
            b.add(item);
          }
        });
      }
      KJ_CASE_ONEOF(a, kj::Array<kj::String>) {
        builder.put_array(key, [&a](JsonBuilder& b) {
          for (const auto& item : a) {
            b.add(item.asPtr());
          }
        });
      }
    }
  }
  return builder.build();
}

bool Config::has_key(kj::StringPtr key) const {
  return config_.find(key) != kj::none;
}

void Config::set(kj::StringPtr key, Value value) {
  config_.upsert(kj::str(key), kj::mv(value));
}

void Config::remove(kj::StringPtr key) {
  config_.erase(key);
}

void Config::merge(const Config& other) {
  for (const auto& entry : other.config_) {
    set(entry.key, clone_value(entry.value));
  }
}

kj::Array<kj::String> Config::keys() const {
  auto builder = kj::heapArrayBuilder<kj::String>(config_.size());
  for (const auto& entry : config_) {
    builder.add(kj::str(entry.key));
  }
  return builder.finish();
}

} // namespace peaktrade::core
