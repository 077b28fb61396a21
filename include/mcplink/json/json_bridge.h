#pragma once

#include <cstdint>
#include <memory>
#include <stdexcept>
#include <string>
#include <vector>

namespace mcplink {
namespace json {

class JsonValueImpl;

enum class JsonType { Null, Boolean, Integer, Float, String, Array, Object };

class JsonException : public std::runtime_error {
 public:
  explicit JsonException(const std::string& msg) : std::runtime_error(msg) {}
};

/**
 * Opaque JSON value used for message payloads and tool results.
 *
 * Values have copy semantics. Object keys keep their insertion order so
 * serialized messages come out in the order they were built.
 */
class JsonValue {
 public:
  JsonValue();  // null
  JsonValue(std::nullptr_t);
  JsonValue(bool value);
  JsonValue(int value);
  JsonValue(int64_t value);
  JsonValue(double value);
  JsonValue(const std::string& value);
  JsonValue(const char* value);

  JsonValue(const JsonValue& other);
  JsonValue(JsonValue&& other) noexcept;
  JsonValue& operator=(const JsonValue& other);
  JsonValue& operator=(JsonValue&& other) noexcept;
  ~JsonValue();

  JsonType type() const;
  bool isNull() const;
  bool isBoolean() const;
  bool isInteger() const;
  bool isFloat() const;
  bool isNumber() const;
  bool isString() const;
  bool isArray() const;
  bool isObject() const;

  // Throw JsonException on type mismatch
  bool getBool() const;
  int getInt() const;
  int64_t getInt64() const;
  double getFloat() const;
  std::string getString() const;

  // Return the default on type mismatch
  bool getBool(bool default_value) const;
  int64_t getInt64(int64_t default_value) const;
  double getFloat(double default_value) const;
  std::string getString(const std::string& default_value) const;

  size_t size() const;
  bool empty() const;

  // Array access
  JsonValue at(size_t index) const;
  void push_back(const JsonValue& value);

  // Object access
  bool contains(const std::string& key) const;
  JsonValue get(const std::string& key) const;
  void set(const std::string& key, const JsonValue& value);
  void erase(const std::string& key);
  std::vector<std::string> keys() const;

  // Truthiness as a dynamic language sees it: null, false, 0, "" are false
  bool truthy() const;

  std::string toString(bool pretty = false) const;

  bool operator==(const JsonValue& other) const;
  bool operator!=(const JsonValue& other) const { return !(*this == other); }

  static JsonValue null();
  static JsonValue array();
  static JsonValue object();
  // Throws JsonException on malformed input
  static JsonValue parse(const std::string& text);

  friend class JsonValueImpl;

 private:
  std::unique_ptr<JsonValueImpl> impl_;
};

class JsonObjectBuilder {
 public:
  JsonObjectBuilder() : value_(JsonValue::object()) {}

  JsonObjectBuilder& add(const std::string& key, const JsonValue& val) {
    value_.set(key, val);
    return *this;
  }

  JsonValue build() const { return value_; }

 private:
  JsonValue value_;
};

class JsonArrayBuilder {
 public:
  JsonArrayBuilder() : value_(JsonValue::array()) {}

  JsonArrayBuilder& add(const JsonValue& val) {
    value_.push_back(val);
    return *this;
  }

  JsonValue build() const { return value_; }

 private:
  JsonValue value_;
};

}  // namespace json
}  // namespace mcplink
