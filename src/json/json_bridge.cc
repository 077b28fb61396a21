#include "mcplink/json/json_bridge.h"

#include <nlohmann/json.hpp>

namespace mcplink {
namespace json {

using Json = nlohmann::ordered_json;

class JsonValueImpl {
 public:
  Json json_;

  JsonValueImpl() : json_(nullptr) {}
  explicit JsonValueImpl(const Json& j) : json_(j) {}
  explicit JsonValueImpl(Json&& j) : json_(std::move(j)) {}

  static JsonValue wrap(Json j) {
    JsonValue value;
    value.impl_->json_ = std::move(j);
    return value;
  }

  // A moved-from JsonValue has no impl and reads as null
  static const Json& node(const JsonValue& value) {
    static const Json kNull = nullptr;
    return value.impl_ ? value.impl_->json_ : kNull;
  }

  static Json& mutableNode(JsonValue& value) {
    if (!value.impl_) {
      value.impl_ = std::make_unique<JsonValueImpl>();
    }
    return value.impl_->json_;
  }
};

namespace {

using Impl = JsonValueImpl;

}  // namespace

JsonValue::JsonValue() : impl_(std::make_unique<JsonValueImpl>()) {}

JsonValue::JsonValue(std::nullptr_t)
    : impl_(std::make_unique<JsonValueImpl>()) {}

JsonValue::JsonValue(bool value)
    : impl_(std::make_unique<JsonValueImpl>(Json(value))) {}

JsonValue::JsonValue(int value)
    : impl_(std::make_unique<JsonValueImpl>(Json(value))) {}

JsonValue::JsonValue(int64_t value)
    : impl_(std::make_unique<JsonValueImpl>(Json(value))) {}

JsonValue::JsonValue(double value)
    : impl_(std::make_unique<JsonValueImpl>(Json(value))) {}

JsonValue::JsonValue(const std::string& value)
    : impl_(std::make_unique<JsonValueImpl>(Json(value))) {}

JsonValue::JsonValue(const char* value)
    : impl_(std::make_unique<JsonValueImpl>(
          value ? Json(std::string(value)) : Json(nullptr))) {}

JsonValue::JsonValue(const JsonValue& other)
    : impl_(std::make_unique<JsonValueImpl>(Impl::node(other))) {}

JsonValue::JsonValue(JsonValue&& other) noexcept = default;

JsonValue& JsonValue::operator=(const JsonValue& other) {
  if (this != &other) {
    Impl::mutableNode(*this) = Impl::node(other);
  }
  return *this;
}

JsonValue& JsonValue::operator=(JsonValue&& other) noexcept = default;

JsonValue::~JsonValue() = default;

JsonType JsonValue::type() const {
  const Json& j = Impl::node(*this);
  if (j.is_boolean())
    return JsonType::Boolean;
  if (j.is_number_integer())
    return JsonType::Integer;
  if (j.is_number_float())
    return JsonType::Float;
  if (j.is_string())
    return JsonType::String;
  if (j.is_array())
    return JsonType::Array;
  if (j.is_object())
    return JsonType::Object;
  return JsonType::Null;
}

bool JsonValue::isNull() const { return Impl::node(*this).is_null(); }
bool JsonValue::isBoolean() const { return Impl::node(*this).is_boolean(); }
bool JsonValue::isInteger() const {
  return Impl::node(*this).is_number_integer();
}
bool JsonValue::isFloat() const { return Impl::node(*this).is_number_float(); }
bool JsonValue::isNumber() const { return Impl::node(*this).is_number(); }
bool JsonValue::isString() const { return Impl::node(*this).is_string(); }
bool JsonValue::isArray() const { return Impl::node(*this).is_array(); }
bool JsonValue::isObject() const { return Impl::node(*this).is_object(); }

bool JsonValue::getBool() const {
  if (!isBoolean()) {
    throw JsonException("Value is not a boolean");
  }
  return Impl::node(*this).get<bool>();
}

int JsonValue::getInt() const {
  if (!isNumber()) {
    throw JsonException("Value is not a number");
  }
  return Impl::node(*this).get<int>();
}

int64_t JsonValue::getInt64() const {
  if (!isNumber()) {
    throw JsonException("Value is not a number");
  }
  return Impl::node(*this).get<int64_t>();
}

double JsonValue::getFloat() const {
  if (!isNumber()) {
    throw JsonException("Value is not a number");
  }
  return Impl::node(*this).get<double>();
}

std::string JsonValue::getString() const {
  if (!isString()) {
    throw JsonException("Value is not a string");
  }
  return Impl::node(*this).get<std::string>();
}

bool JsonValue::getBool(bool default_value) const {
  return isBoolean() ? Impl::node(*this).get<bool>() : default_value;
}

int64_t JsonValue::getInt64(int64_t default_value) const {
  return isNumber() ? Impl::node(*this).get<int64_t>() : default_value;
}

double JsonValue::getFloat(double default_value) const {
  return isNumber() ? Impl::node(*this).get<double>() : default_value;
}

std::string JsonValue::getString(const std::string& default_value) const {
  return isString() ? Impl::node(*this).get<std::string>() : default_value;
}

size_t JsonValue::size() const {
  const Json& j = Impl::node(*this);
  if (!j.is_array() && !j.is_object()) {
    throw JsonException("Value is not an array or object");
  }
  return j.size();
}

bool JsonValue::empty() const {
  const Json& j = Impl::node(*this);
  if (j.is_null())
    return true;
  if (j.is_string())
    return j.get_ref<const std::string&>().empty();
  if (j.is_array() || j.is_object())
    return j.empty();
  return false;
}

JsonValue JsonValue::at(size_t index) const {
  const Json& j = Impl::node(*this);
  if (!j.is_array()) {
    throw JsonException("Value is not an array");
  }
  if (index >= j.size()) {
    throw JsonException("Array index out of range: " + std::to_string(index));
  }
  return Impl::wrap(j[index]);
}

void JsonValue::push_back(const JsonValue& value) {
  Json& j = Impl::mutableNode(*this);
  if (j.is_null()) {
    j = Json::array();
  }
  if (!j.is_array()) {
    throw JsonException("Value is not an array");
  }
  j.push_back(Impl::node(value));
}

bool JsonValue::contains(const std::string& key) const {
  const Json& j = Impl::node(*this);
  return j.is_object() && j.contains(key);
}

JsonValue JsonValue::get(const std::string& key) const {
  const Json& j = Impl::node(*this);
  if (!j.is_object()) {
    throw JsonException("Value is not an object");
  }
  auto it = j.find(key);
  if (it == j.end()) {
    throw JsonException("Key not found: " + key);
  }
  return Impl::wrap(*it);
}

void JsonValue::set(const std::string& key, const JsonValue& value) {
  Json& j = Impl::mutableNode(*this);
  if (j.is_null()) {
    j = Json::object();
  }
  if (!j.is_object()) {
    throw JsonException("Value is not an object");
  }
  j[key] = Impl::node(value);
}

void JsonValue::erase(const std::string& key) {
  Json& j = Impl::mutableNode(*this);
  if (!j.is_object()) {
    throw JsonException("Value is not an object");
  }
  j.erase(key);
}

std::vector<std::string> JsonValue::keys() const {
  const Json& j = Impl::node(*this);
  if (!j.is_object()) {
    throw JsonException("Value is not an object");
  }
  std::vector<std::string> result;
  result.reserve(j.size());
  for (auto it = j.begin(); it != j.end(); ++it) {
    result.push_back(it.key());
  }
  return result;
}

bool JsonValue::truthy() const {
  const Json& j = Impl::node(*this);
  switch (j.type()) {
    case Json::value_t::null:
    case Json::value_t::discarded:
      return false;
    case Json::value_t::boolean:
      return j.get<bool>();
    case Json::value_t::number_integer:
    case Json::value_t::number_unsigned:
    case Json::value_t::number_float:
      return j.get<double>() != 0.0;
    case Json::value_t::string:
      return !j.get_ref<const std::string&>().empty();
    default:
      return true;
  }
}

std::string JsonValue::toString(bool pretty) const {
  // Replace invalid UTF-8 instead of throwing on output
  return Impl::node(*this).dump(pretty ? 2 : -1, ' ', false,
                                Json::error_handler_t::replace);
}

bool JsonValue::operator==(const JsonValue& other) const {
  return Impl::node(*this) == Impl::node(other);
}

JsonValue JsonValue::null() { return JsonValue(); }

JsonValue JsonValue::array() { return Impl::wrap(Json::array()); }

JsonValue JsonValue::object() { return Impl::wrap(Json::object()); }

JsonValue JsonValue::parse(const std::string& text) {
  try {
    return Impl::wrap(Json::parse(text));
  } catch (const Json::parse_error& e) {
    throw JsonException(std::string("JSON parse error: ") + e.what());
  }
}

}  // namespace json
}  // namespace mcplink
