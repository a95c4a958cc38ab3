#include "wardline/memory/value.hpp"

#include <algorithm>
#include <stdexcept>

namespace wardline::memory {

std::string_view value_kind_name(const ValueKind kind) {
  switch (kind) {
  case ValueKind::Undefined:
    return "undefined";
  case ValueKind::Null:
    return "null";
  case ValueKind::Bool:
    return "boolean";
  case ValueKind::Number:
    return "number";
  case ValueKind::String:
    return "string";
  case ValueKind::Array:
    return "array";
  case ValueKind::Object:
    return "object";
  case ValueKind::Date:
    return "date";
  case ValueKind::Regex:
    return "regexp";
  case ValueKind::Error:
    return "error";
  case ValueKind::Unknown:
    return "unknown";
  }
  return "unknown";
}

Value Value::null() { return Value(Storage{NullTag{}}); }
Value Value::boolean(const bool value) { return Value(Storage{value}); }
Value Value::number(const double value) { return Value(Storage{value}); }
Value Value::string(std::string value) { return Value(Storage{std::move(value)}); }
Value Value::array() { return Value(Storage{std::make_shared<ArrayNode>()}); }

Value Value::array(std::vector<Value> items) {
  return Value(Storage{std::make_shared<ArrayNode>(std::move(items))});
}

Value Value::object() { return Value(Storage{std::make_shared<ObjectNode>()}); }
Value Value::date(const std::int64_t epoch_ms) { return Value(Storage{DateValue{epoch_ms}}); }

Value Value::regex(std::string source, std::string flags) {
  return Value(Storage{RegexValue{std::move(source), std::move(flags)}});
}

Value Value::error(std::string message, std::string stack, std::string name) {
  return Value(Storage{ErrorValue{std::move(name), std::move(message), std::move(stack)}});
}

Value Value::unknown(std::string type_name) {
  return Value(Storage{UnknownValue{std::move(type_name)}});
}

ValueKind Value::kind() const {
  switch (storage_.index()) {
  case 0:
    return ValueKind::Undefined;
  case 1:
    return ValueKind::Null;
  case 2:
    return ValueKind::Bool;
  case 3:
    return ValueKind::Number;
  case 4:
    return ValueKind::String;
  case 5:
    return ValueKind::Array;
  case 6:
    return ValueKind::Object;
  case 7:
    return ValueKind::Date;
  case 8:
    return ValueKind::Regex;
  case 9:
    return ValueKind::Error;
  default:
    return ValueKind::Unknown;
  }
}

bool Value::is_composite() const {
  const ValueKind k = kind();
  return k == ValueKind::Array || k == ValueKind::Object;
}

bool Value::as_bool() const { return std::get<bool>(storage_); }
double Value::as_number() const { return std::get<double>(storage_); }
const std::string &Value::as_string() const { return std::get<std::string>(storage_); }
const DateValue &Value::as_date() const { return std::get<DateValue>(storage_); }
const RegexValue &Value::as_regex() const { return std::get<RegexValue>(storage_); }
const ErrorValue &Value::as_error() const { return std::get<ErrorValue>(storage_); }
const UnknownValue &Value::as_unknown() const { return std::get<UnknownValue>(storage_); }

const std::shared_ptr<ArrayNode> &Value::as_array() const {
  return std::get<std::shared_ptr<ArrayNode>>(storage_);
}

const std::shared_ptr<ObjectNode> &Value::as_object() const {
  return std::get<std::shared_ptr<ObjectNode>>(storage_);
}

const void *Value::identity() const {
  if (const auto *array = std::get_if<std::shared_ptr<ArrayNode>>(&storage_)) {
    return array->get();
  }
  if (const auto *object = std::get_if<std::shared_ptr<ObjectNode>>(&storage_)) {
    return object->get();
  }
  return nullptr;
}

void ObjectNode::set(const std::string &key, Value value) {
  for (auto &property : properties_) {
    if (property.key == key) {
      property.value = std::move(value);
      property.getter = nullptr;
      return;
    }
  }
  properties_.push_back(Property{.key = key, .value = std::move(value), .getter = nullptr});
}

void ObjectNode::define_getter(const std::string &key, Accessor getter) {
  for (auto &property : properties_) {
    if (property.key == key) {
      property.value = Value();
      property.getter = std::move(getter);
      return;
    }
  }
  properties_.push_back(Property{.key = key, .value = Value(), .getter = std::move(getter)});
}

bool ObjectNode::erase(const std::string &key) {
  const auto it = std::find_if(properties_.begin(), properties_.end(),
                               [&key](const Property &property) { return property.key == key; });
  if (it == properties_.end()) {
    return false;
  }
  properties_.erase(it);
  return true;
}

bool ObjectNode::has(const std::string &key) const {
  return std::any_of(properties_.begin(), properties_.end(),
                     [&key](const Property &property) { return property.key == key; });
}

Value ObjectNode::get(const std::string &key) const {
  for (const auto &property : properties_) {
    if (property.key == key) {
      return read(property);
    }
  }
  return Value();
}

Value ObjectNode::read(const Property &property) {
  if (property.getter) {
    return property.getter();
  }
  return property.value;
}

} // namespace wardline::memory
