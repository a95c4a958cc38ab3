#pragma once

#include <cstdint>
#include <functional>
#include <memory>
#include <string>
#include <string_view>
#include <variant>
#include <vector>

namespace wardline::memory {

enum class ValueKind {
  Undefined,
  Null,
  Bool,
  Number,
  String,
  Array,
  Object,
  Date,
  Regex,
  Error,
  Unknown,
};

[[nodiscard]] std::string_view value_kind_name(ValueKind kind);

struct DateValue {
  std::int64_t epoch_ms = 0;
};

struct RegexValue {
  std::string source;
  std::string flags;
};

struct ErrorValue {
  std::string name = "Error";
  std::string message;
  std::string stack;
};

struct UnknownValue {
  std::string type_name;
};

class ArrayNode;
class ObjectNode;

/// Structured value crossing the engine boundary. Scalars are held inline;
/// arrays and objects are shared nodes, so graphs (including cycles) can be
/// expressed and node identity is the node address.
///
/// Cycles built from shared nodes keep each other alive. Callers that build
/// cyclic graphs break them with ArrayNode::clear / ObjectNode::clear.
class Value {
public:
  Value() = default;

  static Value undefined() { return Value(); }
  static Value null();
  static Value boolean(bool value);
  static Value number(double value);
  static Value string(std::string value);
  static Value array();
  static Value array(std::vector<Value> items);
  static Value object();
  static Value date(std::int64_t epoch_ms);
  static Value regex(std::string source, std::string flags = "");
  static Value error(std::string message, std::string stack = "", std::string name = "Error");
  static Value unknown(std::string type_name);

  [[nodiscard]] ValueKind kind() const;
  [[nodiscard]] bool is_composite() const;
  [[nodiscard]] bool is_string() const { return kind() == ValueKind::String; }

  [[nodiscard]] bool as_bool() const;
  [[nodiscard]] double as_number() const;
  [[nodiscard]] const std::string &as_string() const;
  [[nodiscard]] const DateValue &as_date() const;
  [[nodiscard]] const RegexValue &as_regex() const;
  [[nodiscard]] const ErrorValue &as_error() const;
  [[nodiscard]] const UnknownValue &as_unknown() const;

  [[nodiscard]] const std::shared_ptr<ArrayNode> &as_array() const;
  [[nodiscard]] const std::shared_ptr<ObjectNode> &as_object() const;

  /// Address of the shared node for arrays and objects, nullptr otherwise.
  [[nodiscard]] const void *identity() const;

private:
  struct UndefinedTag {};
  struct NullTag {};

  using Storage = std::variant<UndefinedTag, NullTag, bool, double, std::string,
                               std::shared_ptr<ArrayNode>, std::shared_ptr<ObjectNode>, DateValue,
                               RegexValue, ErrorValue, UnknownValue>;

  explicit Value(Storage storage) : storage_(std::move(storage)) {}

  Storage storage_;
};

class ArrayNode {
public:
  ArrayNode() = default;
  explicit ArrayNode(std::vector<Value> items) : items_(std::move(items)) {}

  void push_back(Value value) { items_.push_back(std::move(value)); }
  void clear() { items_.clear(); }

  [[nodiscard]] std::size_t size() const { return items_.size(); }
  [[nodiscard]] const Value &at(std::size_t index) const { return items_.at(index); }
  [[nodiscard]] const std::vector<Value> &items() const { return items_; }

private:
  std::vector<Value> items_;
};

using Accessor = std::function<Value()>;

/// Object with insertion-ordered keys. A property is either a stored value or
/// an accessor evaluated on every read; accessors may throw.
class ObjectNode {
public:
  struct Property {
    std::string key;
    Value value;
    Accessor getter;
  };

  void set(const std::string &key, Value value);
  void define_getter(const std::string &key, Accessor getter);
  bool erase(const std::string &key);
  void clear() { properties_.clear(); }

  [[nodiscard]] bool has(const std::string &key) const;
  /// Reads a property, invoking its accessor. Missing keys read as undefined.
  [[nodiscard]] Value get(const std::string &key) const;
  [[nodiscard]] std::size_t size() const { return properties_.size(); }
  [[nodiscard]] const std::vector<Property> &properties() const { return properties_; }

  /// Reads a property entry, invoking its accessor when it has one.
  [[nodiscard]] static Value read(const Property &property);

private:
  std::vector<Property> properties_;
};

} // namespace wardline::memory
