#pragma once

#include <cstdint>
#include <memory>
#include <string>
#include <variant>

namespace snap {

class Object;
using ObjectRef = std::shared_ptr<Object>;

struct EnumValue {
  std::string typeName;
  std::string name;
  int64_t ordinal{};

  bool operator==(const EnumValue &other) const {
    return typeName == other.typeName && ordinal == other.ordinal;
  }
};

/**
 * @brief A SnapScript value
 *
 * Closed tagged union; objects are shared references whose reflection
 * surface is described by Object.
 */
class Value {
public:
  enum class Type { Null, Bool, Int, Double, Char, String, Enum, Object };

  Value() = default;
  Value(bool value) : data(value) {}
  Value(int value) : data(static_cast<int64_t>(value)) {}
  Value(int64_t value) : data(value) {}
  Value(double value) : data(value) {}
  Value(char value) : data(value) {}
  Value(const char *value) : data(std::string(value)) {}
  Value(std::string value) : data(std::move(value)) {}
  Value(EnumValue value) : data(std::move(value)) {}
  template <typename T> Value(std::shared_ptr<T> value) {
    if (value) {
      data = ObjectRef(std::move(value));
    }
  }

  Type type() const { return static_cast<Type>(data.index()); }

  bool isNull() const { return type() == Type::Null; }
  bool isBool() const { return type() == Type::Bool; }
  bool isInt() const { return type() == Type::Int; }
  bool isDouble() const { return type() == Type::Double; }
  bool isNumber() const { return isInt() || isDouble(); }
  bool isChar() const { return type() == Type::Char; }
  bool isString() const { return type() == Type::String; }
  bool isEnum() const { return type() == Type::Enum; }
  bool isObject() const { return type() == Type::Object; }

  // Accessors throw ScriptError on a type mismatch
  bool asBool() const;
  int64_t asInt() const;
  double asDouble() const;
  char asChar() const;
  const std::string &asString() const;
  const EnumValue &asEnum() const;
  const ObjectRef &asObject() const;

  // Object cast helper; nullptr when the value is not a T
  template <typename T> std::shared_ptr<T> objectAs() const {
    if (!isObject()) {
      return nullptr;
    }
    return std::dynamic_pointer_cast<T>(std::get<ObjectRef>(data));
  }

  bool truthy() const;

  // Name of the runtime type, e.g. "int", "string", "List"
  std::string typeName() const;

  // Text used by print/str
  std::string toString() const;

  bool equals(const Value &other) const;

private:
  std::variant<std::monostate, bool, int64_t, double, char, std::string,
               EnumValue, ObjectRef>
      data;
};

// Invariant-culture number text: integers in decimal, doubles in shortest
// round-trip form
std::string formatNumber(double value);

} // namespace snap
