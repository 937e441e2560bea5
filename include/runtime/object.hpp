#pragma once

#include "runtime/value.hpp"

#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace snap {

enum class ObjectKind { Class, Interface, Delegate, Other };

// An instance field or property as seen by reflection
struct MemberInfo {
  std::string name;
  bool isProperty{};
  bool isNonPublic{};
};

/**
 * @brief Reflection surface of every heap value
 *
 * Script instances, lists, functions and tasks implement it, and host types
 * reach it through ClassBinding. The debugger only ever talks to this
 * interface.
 */
class Object : public std::enable_shared_from_this<Object> {
public:
  virtual ~Object() = default;

  virtual std::string typeName() const = 0;
  virtual ObjectKind kind() const { return ObjectKind::Class; }

  // Instance fields and properties, in declaration order
  virtual std::vector<MemberInfo> members() const { return {}; }

  // Read a field (isProperty false) or property; throws ScriptError when the
  // member does not exist or its getter fails
  virtual Value getMember(const std::string &name, bool isProperty) const;

  // Assign a field; throws ScriptError when not supported
  virtual void setMember(const std::string &name, const Value &value);

  // Enumerable facet
  virtual bool isEnumerable() const { return false; }
  virtual std::vector<Value> items() const { return {}; }
  // Number of items when the object exposes one
  virtual std::optional<size_t> count() const { return std::nullopt; }
  // Distinct type names of the items, in order of first appearance
  virtual std::vector<std::string> elementTypeNames() const;

  virtual std::string toString() const { return typeName(); }
};

} // namespace snap
