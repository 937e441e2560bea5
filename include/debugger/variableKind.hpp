#pragma once

#include <optional>
#include <string>

namespace snap {

// How a value is shown and expanded by a debugger front end
enum class VariableKind {
  String,
  Char,
  Number,
  Bool,
  Null,
  Enumerable,
  Enum,
  Class,
  Interface,
  Delegate,
  Other
};

std::string toString(VariableKind kind);
std::optional<VariableKind> parseVariableKind(const std::string &name);

// Kinds whose value is a member list that can be expanded
inline bool hasMembers(VariableKind kind) {
  return kind == VariableKind::Class || kind == VariableKind::Interface ||
         kind == VariableKind::Delegate || kind == VariableKind::Other;
}

} // namespace snap
