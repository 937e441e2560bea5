#pragma once

#include "debugger/variableKind.hpp"
#include "runtime/object.hpp"
#include "runtime/value.hpp"

#include <nlohmann/json.hpp>

#include <cstdint>
#include <string>
#include <variant>
#include <vector>

namespace snap {

// Prefix of the text shown in place of a member whose read failed
inline constexpr const char *memberAccessError =
    "An error occurred while accessing this member:\n";

// Compact JSON text; bytes that are not valid UTF-8 become U+FFFD
std::string dumpJson(const nlohmann::json &json);

// A value as it crosses the process boundary: its kind plus a JSON text
struct VariableDescription {
  VariableKind kind{VariableKind::Null};
  std::string json;
};

struct EnumerableSummary {
  // Element type names joined by ", "; empty when unknown
  std::string elementTypes;
  // -1 when the enumerable does not expose a count
  int64_t count{-1};
};

struct EnumSummary {
  std::string typeName;
  std::string name;
};

// Text for String, Char, Number, Bool and Null; member list for objects
using DecodedValue =
    std::variant<std::string, EnumerableSummary, EnumSummary, std::vector<MemberInfo>>;

// Classify and encode a value without reading any member values
VariableDescription describe(const Value &value);

// Inverse of describe(); throws nlohmann::json::exception on malformed text
DecodedValue decode(VariableKind kind, const std::string &json);

// "true"/"false" in any letter case
bool parseBoolean(const std::string &text);

// One-line rendering of a decoded value, e.g. "List<int> (3)" or "Color.Red"
std::string summarize(VariableKind kind, const DecodedValue &value);

} // namespace snap
