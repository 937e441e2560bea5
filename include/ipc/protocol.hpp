#pragma once

#include "debugger/displayPart.hpp"
#include "debugger/variableKind.hpp"

#include <nlohmann/json.hpp>

#include <cstdint>
#include <string>
#include <utility>
#include <vector>

namespace snap {

/**
 * Line protocol between the debugger server (the process running the
 * script) and its client. Every message is one line; structured messages
 * are JSON arrays of strings.
 *
 *   server -> client   token                 handshake, echoed back
 *   server -> client   Init, payload         a breakpoint was hit
 *   client -> server   ["GetItems", handle]              -> [[handle, kind, value], ...]
 *   client -> server   ["GetProperty", handle, name, isProperty] -> [handle, kind, value]
 *   client -> server   ["Resume", suppress]  ends the hit
 *   server -> client   Abort                 the server is going away
 */
namespace protocol {

inline constexpr const char *Init = "Init";
inline constexpr const char *Abort = "Abort";
inline constexpr const char *GetItems = "GetItems";
inline constexpr const char *GetProperty = "GetProperty";
inline constexpr const char *Resume = "Resume";

inline const char *booleanText(bool value) { return value ? "True" : "False"; }

} // namespace protocol

// A value in flight: a server-side handle plus its encoded description
struct WireVariable {
  std::string handle;
  VariableKind kind{VariableKind::Null};
  std::string json{"\"\""};
};

void to_json(nlohmann::json &j, const WireVariable &variable);
void from_json(const nlohmann::json &j, WireVariable &variable);

// Everything the client needs to show one hit
struct BreakpointPayload {
  std::vector<std::pair<std::string, std::vector<DisplayPart>>> displayParts;
  std::vector<std::pair<std::string, WireVariable>> locals;
  std::string text;
  int64_t start{};
  std::string preSource;
  std::string postSource;
  std::vector<std::string> references;

  std::string encode() const;
  // Throws nlohmann::json::exception or std::invalid_argument on bad input
  static BreakpointPayload decode(const std::string &line);
};

} // namespace snap
