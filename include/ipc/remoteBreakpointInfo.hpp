#pragma once

#include "debugger/breakpointInfo.hpp"
#include "debugger/displayPart.hpp"
#include "debugger/variableCodec.hpp"
#include "ipc/protocol.hpp"

#include <functional>
#include <memory>
#include <string>
#include <utility>
#include <vector>

namespace snap {

class RemoteVariable;

// Round trips to the server for the values of one hit
struct RemoteAccess {
  std::function<RemoteVariable(const std::string &handle, const std::string &name, bool isProperty)>
      property;
  std::function<std::vector<RemoteVariable>(const std::string &handle)> items;
};

/**
 * @brief A value living in the server process
 *
 * Carries its decoded description; members and items are fetched on demand
 * and only while the hit that produced it is paused.
 */
class RemoteVariable {
public:
  RemoteVariable(const WireVariable &wire, std::shared_ptr<const RemoteAccess> access);
  // The Null item answered when the server is gone
  static RemoteVariable null();

  const std::string &handle() const { return id; }
  VariableKind kind() const { return variableKind; }
  const DecodedValue &value() const { return decoded; }
  std::string summary() const { return summarize(variableKind, decoded); }
  // Member list for Class, Interface, Delegate and Other; null otherwise
  const std::vector<MemberInfo> *members() const;

  RemoteVariable getProperty(const std::string &name, bool isProperty) const;
  std::vector<RemoteVariable> getItems() const;

private:
  RemoteVariable(std::string handle, VariableKind kind, DecodedValue value);

  std::string id;
  VariableKind variableKind;
  DecodedValue decoded;
  std::shared_ptr<const RemoteAccess> access;
};

// What the client sees of a hit: the span, and locals as remote values
class RemoteBreakpointInfo {
public:
  RemoteBreakpointInfo(const BreakpointPayload &payload,
                       std::shared_ptr<const RemoteAccess> access);

  const BreakpointSpan &span() const { return breakpointSpan; }
  const std::vector<std::pair<std::string, RemoteVariable>> &locals() const {
    return localVariables;
  }
  const std::vector<DisplayPart> &displayParts(const std::string &name) const;

private:
  BreakpointSpan breakpointSpan;
  std::vector<std::pair<std::string, RemoteVariable>> localVariables;
  std::vector<std::pair<std::string, std::vector<DisplayPart>>> localDisplayParts;
};

} // namespace snap
