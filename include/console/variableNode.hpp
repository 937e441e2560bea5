#pragma once

#include "debugger/breakpointInfo.hpp"
#include "debugger/variableCodec.hpp"
#include "ipc/remoteBreakpointInfo.hpp"
#include "runtime/value.hpp"

#include <memory>
#include <string>
#include <vector>

namespace snap {

/**
 * @brief One row of the variable tree shown at a breakpoint
 *
 * Children (members or items) are loaded on first use and cached.
 */
class VariableNode {
public:
  VariableNode(std::string name, std::string label, bool nonPublic)
      : nodeName(std::move(name)), nodeLabel(std::move(label)), nonPublic(nonPublic) {}
  virtual ~VariableNode() = default;

  // Path segment: local or member name, "[i]" for items
  const std::string &name() const { return nodeName; }
  // What is printed in front of the value, e.g. "var count"
  const std::string &label() const { return nodeLabel; }
  bool isNonPublic() const { return nonPublic; }

  virtual VariableKind kind() const = 0;
  virtual std::string summary() const = 0;
  bool isExpandable() const {
    return kind() == VariableKind::Enumerable || hasMembers(kind());
  }

  const std::vector<std::shared_ptr<VariableNode>> &children();
  std::shared_ptr<VariableNode> child(const std::string &name);

protected:
  virtual std::vector<std::shared_ptr<VariableNode>> loadChildren() = 0;

private:
  std::string nodeName;
  std::string nodeLabel;
  bool nonPublic;
  bool loaded{};
  std::vector<std::shared_ptr<VariableNode>> cached;
};

// A value in this process
class LocalVariableNode : public VariableNode {
public:
  LocalVariableNode(std::string name, std::string label, Value value, bool nonPublic = false);

  VariableKind kind() const override { return description.kind; }
  std::string summary() const override;

protected:
  std::vector<std::shared_ptr<VariableNode>> loadChildren() override;

private:
  Value value;
  VariableDescription description;
};

// A value in the debugger server process
class RemoteVariableNode : public VariableNode {
public:
  RemoteVariableNode(std::string name, std::string label, RemoteVariable variable,
                     bool nonPublic = false);

  VariableKind kind() const override { return variable.kind(); }
  std::string summary() const override { return variable.summary(); }

protected:
  std::vector<std::shared_ptr<VariableNode>> loadChildren() override;

private:
  RemoteVariable variable;
};

std::vector<std::shared_ptr<VariableNode>> variableTree(const BreakpointInfo &info);
std::vector<std::shared_ptr<VariableNode>> variableTree(const RemoteBreakpointInfo &info);

// "list[1].x" -> {"list", "[1]", "x"}; empty when malformed
std::vector<std::string> splitVariablePath(const std::string &path);

} // namespace snap
