#pragma once

#include "compiler/breakpointHooks.hpp"
#include "debugger/displayPart.hpp"
#include "runtime/value.hpp"

#include <cstdint>
#include <string>
#include <utility>
#include <vector>

namespace snap {

// Position of a marker in the full source
struct BreakpointSpan {
  int64_t start{};
  int64_t length{};

  int64_t end() const { return start + length; }
};

/**
 * @brief What a breakpoint callback sees: where execution stopped and the
 * locals readable there, in declaration order
 */
class BreakpointInfo {
public:
  explicit BreakpointInfo(const BreakpointHit &hit);

  const BreakpointSpan &span() const { return breakpointSpan; }
  const std::vector<std::pair<std::string, Value>> &locals() const {
    return localVariables;
  }
  // Display parts of the local with the given name; empty when unknown
  const std::vector<DisplayPart> &displayParts(const std::string &name) const;
  // Null pointer when no local has that name
  const Value *local(const std::string &name) const;

private:
  BreakpointSpan breakpointSpan;
  std::vector<std::pair<std::string, Value>> localVariables;
  std::vector<std::vector<DisplayPart>> localDisplayParts;
};

} // namespace snap
