#pragma once

#include "semantic/semantic.hpp"

#include <cstddef>
#include <string>
#include <vector>

namespace snap {

inline constexpr const char *breakpointMarker = "/* Breakpoint */";

// A marker resolved against the syntax tree of one compilation
struct BreakpointSite {
  // Offset of the marker in the compiled source
  size_t markerOffset{};
  size_t statementStart{};
  size_t statementEnd{};
  // Statement is the brace-less body of an if/while/for
  bool embedded{};
  bool isAsync{};
  // Locals readable at the statement, declared-after ones removed
  std::vector<LocalSymbol> locals;
  // Suffix of the generated identifiers: "_" + 32 hex digits
  std::string id;
};

} // namespace snap
