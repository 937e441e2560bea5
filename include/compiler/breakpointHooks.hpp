#pragma once

#include "runtime/task.hpp"
#include "runtime/value.hpp"

#include <cstdint>
#include <functional>
#include <string>
#include <vector>

namespace snap {

// Arguments of one call into the debugger shim
struct BreakpointHit {
  // Marker offset in the full source
  int64_t start{};
  std::vector<std::string> names;
  // Display parts of each local, as JSON text
  std::vector<std::string> displayJson;
  std::vector<Value> values;
};

using SyncBreakpointHook = std::function<void(const BreakpointHit &)>;
using AsyncBreakpointHook = std::function<Task<Value>(const BreakpointHit &)>;

} // namespace snap
