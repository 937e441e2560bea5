#pragma once

#include "compiler/breakpointHooks.hpp"
#include "compiler/diagnostic.hpp"
#include "instrumentation/breakpointSite.hpp"
#include "runtime/module.hpp"

#include <memory>
#include <string>
#include <vector>

namespace snap {

struct CompileOptions {
  // Name used in diagnostics and runtime error locations
  std::string filename{"<document>"};
  // Log instrumentation and binding to stderr
  bool debug{};
};

struct CompileResult {
  // Null when any diagnostic is an error
  std::shared_ptr<Module> module;
  std::vector<Diagnostic> diagnostics;
  // The source that was actually loaded, instrumented when sites exist
  std::string source;
  std::vector<BreakpointSite> sites;
  // Empty when nothing was instrumented
  std::string shimName;

  bool succeeded() const { return module != nullptr; }
};

/**
 * @brief Compile a full source plus its reference scripts into a Module
 *
 * Diagnostics are always reported against the uninstrumented source. When a
 * hook is given and the source carries breakpoint markers, the marked
 * statements are rewritten, a debugger shim is compiled alongside and its
 * extern slots are bound to the hooks.
 */
CompileResult compileSource(const std::string &source,
                            const std::vector<std::string> &references,
                            const SyncBreakpointHook &synchronousHook,
                            const AsyncBreakpointHook &asynchronousHook,
                            const CompileOptions &options = {});

} // namespace snap
