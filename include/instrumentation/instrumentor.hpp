#pragma once

#include "ast/ast.hpp"
#include "debugger/displayPart.hpp"
#include "instrumentation/breakpointSite.hpp"
#include "instrumentation/textEdit.hpp"

#include <string>
#include <vector>

namespace snap {

// "_" followed by 32 random hex digits
std::string uniqueIdentifierSuffix();

// Offsets of every marker comment in a parsed unit; markers inside strings
// or line comments are not trivia pieces of their own and never match
std::vector<size_t> findBreakpointMarkers(const Program &program, const std::string &source);

// Display signature of a local, e.g. "var x" or "List<int> items"
std::vector<DisplayPart> localDisplayParts(const LocalSymbol &local);

/**
 * @brief Rewrites marked statements into calls to the debugger shim
 *
 * Each resolved site gets a block in front of its statement that captures
 * the marker offset, the names, display signatures and values of the
 * visible locals, then calls <shim>_Breakpoint or awaits
 * <shim>_BreakpointAsync. Brace-less bodies are wrapped so control flow is
 * unchanged. Sites that cannot be resolved are skipped silently.
 */
class Instrumentor {
public:
  Instrumentor(std::string shimName, bool instrumentSync, bool instrumentAsync);

  // Resolve every marker of a parsed unit; one site per statement
  std::vector<BreakpointSite> resolveSites(Program &program,
                                           const std::string &source) const;

  // Text edits for a set of sites, in the source's coordinate space
  std::vector<TextEdit> editsFor(const std::vector<BreakpointSite> &sites) const;

  // Resolve and rewrite in one step
  std::string instrument(Program &program, const std::string &source,
                         std::vector<BreakpointSite> *sites = nullptr) const;

  // Declarations of the shim's two extern slots
  std::string shimSource() const;

  const std::string &shimName() const { return shim; }
  std::string synchronousHookName() const { return shim + "_Breakpoint"; }
  std::string asynchronousHookName() const { return shim + "_BreakpointAsync"; }

private:
  std::string shim;
  bool instrumentSync;
  bool instrumentAsync;

  std::string generatedBlock(const BreakpointSite &site) const;
};

} // namespace snap
