#pragma once

#include "compiler/compilation.hpp"

#include <cstddef>
#include <string>
#include <vector>

namespace snap {

enum class BreakpointToggleResult { Added, Removed, InvalidPosition };

/**
 * @brief The editable unit: user text framed by fixed pre and post source
 *
 * Compilation always sees preSource + "\n" + text + "\n" + postSource, so
 * breakpoint offsets and diagnostics are positions in that full source.
 */
class Document {
public:
  explicit Document(std::string text, std::string preSource = "",
                    std::string postSource = "",
                    std::vector<std::string> references = {});

  const std::string &text() const { return body; }
  void setText(std::string text) { body = std::move(text); }
  const std::string &preSource() const { return pre; }
  const std::string &postSource() const { return post; }
  const std::vector<std::string> &references() const { return referencePaths; }
  void setReferences(std::vector<std::string> references) {
    referencePaths = std::move(references);
  }

  std::string fullSource() const;
  // Offset of the first character of text() within fullSource()
  size_t textOffset() const { return pre.size() + 1; }

  // Add or remove the marker on the line [lineStart, lineEnd) of text()
  BreakpointToggleResult toggleBreakpoint(size_t lineStart, size_t lineEnd);
  // Same, by zero-based line index
  BreakpointToggleResult toggleBreakpoint(size_t lineIndex);

  CompileResult compile(const SyncBreakpointHook &synchronousHook,
                        const AsyncBreakpointHook &asynchronousHook,
                        const CompileOptions &options = {}) const;
  // Compile with markers left as plain comments
  CompileResult createCompilation(const CompileOptions &options = {}) const;

private:
  std::string body;
  std::string pre;
  std::string post;
  std::vector<std::string> referencePaths;
};

} // namespace snap
