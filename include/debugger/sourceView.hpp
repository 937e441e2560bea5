#pragma once

#include <cstddef>
#include <cstdint>
#include <string>
#include <vector>

namespace snap {

/**
 * @brief Read-only view of a document for a paused session
 *
 * Maps full-source offsets (as carried by breakpoint spans) back to lines of
 * the user text.
 */
class SourceView {
public:
  SourceView(std::string preSource, std::string postSource);

  const std::string &preSource() const { return pre; }
  const std::string &postSource() const { return post; }
  const std::string &text() const { return body; }
  const std::vector<std::string> &references() const { return referencePaths; }

  void setText(std::string text);
  void setReferences(std::vector<std::string> references) {
    referencePaths = std::move(references);
  }

  // Zero-based line of text() holding a full-source offset; -1 when the
  // offset lies in the pre or post source
  int lineOf(int64_t fullSourceOffset) const;
  size_t lineCount() const { return lineStarts.size(); }
  std::string line(size_t index) const;

  // Numbered lines around `line`, the current one marked with "->"
  std::string excerpt(int line, int context = 2) const;

private:
  std::string pre;
  std::string post;
  std::string body;
  std::vector<std::string> referencePaths;
  std::vector<size_t> lineStarts;
};

} // namespace snap
