#pragma once

#include <cstddef>
#include <string>

namespace snap {

// Where a token or node starts; line 0 means unknown
struct SourceLocation {
  size_t line{};
  size_t column{};
  std::string filename;

  bool isKnown() const { return line != 0; }

  // "file:line:column", or "line:line:column" without a file name
  std::string toString() const {
    std::string prefix = filename.empty() ? "line" : filename;
    return prefix + ":" + std::to_string(line) + ":" + std::to_string(column);
  }
};

} // namespace snap
