#pragma once

#include <cstddef>
#include <string>
#include <vector>

namespace snap {

// Replace [offset, offset + length) with replacement
struct TextEdit {
  size_t offset{};
  size_t length{};
  std::string replacement;
};

// Apply edits expressed against one coordinate space, back to front so
// earlier offsets stay valid. Edits at the same offset keep their order.
std::string applyEdits(std::string text, std::vector<TextEdit> edits);

} // namespace snap
