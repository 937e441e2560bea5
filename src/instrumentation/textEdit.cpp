#include "instrumentation/textEdit.hpp"

#include <algorithm>
#include <numeric>

namespace snap {

std::string applyEdits(std::string text, std::vector<TextEdit> edits) {
	std::vector<size_t> order(edits.size());
	std::iota(order.begin(), order.end(), 0);

	// Back to front; among equal offsets the later edit goes in first so the
	// earlier one ends up in front of it
	std::sort(order.begin(), order.end(), [&edits](size_t a, size_t b) {
		if (edits[a].offset != edits[b].offset) {
			return edits[a].offset > edits[b].offset;
		}
		return a > b;
	});

	for (size_t index : order) {
		const TextEdit &edit = edits[index];
		if (edit.offset > text.size()) {
			continue;
		}
		text.replace(edit.offset, std::min(edit.length, text.size() - edit.offset), edit.replacement);
	}
	return text;
}

} // namespace snap
