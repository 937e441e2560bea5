#include "debugger/sourceView.hpp"

#include <algorithm>

namespace snap {

SourceView::SourceView(std::string preSource, std::string postSource)
    : pre(std::move(preSource)), post(std::move(postSource)) {
	setText("");
}

void SourceView::setText(std::string text) {
	body = std::move(text);
	lineStarts.assign(1, 0);
	for (size_t i = 0; i < body.size(); i++) {
		if (body[i] == '\n') {
			lineStarts.push_back(i + 1);
		}
	}
}

int SourceView::lineOf(int64_t fullSourceOffset) const {
	int64_t offset = fullSourceOffset - static_cast<int64_t>(pre.size()) - 1;
	if (offset < 0 || offset > static_cast<int64_t>(body.size())) {
		return -1;
	}
	auto it = std::upper_bound(lineStarts.begin(), lineStarts.end(), static_cast<size_t>(offset));
	return static_cast<int>(it - lineStarts.begin()) - 1;
}

std::string SourceView::line(size_t index) const {
	if (index >= lineStarts.size()) {
		return "";
	}
	size_t start = lineStarts[index];
	size_t end = index + 1 < lineStarts.size() ? lineStarts[index + 1] - 1 : body.size();
	return body.substr(start, end - start);
}

std::string SourceView::excerpt(int current, int context) const {
	if (current < 0) {
		return "";
	}
	int first = std::max(0, current - context);
	int last = std::min(static_cast<int>(lineStarts.size()) - 1, current + context);

	std::string text;
	for (int i = first; i <= last; i++) {
		std::string number = std::to_string(i + 1);
		text += (i == current ? "-> " : "   ") + std::string(4 - std::min<size_t>(4, number.size()), ' ') + number +
		        "  " + line(static_cast<size_t>(i)) + "\n";
	}
	return text;
}

} // namespace snap
