#include "compiler/document.hpp"
#include "instrumentation/breakpointSite.hpp"
#include "lexer/lexer.hpp"
#include "parser/parser.hpp"

#include <cstring>

namespace snap {

static bool isBlank(const std::string &text) {
	return text.find_first_not_of(" \t\r") == std::string::npos;
}

Document::Document(std::string text, std::string preSource, std::string postSource, std::vector<std::string> references)
    : body(std::move(text)), pre(std::move(preSource)), post(std::move(postSource)),
      referencePaths(std::move(references)) {}

std::string Document::fullSource() const {
	return pre + "\n" + body + "\n" + post;
}

BreakpointToggleResult Document::toggleBreakpoint(size_t lineIndex) {
	size_t lineStart = 0;
	for (size_t line = 0; line < lineIndex; line++) {
		size_t newline = body.find('\n', lineStart);
		if (newline == std::string::npos) {
			return BreakpointToggleResult::InvalidPosition;
		}
		lineStart = newline + 1;
	}
	size_t lineEnd = body.find('\n', lineStart);
	if (lineEnd == std::string::npos) {
		lineEnd = body.size();
	}
	return toggleBreakpoint(lineStart, lineEnd);
}

BreakpointToggleResult Document::toggleBreakpoint(size_t lineStart, size_t lineEnd) {
	if (lineStart > lineEnd || lineEnd > body.size()) {
		return BreakpointToggleResult::InvalidPosition;
	}

	const size_t markerLength = std::strlen(breakpointMarker);
	std::string line = body.substr(lineStart, lineEnd - lineStart);

	size_t markerAt = line.find(breakpointMarker);
	if (markerAt != std::string::npos) {
		std::string rest = line.substr(0, markerAt) + line.substr(markerAt + markerLength);
		if (isBlank(rest)) {
			size_t end = lineEnd < body.size() && body[lineEnd] == '\n' ? lineEnd + 1 : lineEnd;
			body.erase(lineStart, end - lineStart);
		} else {
			size_t length = markerLength;
			if (markerAt + length < line.size() && line[markerAt + length] == ' ') {
				length++;
			}
			body.erase(lineStart + markerAt, length);
		}
		return BreakpointToggleResult::Removed;
	}

	std::string source = fullSource();
	Lexer lexer(source, "<document>");
	Parser parser(lexer);
	auto program = parser.parse();

	const size_t from = textOffset() + lineStart;
	const size_t to = textOffset() + lineEnd;

	const Token *first = nullptr;
	Statement *statement = nullptr;
	for (const Token &token : program->tokens) {
		if (token.type == TokenType::END_OF_FILE || token.type == TokenType::ERROR) {
			continue;
		}
		if (token.offset < from) {
			continue;
		}
		if (token.offset >= to) {
			break;
		}
		if (!first) {
			first = &token;
		}
		Statement *candidate = innermost_statement(*program, token.offset);
		if (candidate && candidate->start == token.offset) {
			statement = candidate;
			break;
		}
	}
	if (!first) {
		return BreakpointToggleResult::InvalidPosition;
	}
	if (!statement) {
		statement = innermost_statement(*program, first->offset);
	}
	// Statements outside any function never reach the debugger
	if (!statement || statement->start < textOffset() || !enclosing_callable(*statement)) {
		return BreakpointToggleResult::InvalidPosition;
	}

	size_t insertAt = statement->start - textOffset();
	size_t indentEnd = body.find_first_not_of(" \t", lineStart);
	if (indentEnd == insertAt) {
		std::string indent = body.substr(lineStart, indentEnd - lineStart);
		body.insert(insertAt, std::string(breakpointMarker) + "\n" + indent);
	} else {
		body.insert(insertAt, std::string(breakpointMarker) + " ");
	}
	return BreakpointToggleResult::Added;
}

CompileResult Document::compile(const SyncBreakpointHook &synchronousHook, const AsyncBreakpointHook &asynchronousHook,
                                const CompileOptions &options) const {
	return compileSource(fullSource(), referencePaths, synchronousHook, asynchronousHook, options);
}

CompileResult Document::createCompilation(const CompileOptions &options) const {
	return compileSource(fullSource(), referencePaths, nullptr, nullptr, options);
}

} // namespace snap
