#include "instrumentation/instrumentor.hpp"

#include <algorithm>
#include <cctype>
#include <iostream>
#include <map>
#include <random>
#include <set>

namespace snap {

std::string uniqueIdentifierSuffix() {
	static thread_local std::mt19937_64 generator{std::random_device{}()};
	static const char *digits = "0123456789abcdef";
	std::uniform_int_distribution<int> nibble(0, 15);
	std::string suffix = "_";
	for (int i = 0; i < 32; i++) {
		suffix += digits[nibble(generator)];
	}
	return suffix;
}

std::vector<size_t> findBreakpointMarkers(const Program &program, const std::string &source) {
	std::vector<size_t> markers;
	const std::string marker = breakpointMarker;
	for (const Token &token : program.tokens) {
		for (const Trivia &trivia : token.leading_trivia) {
			if (trivia.kind == Trivia::Kind::BlockComment && trivia.length == marker.size() &&
			    source.compare(trivia.offset, trivia.length, marker) == 0) {
				markers.push_back(trivia.offset);
			}
		}
	}
	return markers;
}

static bool isKeywordType(const std::string &name) {
	static const std::set<std::string> keywords = {"int", "double", "bool", "char", "string", "object", "void"};
	return keywords.count(name) > 0;
}

std::vector<DisplayPart> localDisplayParts(const LocalSymbol &local) {
	std::vector<DisplayPart> parts;

	if (local.type_name.empty()) {
		parts.push_back({DisplayTag::Keyword, "var"});
	} else {
		std::string word;
		auto flush = [&]() {
			if (!word.empty()) {
				parts.push_back({isKeywordType(word) ? DisplayTag::Keyword : DisplayTag::Class, word});
				word.clear();
			}
		};
		for (char c : local.type_name) {
			if (std::isalnum(static_cast<unsigned char>(c)) || c == '_') {
				word += c;
				continue;
			}
			flush();
			if (c == ' ') {
				parts.push_back({DisplayTag::Space, " "});
			} else {
				parts.push_back({DisplayTag::Punctuation, std::string(1, c)});
			}
		}
		flush();
	}

	parts.push_back({DisplayTag::Space, " "});
	parts.push_back({local.is_parameter ? DisplayTag::Parameter : DisplayTag::Local, local.name});
	return parts;
}

// Quote text as a SnapScript string literal
static std::string stringLiteral(const std::string &text) {
	std::string literal = "\"";
	for (char c : text) {
		switch (c) {
		case '"':
			literal += "\\\"";
			break;
		case '\\':
			literal += "\\\\";
			break;
		case '\n':
			literal += "\\n";
			break;
		case '\r':
			literal += "\\r";
			break;
		case '\t':
			literal += "\\t";
			break;
		case '\0':
			literal += "\\0";
			break;
		default:
			literal += c;
		}
	}
	return literal + "\"";
}

Instrumentor::Instrumentor(std::string shimName, bool instrumentSync, bool instrumentAsync)
    : shim(std::move(shimName)), instrumentSync(instrumentSync), instrumentAsync(instrumentAsync) {}

std::vector<BreakpointSite> Instrumentor::resolveSites(Program &program, const std::string &source) const {
	std::vector<BreakpointSite> sites;
	std::set<const Statement *> instrumented;

	std::map<size_t, const Token *> owners;
	for (const Token &token : program.tokens) {
		for (const Trivia &trivia : token.leading_trivia) {
			owners[trivia.offset] = &token;
		}
	}

	for (size_t markerOffset : findBreakpointMarkers(program, source)) {
		try {
			const Token *owner = owners.at(markerOffset);
			if (owner->type == TokenType::END_OF_FILE) {
				continue;
			}

			Statement *statement = innermost_statement(program, owner->offset);
			if (!statement || instrumented.count(statement)) {
				continue;
			}

			Node *function = enclosing_callable(*statement);
			if (!function) {
				continue;
			}

			BreakpointSite site;
			site.markerOffset = markerOffset;
			site.statementStart = statement->start;
			site.statementEnd = statement->end;
			site.embedded = statement->embedded;
			site.isAsync = dynamic_cast<Callable *>(function)->is_async;

			if ((site.isAsync && !instrumentAsync) || (!site.isAsync && !instrumentSync)) {
				continue;
			}

			size_t boundary = std::min(markerOffset, statement->start);
			for (LocalSymbol &local : lookup_locals(*statement)) {
				if (local.declared_at < boundary) {
					site.locals.push_back(std::move(local));
				}
			}
			site.id = uniqueIdentifierSuffix();

			instrumented.insert(statement);
			sites.push_back(std::move(site));
		} catch (const std::exception &e) {
			std::cerr << "[INSTRUMENT] Skipping breakpoint at offset " << markerOffset << ": " << e.what()
			          << std::endl;
		}
	}
	return sites;
}

std::string Instrumentor::generatedBlock(const BreakpointSite &site) const {
	std::string names;
	std::string display;
	std::string values;
	for (size_t i = 0; i < site.locals.size(); i++) {
		const LocalSymbol &local = site.locals[i];
		if (i > 0) {
			names += ", ";
			display += ", ";
			values += ", ";
		}
		names += stringLiteral(local.name);
		display += stringLiteral(nlohmann::json(localDisplayParts(local)).dump());
		values += local.name;
	}

	const std::string start = "start" + site.id;
	const std::string namesVar = "localVariableNames" + site.id;
	const std::string displayVar = "localVariableDisplay" + site.id;
	const std::string valuesVar = "localVariableValues" + site.id;

	std::string call = site.isAsync ? "await " + asynchronousHookName() : synchronousHookName();

	return "{ var " + start + " = " + std::to_string(site.markerOffset) + "; var " + namesVar + " = [" + names +
	       "]; var " + displayVar + " = [" + display + "]; var " + valuesVar + " = [" + values + "]; " + call + "(" +
	       start + ", " + namesVar + ", " + displayVar + ", " + valuesVar + "); }";
}

std::vector<TextEdit> Instrumentor::editsFor(const std::vector<BreakpointSite> &sites) const {
	std::vector<TextEdit> edits;
	for (const BreakpointSite &site : sites) {
		std::string block = generatedBlock(site);
		if (site.embedded) {
			edits.push_back({site.statementStart, 0, "{ " + block + " "});
			edits.push_back({site.statementEnd, 0, " }"});
		} else {
			edits.push_back({site.statementStart, 0, block + " "});
		}
	}
	return edits;
}

std::string Instrumentor::instrument(Program &program, const std::string &source,
                                     std::vector<BreakpointSite> *sites) const {
	std::vector<BreakpointSite> resolved = resolveSites(program, source);
	std::string rewritten = applyEdits(source, editsFor(resolved));
	if (sites) {
		*sites = std::move(resolved);
	}
	return rewritten;
}

std::string Instrumentor::shimSource() const {
	return "extern func " + synchronousHookName() + "(start, names, display, values);\n" + "extern async func " +
	       asynchronousHookName() + "(start, names, display, values);\n";
}

} // namespace snap
