#include "compiler/compilation.hpp"
#include "instrumentation/instrumentor.hpp"
#include "lexer/lexer.hpp"
#include "parser/parser.hpp"
#include "runtime/scriptError.hpp"
#include "runtime/scriptObjects.hpp"
#include "semantic/semantic.hpp"

#include <fstream>
#include <iostream>
#include <sstream>

namespace snap {

namespace {

struct ParsedUnit {
	std::unique_ptr<Program> program;
	std::vector<Diagnostic> diagnostics;
};

ParsedUnit parseUnit(const std::string &source, const std::string &filename, bool analyze) {
	Lexer lexer(source, filename);
	Parser parser(lexer);
	ParsedUnit unit;
	unit.program = parser.parse();
	unit.diagnostics = parser.diagnostics();
	if (analyze && !parser.has_errors()) {
		SemanticAnalyzer analyzer;
		analyzer.analyze(*unit.program);
		unit.diagnostics.insert(unit.diagnostics.end(), analyzer.diagnostics().begin(),
		                        analyzer.diagnostics().end());
	}
	return unit;
}

bool readFile(const std::string &path, std::string &contents) {
	std::ifstream file(path);
	if (!file) {
		return false;
	}
	std::stringstream buffer;
	buffer << file.rdbuf();
	contents = buffer.str();
	return true;
}

std::vector<Value> listArgument(const std::vector<Value> &args, size_t index) {
	auto list = args[index].objectAs<ListObject>();
	if (!list) {
		throw ScriptError("Breakpoint argument " + std::to_string(index) + " must be a list");
	}
	return list->items();
}

// Unpack (start, names, display, values) as passed by an instrumented site
BreakpointHit unpackHit(const std::vector<Value> &args) {
	if (args.size() != 4) {
		throw ScriptError("Breakpoint expects 4 arguments, got " + std::to_string(args.size()));
	}
	BreakpointHit hit;
	hit.start = args[0].asInt();
	for (const Value &name : listArgument(args, 1)) {
		hit.names.push_back(name.asString());
	}
	for (const Value &display : listArgument(args, 2)) {
		hit.displayJson.push_back(display.asString());
	}
	hit.values = listArgument(args, 3);
	if (hit.names.size() != hit.values.size() || hit.names.size() != hit.displayJson.size()) {
		throw ScriptError("Breakpoint local lists differ in length");
	}
	return hit;
}

} // namespace

CompileResult compileSource(const std::string &source, const std::vector<std::string> &references,
                            const SyncBreakpointHook &synchronousHook, const AsyncBreakpointHook &asynchronousHook,
                            const CompileOptions &options) {
	CompileResult result;
	result.source = source;

	ParsedUnit primary = parseUnit(source, options.filename, true);
	result.diagnostics = primary.diagnostics;

	std::vector<std::unique_ptr<Program>> units;
	for (const auto &path : references) {
		std::string contents;
		if (!readFile(path, contents)) {
			result.diagnostics.emplace_back("Cannot read reference: " + path, path);
			continue;
		}
		ParsedUnit reference = parseUnit(contents, path, true);
		result.diagnostics.insert(result.diagnostics.end(), reference.diagnostics.begin(),
		                          reference.diagnostics.end());
		units.push_back(std::move(reference.program));
	}

	if (hasErrors(result.diagnostics)) {
		return result;
	}

	std::unique_ptr<Program> program = std::move(primary.program);
	std::unique_ptr<Program> shim;
	Instrumentor instrumentor(uniqueIdentifierSuffix(), static_cast<bool>(synchronousHook),
	                          static_cast<bool>(asynchronousHook));

	if ((synchronousHook || asynchronousHook) && !findBreakpointMarkers(*program, source).empty()) {
		std::string instrumented = instrumentor.instrument(*program, source, &result.sites);
		if (!result.sites.empty()) {
			if (options.debug) {
				std::cerr << "[COMPILE] Instrumented " << result.sites.size() << " breakpoint(s)" << std::endl;
			}
			ParsedUnit rewritten = parseUnit(instrumented, options.filename, true);
			ParsedUnit shimUnit = parseUnit(instrumentor.shimSource(), "<debugger>", false);
			rewritten.diagnostics.insert(rewritten.diagnostics.end(), shimUnit.diagnostics.begin(),
			                             shimUnit.diagnostics.end());
			if (hasErrors(rewritten.diagnostics)) {
				for (auto &diagnostic : rewritten.diagnostics) {
					diagnostic.message = "Instrumented source: " + diagnostic.message;
					result.diagnostics.push_back(std::move(diagnostic));
				}
				return result;
			}
			program = std::move(rewritten.program);
			shim = std::move(shimUnit.program);
			result.source = std::move(instrumented);
			result.shimName = instrumentor.shimName();
		}
	}

	units.insert(units.begin(), std::move(program));
	if (shim) {
		units.push_back(std::move(shim));
	}
	auto module = std::make_shared<Module>(std::move(units));

	if (!result.shimName.empty()) {
		if (synchronousHook) {
			module->bindExtern(instrumentor.synchronousHookName(), [synchronousHook](const std::vector<Value> &args) {
				synchronousHook(unpackHit(args));
				return Value();
			});
		}
		if (asynchronousHook) {
			module->bindExtern(instrumentor.asynchronousHookName(),
			                   [asynchronousHook](const std::vector<Value> &args) {
				                   return Value(std::make_shared<TaskObject>(asynchronousHook(unpackHit(args))));
			                   });
		}
	}

	result.module = std::move(module);
	return result;
}

} // namespace snap
