#include "console/consolePresenter.hpp"

#include <istream>
#include <ostream>

namespace snap {

static std::string trim(const std::string &text) {
	size_t start = text.find_first_not_of(" \t\r\n");
	if (start == std::string::npos) {
		return "";
	}
	size_t end = text.find_last_not_of(" \t\r\n");
	return text.substr(start, end - start + 1);
}

ConsolePresenter::ConsolePresenter(std::istream &in, std::ostream &out) : in(in), out(out) {}

std::vector<std::string> ConsolePresenter::splitScript(const std::string &text) {
	std::vector<std::string> commands;
	size_t start = 0;
	while (start <= text.size()) {
		size_t end = text.find(';', start);
		if (end == std::string::npos) {
			end = text.size();
		}
		std::string command = trim(text.substr(start, end - start));
		if (!command.empty()) {
			commands.push_back(command);
		}
		start = end + 1;
	}
	return commands;
}

void ConsolePresenter::setScript(std::vector<std::string> commands) {
	scripted = true;
	script.assign(commands.begin(), commands.end());
}

std::optional<std::string> ConsolePresenter::nextCommand() {
	if (scripted) {
		if (script.empty()) {
			return std::nullopt;
		}
		std::string command = script.front();
		script.pop_front();
		out << "> " << command << std::endl;
		return command;
	}
	out << "(snapdbg) " << std::flush;
	std::string line;
	if (!std::getline(in, line)) {
		return std::nullopt;
	}
	return trim(line);
}

void ConsolePresenter::show(const BreakpointInfo &info, std::function<void(bool)> resume) {
	SourceView empty("", "");
	const SourceView &source = localSource ? *localSource : empty;
	resume(present(info.span().start, source, variableTree(info)));
}

bool ConsolePresenter::present(int64_t offset, const SourceView &source,
                               const std::vector<std::shared_ptr<VariableNode>> &roots) {
	int line = source.lineOf(offset);
	if (line >= 0) {
		out << "Breakpoint hit at line " << line + 1 << std::endl;
		out << source.excerpt(line);
	} else {
		out << "Breakpoint hit at offset " << offset << std::endl;
	}

	while (true) {
		std::optional<std::string> command = nextCommand();
		if (!command || *command == "continue" || *command == "c") {
			out << "Continuing" << std::endl;
			return false;
		}
		if (command->empty()) {
			continue;
		}

		if (*command == "ignore") {
			out << "Continuing, this breakpoint will be ignored" << std::endl;
			return true;
		} else if (*command == "vars") {
			printVariables(roots);
		} else if (command->rfind("show ", 0) == 0) {
			std::string path = trim(command->substr(5));
			auto node = resolve(roots, path);
			if (node) {
				printNode(path, *node);
			} else {
				out << "No variable " << path << std::endl;
			}
		} else if (*command == "nonpublic") {
			showNonPublic = !showNonPublic;
			out << "Non-public members " << (showNonPublic ? "shown" : "hidden") << std::endl;
		} else if (*command == "source") {
			if (line >= 0) {
				out << source.excerpt(line, 5);
			}
		} else if (*command == "refs") {
			if (source.references().empty()) {
				out << "No references" << std::endl;
			}
			for (const auto &reference : source.references()) {
				out << reference << std::endl;
			}
		} else if (*command == "help") {
			printHelp();
		} else {
			out << "Unknown command: " << *command << " (try help)" << std::endl;
		}
	}
}

void ConsolePresenter::printVariables(const std::vector<std::shared_ptr<VariableNode>> &roots) {
	if (roots.empty()) {
		out << "No local variables" << std::endl;
	}
	for (const auto &root : roots) {
		out << root->label() << " = " << root->summary() << std::endl;
	}
}

void ConsolePresenter::printNode(const std::string &path, VariableNode &node) {
	out << path << " = " << node.summary() << std::endl;
	for (const auto &child : node.children()) {
		if (child->isNonPublic() && !showNonPublic) {
			continue;
		}
		out << "  " << child->label() << " = " << child->summary();
		if (child->isNonPublic()) {
			out << " (non-public)";
		}
		out << std::endl;
	}
}

std::shared_ptr<VariableNode> ConsolePresenter::resolve(const std::vector<std::shared_ptr<VariableNode>> &roots,
                                                        const std::string &path) {
	std::vector<std::string> segments = splitVariablePath(path);
	if (segments.empty()) {
		return nullptr;
	}

	std::shared_ptr<VariableNode> node;
	for (const auto &root : roots) {
		if (root->name() == segments[0]) {
			node = root;
			break;
		}
	}
	for (size_t i = 1; node && i < segments.size(); i++) {
		node = node->child(segments[i]);
	}
	return node;
}

void ConsolePresenter::printHelp() {
	out << "vars             list local variables\n"
	       "show <path>      print a variable and its members, e.g. show list[1] or show point.x\n"
	       "nonpublic        toggle non-public members\n"
	       "source           print the surrounding source\n"
	       "refs             list referenced scripts\n"
	       "continue         resume execution\n"
	       "ignore           resume and ignore this breakpoint from now on"
	    << std::endl;
}

} // namespace snap
