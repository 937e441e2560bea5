#include "console/variableNode.hpp"
#include "runtime/object.hpp"
#include "runtime/scriptError.hpp"

#include <cctype>

namespace snap {

const std::vector<std::shared_ptr<VariableNode>> &VariableNode::children() {
	if (!loaded && isExpandable()) {
		cached = loadChildren();
	}
	loaded = true;
	return cached;
}

std::shared_ptr<VariableNode> VariableNode::child(const std::string &name) {
	for (const auto &node : children()) {
		if (node->name() == name) {
			return node;
		}
	}
	return nullptr;
}

static std::string itemName(size_t index) {
	return "[" + std::to_string(index) + "]";
}

LocalVariableNode::LocalVariableNode(std::string name, std::string label, Value value, bool nonPublic)
    : VariableNode(std::move(name), std::move(label), nonPublic), value(std::move(value)),
      description(describe(this->value)) {}

std::string LocalVariableNode::summary() const {
	return summarize(description.kind, decode(description.kind, description.json));
}

std::vector<std::shared_ptr<VariableNode>> LocalVariableNode::loadChildren() {
	std::vector<std::shared_ptr<VariableNode>> nodes;
	const ObjectRef &object = value.asObject();

	if (description.kind == VariableKind::Enumerable) {
		std::vector<Value> items = object->items();
		for (size_t i = 0; i < items.size(); i++) {
			nodes.push_back(std::make_shared<LocalVariableNode>(itemName(i), itemName(i), items[i]));
		}
		return nodes;
	}

	auto members = std::get<std::vector<MemberInfo>>(decode(description.kind, description.json));
	for (const auto &member : members) {
		Value memberValue;
		try {
			memberValue = object->getMember(member.name, member.isProperty);
		} catch (const ScriptError &e) {
			memberValue = Value(memberAccessError + e.message());
		} catch (const std::exception &e) {
			memberValue = Value(memberAccessError + std::string(e.what()));
		}
		nodes.push_back(
		    std::make_shared<LocalVariableNode>(member.name, member.name, std::move(memberValue), member.isNonPublic));
	}
	return nodes;
}

RemoteVariableNode::RemoteVariableNode(std::string name, std::string label, RemoteVariable variable, bool nonPublic)
    : VariableNode(std::move(name), std::move(label), nonPublic), variable(std::move(variable)) {}

std::vector<std::shared_ptr<VariableNode>> RemoteVariableNode::loadChildren() {
	std::vector<std::shared_ptr<VariableNode>> nodes;

	if (variable.kind() == VariableKind::Enumerable) {
		std::vector<RemoteVariable> items = variable.getItems();
		for (size_t i = 0; i < items.size(); i++) {
			nodes.push_back(std::make_shared<RemoteVariableNode>(itemName(i), itemName(i), items[i]));
		}
		return nodes;
	}

	if (const auto *members = variable.members()) {
		for (const auto &member : *members) {
			nodes.push_back(std::make_shared<RemoteVariableNode>(member.name, member.name,
			                                                     variable.getProperty(member.name, member.isProperty),
			                                                     member.isNonPublic));
		}
	}
	return nodes;
}

std::vector<std::shared_ptr<VariableNode>> variableTree(const BreakpointInfo &info) {
	std::vector<std::shared_ptr<VariableNode>> roots;
	for (const auto &[name, value] : info.locals()) {
		std::string label = displayText(info.displayParts(name));
		roots.push_back(std::make_shared<LocalVariableNode>(name, label.empty() ? name : label, value));
	}
	return roots;
}

std::vector<std::shared_ptr<VariableNode>> variableTree(const RemoteBreakpointInfo &info) {
	std::vector<std::shared_ptr<VariableNode>> roots;
	for (const auto &[name, variable] : info.locals()) {
		std::string label = displayText(info.displayParts(name));
		roots.push_back(std::make_shared<RemoteVariableNode>(name, label.empty() ? name : label, variable));
	}
	return roots;
}

std::vector<std::string> splitVariablePath(const std::string &path) {
	std::vector<std::string> segments;
	size_t i = 0;
	auto identifier = [&]() {
		size_t start = i;
		while (i < path.size() && (std::isalnum(static_cast<unsigned char>(path[i])) || path[i] == '_')) {
			i++;
		}
		return path.substr(start, i - start);
	};

	std::string root = identifier();
	if (root.empty()) {
		return {};
	}
	segments.push_back(root);

	while (i < path.size()) {
		if (path[i] == '.') {
			i++;
			std::string member = identifier();
			if (member.empty()) {
				return {};
			}
			segments.push_back(member);
		} else if (path[i] == '[') {
			size_t close = path.find(']', i);
			if (close == std::string::npos || close == i + 1) {
				return {};
			}
			std::string index = path.substr(i + 1, close - i - 1);
			for (char c : index) {
				if (!std::isdigit(static_cast<unsigned char>(c))) {
					return {};
				}
			}
			segments.push_back("[" + std::to_string(std::stoul(index)) + "]");
			i = close + 1;
		} else {
			return {};
		}
	}
	return segments;
}

} // namespace snap
