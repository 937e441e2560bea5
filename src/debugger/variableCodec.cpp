#include "debugger/variableCodec.hpp"

#include <nlohmann/json.hpp>

#include <algorithm>
#include <cctype>

namespace snap {

using Json = nlohmann::json;

static const char *kindNames[] = {"String", "Char",      "Number",   "Bool",     "Null", "Enumerable",
                                  "Enum",   "Class",     "Interface", "Delegate", "Other"};

std::string toString(VariableKind kind) {
	return kindNames[static_cast<int>(kind)];
}

std::optional<VariableKind> parseVariableKind(const std::string &name) {
	for (int i = 0; i <= static_cast<int>(VariableKind::Other); i++) {
		if (name == kindNames[i]) {
			return static_cast<VariableKind>(i);
		}
	}
	return std::nullopt;
}

bool parseBoolean(const std::string &text) {
	std::string lower = text;
	std::transform(lower.begin(), lower.end(), lower.begin(),
	               [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
	return lower == "true";
}

static VariableKind objectKind(const Object &object) {
	switch (object.kind()) {
	case ObjectKind::Class:
		return VariableKind::Class;
	case ObjectKind::Interface:
		return VariableKind::Interface;
	case ObjectKind::Delegate:
		return VariableKind::Delegate;
	case ObjectKind::Other:
		return VariableKind::Other;
	}
	return VariableKind::Other;
}

std::string dumpJson(const Json &json) {
	return json.dump(-1, ' ', false, Json::error_handler_t::replace);
}

VariableDescription describe(const Value &value) {
	VariableDescription description;

	if (value.isString()) {
		description.kind = VariableKind::String;
		description.json = dumpJson(Json(value.asString()));
	} else if (value.isChar()) {
		description.kind = VariableKind::Char;
		description.json = dumpJson(Json(std::string(1, value.asChar())));
	} else if (value.isNumber()) {
		description.kind = VariableKind::Number;
		description.json = dumpJson(Json(value.toString()));
	} else if (value.isBool()) {
		description.kind = VariableKind::Bool;
		description.json = dumpJson(Json(value.asBool() ? "true" : "false"));
	} else if (value.isNull()) {
		description.kind = VariableKind::Null;
		description.json = dumpJson(Json(""));
	} else if (value.isObject() && value.asObject()->isEnumerable()) {
		const auto &object = value.asObject();
		std::string types;
		for (const auto &name : object->elementTypeNames()) {
			if (!types.empty()) {
				types += ", ";
			}
			types += name;
		}
		auto count = object->count();
		description.kind = VariableKind::Enumerable;
		description.json = dumpJson(Json::array({types, count ? std::to_string(*count) : "-1"}));
	} else if (value.isEnum()) {
		description.kind = VariableKind::Enum;
		description.json = dumpJson(Json::array({value.asEnum().typeName, value.asEnum().name}));
	} else {
		const auto &object = value.asObject();
		std::vector<MemberInfo> members = object->members();
		std::stable_sort(members.begin(), members.end(),
		                 [](const MemberInfo &a, const MemberInfo &b) { return a.name < b.name; });

		Json list = Json::array();
		for (const auto &member : members) {
			list.push_back(
			    Json::array({member.name, member.isProperty ? "True" : "False", member.isNonPublic ? "True" : "False"}));
		}
		description.kind = objectKind(*object);
		description.json = dumpJson(list);
	}
	return description;
}

DecodedValue decode(VariableKind kind, const std::string &json) {
	Json parsed = Json::parse(json);

	switch (kind) {
	case VariableKind::String:
	case VariableKind::Char:
	case VariableKind::Number:
	case VariableKind::Bool:
	case VariableKind::Null:
		return parsed.get<std::string>();
	case VariableKind::Enumerable: {
		auto parts = parsed.get<std::vector<std::string>>();
		EnumerableSummary summary;
		summary.elementTypes = parts.at(0);
		summary.count = std::stoll(parts.at(1));
		return summary;
	}
	case VariableKind::Enum: {
		auto parts = parsed.get<std::vector<std::string>>();
		return EnumSummary{parts.at(0), parts.at(1)};
	}
	default:
		break;
	}

	std::vector<MemberInfo> members;
	for (const auto &entry : parsed.get<std::vector<std::vector<std::string>>>()) {
		members.push_back({entry.at(0), parseBoolean(entry.at(1)), parseBoolean(entry.at(2))});
	}
	return members;
}

std::string summarize(VariableKind kind, const DecodedValue &value) {
	switch (kind) {
	case VariableKind::String:
		return dumpJson(Json(std::get<std::string>(value)));
	case VariableKind::Char:
		return "'" + std::get<std::string>(value) + "'";
	case VariableKind::Null:
		return "null";
	case VariableKind::Number:
	case VariableKind::Bool:
		return std::get<std::string>(value);
	case VariableKind::Enumerable: {
		const auto &summary = std::get<EnumerableSummary>(value);
		std::string text = "List<" + summary.elementTypes + ">";
		if (summary.count >= 0) {
			text += " (" + std::to_string(summary.count) + ")";
		}
		return text;
	}
	case VariableKind::Enum: {
		const auto &summary = std::get<EnumSummary>(value);
		return summary.typeName + "." + summary.name;
	}
	default: {
		const auto &members = std::get<std::vector<MemberInfo>>(value);
		return "{" + std::to_string(members.size()) + " members}";
	}
	}
}

} // namespace snap
