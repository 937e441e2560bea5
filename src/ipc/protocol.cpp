#include "ipc/protocol.hpp"
#include "debugger/variableCodec.hpp"

namespace snap {

using Json = nlohmann::json;

void to_json(Json &j, const WireVariable &variable) {
	j = Json::array({variable.handle, toString(variable.kind), variable.json});
}

void from_json(const Json &j, WireVariable &variable) {
	variable.handle = j.at(0).get<std::string>();
	auto kind = parseVariableKind(j.at(1).get<std::string>());
	if (!kind) {
		throw std::invalid_argument("Unknown variable kind " + j.at(1).get<std::string>());
	}
	variable.kind = *kind;
	variable.json = j.at(2).get<std::string>();
}

std::string BreakpointPayload::encode() const {
	Json display = Json::array();
	for (const auto &[name, parts] : displayParts) {
		display.push_back(Json::array({name, dumpJson(Json(parts))}));
	}

	Json variables = Json::array();
	for (const auto &[name, variable] : locals) {
		variables.push_back(Json::array({name, variable.handle, toString(variable.kind), variable.json}));
	}

	Json message = Json::array(
	    {dumpJson(display), dumpJson(variables), text, std::to_string(start), preSource, postSource, dumpJson(Json(references))});
	return dumpJson(message);
}

BreakpointPayload BreakpointPayload::decode(const std::string &line) {
	auto parts = Json::parse(line).get<std::vector<std::string>>();
	if (parts.size() != 7) {
		throw std::invalid_argument("Breakpoint payload has " + std::to_string(parts.size()) + " parts, expected 7");
	}

	BreakpointPayload payload;
	for (const auto &entry : Json::parse(parts[0]).get<std::vector<std::vector<std::string>>>()) {
		payload.displayParts.emplace_back(entry.at(0), Json::parse(entry.at(1)).get<std::vector<DisplayPart>>());
	}
	for (const auto &entry : Json::parse(parts[1]).get<std::vector<std::vector<std::string>>>()) {
		WireVariable variable;
		from_json(Json::array({entry.at(1), entry.at(2), entry.at(3)}), variable);
		payload.locals.emplace_back(entry.at(0), std::move(variable));
	}
	payload.text = parts[2];
	payload.start = std::stoll(parts[3]);
	payload.preSource = parts[4];
	payload.postSource = parts[5];
	payload.references = Json::parse(parts[6]).get<std::vector<std::string>>();
	return payload;
}

} // namespace snap
