#include "debugger/breakpointInfo.hpp"
#include "instrumentation/breakpointSite.hpp"

#include <cstring>

namespace snap {

BreakpointInfo::BreakpointInfo(const BreakpointHit &hit)
    : breakpointSpan{hit.start, static_cast<int64_t>(std::strlen(breakpointMarker))} {
	for (size_t i = 0; i < hit.names.size(); i++) {
		localVariables.emplace_back(hit.names[i], hit.values[i]);
		localDisplayParts.push_back(nlohmann::json::parse(hit.displayJson[i]).get<std::vector<DisplayPart>>());
	}
}

const std::vector<DisplayPart> &BreakpointInfo::displayParts(const std::string &name) const {
	static const std::vector<DisplayPart> none;
	for (size_t i = 0; i < localVariables.size(); i++) {
		if (localVariables[i].first == name) {
			return localDisplayParts[i];
		}
	}
	return none;
}

const Value *BreakpointInfo::local(const std::string &name) const {
	for (const auto &[localName, value] : localVariables) {
		if (localName == name) {
			return &value;
		}
	}
	return nullptr;
}

} // namespace snap
