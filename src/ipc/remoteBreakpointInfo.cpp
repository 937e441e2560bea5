#include "ipc/remoteBreakpointInfo.hpp"
#include "instrumentation/breakpointSite.hpp"

#include <cstring>

namespace snap {

RemoteVariable::RemoteVariable(const WireVariable &wire, std::shared_ptr<const RemoteAccess> access)
    : id(wire.handle), variableKind(wire.kind), decoded(decode(wire.kind, wire.json)), access(std::move(access)) {}

RemoteVariable::RemoteVariable(std::string handle, VariableKind kind, DecodedValue value)
    : id(std::move(handle)), variableKind(kind), decoded(std::move(value)) {}

RemoteVariable RemoteVariable::null() {
	return RemoteVariable("", VariableKind::Null, std::string());
}

const std::vector<MemberInfo> *RemoteVariable::members() const {
	return std::get_if<std::vector<MemberInfo>>(&decoded);
}

RemoteVariable RemoteVariable::getProperty(const std::string &name, bool isProperty) const {
	if (!access || !access->property) {
		return null();
	}
	return access->property(id, name, isProperty);
}

std::vector<RemoteVariable> RemoteVariable::getItems() const {
	if (!access || !access->items || variableKind != VariableKind::Enumerable) {
		return {};
	}
	return access->items(id);
}

RemoteBreakpointInfo::RemoteBreakpointInfo(const BreakpointPayload &payload,
                                           std::shared_ptr<const RemoteAccess> access)
    : breakpointSpan{payload.start, static_cast<int64_t>(std::strlen(breakpointMarker))},
      localDisplayParts(payload.displayParts) {
	for (const auto &[name, wire] : payload.locals) {
		localVariables.emplace_back(name, RemoteVariable(wire, access));
	}
}

const std::vector<DisplayPart> &RemoteBreakpointInfo::displayParts(const std::string &name) const {
	static const std::vector<DisplayPart> none;
	for (const auto &[localName, parts] : localDisplayParts) {
		if (localName == name) {
			return parts;
		}
	}
	return none;
}

} // namespace snap
