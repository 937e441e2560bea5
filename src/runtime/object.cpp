#include "runtime/object.hpp"
#include "runtime/scriptError.hpp"

#include <algorithm>

namespace snap {

Value Object::getMember(const std::string &name, bool isProperty) const {
	throw ScriptError("'" + typeName() + "' has no " + (isProperty ? "property" : "field") + " named '" + name + "'");
}

void Object::setMember(const std::string &name, const Value &value) {
	(void)value;
	throw ScriptError("Cannot assign member '" + name + "' of '" + typeName() + "'");
}

std::vector<std::string> Object::elementTypeNames() const {
	std::vector<std::string> names;
	for (const Value &item : items()) {
		std::string name = item.typeName();
		if (std::find(names.begin(), names.end(), name) == names.end()) {
			names.push_back(name);
		}
	}
	return names;
}

} // namespace snap
