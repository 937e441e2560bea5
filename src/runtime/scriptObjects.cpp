#include "runtime/scriptObjects.hpp"
#include "runtime/scriptError.hpp"

namespace snap {

// ============================================================================
// ListObject
// ============================================================================

std::vector<MemberInfo> ListObject::members() const {
	return {{"Count", true, false}};
}

Value ListObject::getMember(const std::string &name, bool isProperty) const {
	if (isProperty && name == "Count") {
		return static_cast<int64_t>(size());
	}
	return Object::getMember(name, isProperty);
}

std::vector<Value> ListObject::items() const {
	std::lock_guard<std::mutex> lock(mutex);
	return elements;
}

std::optional<size_t> ListObject::count() const {
	return size();
}

std::string ListObject::toString() const {
	std::string text = "[";
	bool first = true;
	for (const Value &item : items()) {
		if (!first) text += ", ";
		first = false;
		text += item.isString() ? "\"" + item.toString() + "\"" : item.toString();
	}
	return text + "]";
}

Value ListObject::at(int64_t index) const {
	std::lock_guard<std::mutex> lock(mutex);
	if (index < 0 || static_cast<size_t>(index) >= elements.size()) {
		throw ScriptError("Index " + std::to_string(index) + " is out of range for a list of " +
		                  std::to_string(elements.size()) + " items");
	}
	return elements[static_cast<size_t>(index)];
}

void ListObject::set(int64_t index, Value value) {
	std::lock_guard<std::mutex> lock(mutex);
	if (index < 0 || static_cast<size_t>(index) >= elements.size()) {
		throw ScriptError("Index " + std::to_string(index) + " is out of range for a list of " +
		                  std::to_string(elements.size()) + " items");
	}
	elements[static_cast<size_t>(index)] = std::move(value);
}

void ListObject::add(Value value) {
	std::lock_guard<std::mutex> lock(mutex);
	elements.push_back(std::move(value));
}

size_t ListObject::size() const {
	std::lock_guard<std::mutex> lock(mutex);
	return elements.size();
}

// ============================================================================
// FunctionObject
// ============================================================================

std::vector<MemberInfo> FunctionObject::members() const {
	return {{"Name", true, false}};
}

Value FunctionObject::getMember(const std::string &memberName, bool isProperty) const {
	if (isProperty && memberName == "Name") {
		return name();
	}
	return Object::getMember(memberName, isProperty);
}

// ============================================================================
// TaskObject
// ============================================================================

std::vector<MemberInfo> TaskObject::members() const {
	return {{"IsCompleted", true, false}, {"Result", true, false}};
}

Value TaskObject::getMember(const std::string &name, bool isProperty) const {
	if (isProperty && name == "IsCompleted") {
		return pending.isReady();
	}
	if (isProperty && name == "Result") {
		if (!pending.isReady()) {
			throw ScriptError("The task has not completed yet");
		}
		return pending.get();
	}
	return Object::getMember(name, isProperty);
}

} // namespace snap
