#include "runtime/value.hpp"
#include "runtime/object.hpp"
#include "runtime/scriptError.hpp"

#include <charconv>
#include <cmath>

namespace snap {

static const char *typeLabel(Value::Type type) {
	switch (type) {
	case Value::Type::Null:
		return "null";
	case Value::Type::Bool:
		return "bool";
	case Value::Type::Int:
		return "int";
	case Value::Type::Double:
		return "double";
	case Value::Type::Char:
		return "char";
	case Value::Type::String:
		return "string";
	case Value::Type::Enum:
		return "enum";
	case Value::Type::Object:
		return "object";
	}
	return "?";
}

static ScriptError mismatch(const Value &value, const char *expected) {
	return ScriptError("Expected " + std::string(expected) + ", got " + value.typeName());
}

bool Value::asBool() const {
	if (!isBool()) throw mismatch(*this, "bool");
	return std::get<bool>(data);
}

int64_t Value::asInt() const {
	if (isInt()) return std::get<int64_t>(data);
	if (isChar()) return static_cast<unsigned char>(std::get<char>(data));
	throw mismatch(*this, "int");
}

double Value::asDouble() const {
	if (isDouble()) return std::get<double>(data);
	if (isInt()) return static_cast<double>(std::get<int64_t>(data));
	throw mismatch(*this, "number");
}

char Value::asChar() const {
	if (!isChar()) throw mismatch(*this, "char");
	return std::get<char>(data);
}

const std::string &Value::asString() const {
	if (!isString()) throw mismatch(*this, "string");
	return std::get<std::string>(data);
}

const EnumValue &Value::asEnum() const {
	if (!isEnum()) throw mismatch(*this, "enum");
	return std::get<EnumValue>(data);
}

const ObjectRef &Value::asObject() const {
	if (!isObject()) throw mismatch(*this, "object");
	return std::get<ObjectRef>(data);
}

bool Value::truthy() const {
	switch (type()) {
	case Type::Null:
		return false;
	case Type::Bool:
		return std::get<bool>(data);
	case Type::Int:
		return std::get<int64_t>(data) != 0;
	case Type::Double:
		return std::get<double>(data) != 0.0;
	case Type::String:
		return !std::get<std::string>(data).empty();
	default:
		return true;
	}
}

std::string Value::typeName() const {
	if (isEnum()) return std::get<EnumValue>(data).typeName;
	if (isObject()) return std::get<ObjectRef>(data)->typeName();
	return typeLabel(type());
}

std::string formatNumber(double value) {
	if (std::isnan(value)) return "NaN";
	if (std::isinf(value)) return value > 0 ? "Infinity" : "-Infinity";
	char buffer[64];
	auto [end, ec] = std::to_chars(buffer, buffer + sizeof(buffer), value);
	if (ec != std::errc()) {
		return std::to_string(value);
	}
	return std::string(buffer, end);
}

std::string Value::toString() const {
	switch (type()) {
	case Type::Null:
		return "null";
	case Type::Bool:
		return std::get<bool>(data) ? "true" : "false";
	case Type::Int:
		return std::to_string(std::get<int64_t>(data));
	case Type::Double:
		return formatNumber(std::get<double>(data));
	case Type::Char:
		return std::string(1, std::get<char>(data));
	case Type::String:
		return std::get<std::string>(data);
	case Type::Enum:
		return std::get<EnumValue>(data).name;
	case Type::Object:
		return std::get<ObjectRef>(data)->toString();
	}
	return "";
}

bool Value::equals(const Value &other) const {
	if (isNumber() && other.isNumber()) {
		if (isInt() && other.isInt()) return asInt() == other.asInt();
		return asDouble() == other.asDouble();
	}
	if (type() != other.type()) return false;
	switch (type()) {
	case Type::Null:
		return true;
	case Type::Bool:
		return std::get<bool>(data) == std::get<bool>(other.data);
	case Type::Char:
		return std::get<char>(data) == std::get<char>(other.data);
	case Type::String:
		return std::get<std::string>(data) == std::get<std::string>(other.data);
	case Type::Enum:
		return std::get<EnumValue>(data) == std::get<EnumValue>(other.data);
	case Type::Object:
		return std::get<ObjectRef>(data) == std::get<ObjectRef>(other.data);
	default:
		return false;
	}
}

} // namespace snap
