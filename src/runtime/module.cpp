#include "runtime/module.hpp"
#include "interpreter.h"
#include "runtime/scriptError.hpp"

#include <chrono>
#include <iostream>
#include <stdexcept>

namespace snap {

Module::Module(std::vector<std::unique_ptr<Program>> units)
    : programs(std::move(units)), globals(std::make_shared<Environment>()) {
	output = [](const std::string &text) { std::cout << text << std::flush; };
	registerDeclarations();
}

Module::~Module() {
	std::vector<std::thread> pending;
	{
		std::lock_guard<std::mutex> lock(threadsMutex);
		pending.swap(threads);
	}
	for (auto &thread : pending) {
		if (thread.joinable()) {
			thread.join();
		}
	}
}

void Module::registerDeclarations() {
	auto builtin = [this](const std::string &name, NativeFunction function) {
		globals->define(name, Value(std::make_shared<NativeFunctionObject>(name, std::move(function))));
	};

	builtin("print", [this](const std::vector<Value> &args) {
		std::string line;
		for (size_t i = 0; i < args.size(); i++) {
			if (i > 0) line += " ";
			line += args[i].toString();
		}
		print(line + "\n");
		return Value();
	});

	builtin("len", [](const std::vector<Value> &args) -> Value {
		if (args.size() != 1) {
			throw ScriptError("len expects one argument");
		}
		if (args[0].isString()) {
			return static_cast<int64_t>(args[0].asString().size());
		}
		if (args[0].isObject()) {
			if (auto count = args[0].asObject()->count()) {
				return static_cast<int64_t>(*count);
			}
		}
		throw ScriptError("len is not defined for '" + args[0].typeName() + "'");
	});

	builtin("str", [](const std::vector<Value> &args) {
		return Value(args.empty() ? std::string() : args[0].toString());
	});

	builtin("fail", [](const std::vector<Value> &args) -> Value {
		throw ScriptError(args.empty() ? "fail() called" : args[0].toString());
	});

	builtin("delay", [](const std::vector<Value> &args) {
		int64_t milliseconds = args.empty() ? 0 : args[0].asInt();
		if (milliseconds > 0) {
			std::this_thread::sleep_for(std::chrono::milliseconds(milliseconds));
		}
		return Value(std::make_shared<TaskObject>(Task<Value>::fromResult(Value())));
	});

	builtin("spawn", [this](const std::vector<Value> &args) {
		if (args.empty()) {
			throw ScriptError("spawn expects a function");
		}
		auto function = args[0].objectAs<FunctionObject>();
		if (!function) {
			throw ScriptError("spawn expects a function, got '" + args[0].typeName() + "'");
		}
		std::vector<Value> rest(args.begin() + 1, args.end());
		return Value(std::make_shared<TaskObject>(spawn(function, std::move(rest))));
	});

	builtin("join", [this](const std::vector<Value> &args) {
		if (args.empty()) {
			throw ScriptError("join expects a task");
		}
		auto task = args[0].objectAs<TaskObject>();
		if (!task) {
			return args[0];
		}
		return Interpreter::awaitTask(*this, task->task());
	});

	for (const auto &program : programs) {
		for (const auto &decl : program->declarations) {
			if (auto *func = dynamic_cast<FunctionDecl *>(decl.get())) {
				if (func->is_extern) {
					std::string name = func->name;
					externs[name] = ExternSlot{func->is_async, nullptr};
					globals->define(name, Value(std::make_shared<NativeFunctionObject>(
					                          name, [this, name](const std::vector<Value> &args) {
						                          return invokeExtern(name, args);
					                          })));
				} else {
					functions[func->name] = func;
					globals->define(func->name,
					                Value(std::make_shared<ScriptFunction>(this, func, func->name, globals, Value())));
				}
			} else if (auto *cls = dynamic_cast<ClassDecl *>(decl.get())) {
				auto info = std::make_shared<ClassInfo>();
				info->name = cls->name;
				info->module = this;
				for (const auto &member : cls->members) {
					if (auto *field = dynamic_cast<VarDecl *>(member.get())) {
						info->fields.push_back(field);
					} else if (auto *property = dynamic_cast<PropertyDecl *>(member.get())) {
						info->properties.push_back(property);
					} else if (auto *method = dynamic_cast<FunctionDecl *>(member.get())) {
						info->methods[method->name] = method;
					}
				}
				classes[cls->name] = info;
			} else if (auto *enumeration = dynamic_cast<EnumDecl *>(decl.get())) {
				globals->define(enumeration->name, Value(std::make_shared<EnumTypeObject>(enumeration)));
			}
		}
	}
}

void Module::initializeGlobals() {
	for (const auto &program : programs) {
		for (const auto &decl : program->declarations) {
			if (auto *var = dynamic_cast<VarDecl *>(decl.get())) {
				Interpreter interpreter(*this);
				interpreter.defineGlobal(*var);
			}
		}
	}
}

void Module::ensureInitialized() {
	std::call_once(initialized, [this] { initializeGlobals(); });
}

void Module::bindExtern(const std::string &name, NativeFunction function) {
	std::lock_guard<std::mutex> lock(externMutex);
	auto it = externs.find(name);
	if (it == externs.end()) {
		throw std::invalid_argument("No extern function named '" + name + "'");
	}
	it->second.function = std::move(function);
}

bool Module::isBound(const std::string &name) const {
	std::lock_guard<std::mutex> lock(externMutex);
	auto it = externs.find(name);
	return it != externs.end() && it->second.function != nullptr;
}

std::vector<std::string> Module::externNames() const {
	std::lock_guard<std::mutex> lock(externMutex);
	std::vector<std::string> names;
	for (const auto &[name, slot] : externs) {
		names.push_back(name);
	}
	return names;
}

Value Module::invokeExtern(const std::string &name, const std::vector<Value> &args) {
	ExternSlot slot;
	{
		std::lock_guard<std::mutex> lock(externMutex);
		auto it = externs.find(name);
		if (it != externs.end()) {
			slot = it->second;
		}
	}
	if (!slot.function) {
		throw ScriptError("Extern function '" + name + "' is not bound");
	}
	Value value = slot.function(args);
	if (slot.isAsync && !value.objectAs<TaskObject>()) {
		return Value(std::make_shared<TaskObject>(Task<Value>::fromResult(value)));
	}
	return value;
}

bool Module::hasFunction(const std::string &name) const {
	return functions.count(name) > 0;
}

Value Module::call(const std::string &function, const std::vector<Value> &args) {
	ensureInitialized();
	Interpreter interpreter(*this);
	return interpreter.callGlobal(function, args);
}

Value Module::global(const std::string &name) {
	ensureInitialized();
	Value value;
	if (!globals->lookup(name, value)) {
		throw ScriptError("Undefined global '" + name + "'");
	}
	return value;
}

void Module::setOutput(std::function<void(const std::string &)> sink) {
	std::lock_guard<std::mutex> lock(outputMutex);
	output = std::move(sink);
}

void Module::print(const std::string &text) {
	std::lock_guard<std::mutex> lock(outputMutex);
	if (output) {
		output(text);
	}
}

void Module::setExecutionContext(std::shared_ptr<ExecutionContext> executionContext) {
	context = std::move(executionContext);
}

std::shared_ptr<ExecutionContext> Module::executionContext() const {
	return context;
}

Task<Value> Module::spawn(std::shared_ptr<const FunctionObject> function, std::vector<Value> args) {
	TaskCompletionSource<Value> completion;
	Task<Value> task = completion.task();

	std::lock_guard<std::mutex> lock(threadsMutex);
	threads.emplace_back([function, args = std::move(args), completion]() mutable {
		try {
			Value value = function->call(args);
			// A spawned async function completes with its own task's result
			if (auto inner = value.objectAs<TaskObject>()) {
				value = inner->task().get();
			}
			completion.setResult(std::move(value));
		} catch (const std::exception &) {
			completion.setException(std::current_exception());
		}
	});
	return task;
}

} // namespace snap
