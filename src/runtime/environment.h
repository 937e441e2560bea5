#pragma once

#include "runtime/value.hpp"

#include <memory>
#include <mutex>
#include <string>
#include <unordered_map>

namespace snap {

// One lexical scope; closures keep their defining scope alive
class Environment {
public:
	explicit Environment(std::shared_ptr<Environment> parent = nullptr) : parent(std::move(parent)) {}

	void define(const std::string &name, Value value) {
		std::lock_guard<std::mutex> lock(mutex);
		values[name] = std::move(value);
	}

	// False when no enclosing scope declares name
	bool assign(const std::string &name, const Value &value) {
		for (Environment *env = this; env; env = env->parent.get()) {
			std::lock_guard<std::mutex> lock(env->mutex);
			auto it = env->values.find(name);
			if (it != env->values.end()) {
				it->second = value;
				return true;
			}
		}
		return false;
	}

	bool lookup(const std::string &name, Value &out) const {
		for (const Environment *env = this; env; env = env->parent.get()) {
			std::lock_guard<std::mutex> lock(env->mutex);
			auto it = env->values.find(name);
			if (it != env->values.end()) {
				out = it->second;
				return true;
			}
		}
		return false;
	}

private:
	mutable std::mutex mutex;
	std::unordered_map<std::string, Value> values;
	std::shared_ptr<Environment> parent;
};

} // namespace snap
