#pragma once

#include "runtime/object.hpp"
#include "runtime/task.hpp"

#include <functional>
#include <mutex>
#include <string>
#include <vector>

namespace snap {

// Mutable list; the only enumerable built into the language
class ListObject : public Object {
public:
  ListObject() = default;
  explicit ListObject(std::vector<Value> elements)
      : elements(std::move(elements)) {}

  std::string typeName() const override { return "List"; }
  std::vector<MemberInfo> members() const override;
  Value getMember(const std::string &name, bool isProperty) const override;

  bool isEnumerable() const override { return true; }
  std::vector<Value> items() const override;
  std::optional<size_t> count() const override;

  std::string toString() const override;

  Value at(int64_t index) const;
  void set(int64_t index, Value value);
  void add(Value value);
  size_t size() const;

private:
  mutable std::mutex mutex;
  std::vector<Value> elements;
};

// Anything that can be called: script functions, lambdas, builtins, externs
class FunctionObject : public Object {
public:
  std::string typeName() const override { return "Func"; }
  ObjectKind kind() const override { return ObjectKind::Delegate; }
  std::vector<MemberInfo> members() const override;
  Value getMember(const std::string &name, bool isProperty) const override;

  virtual std::string name() const = 0;
  virtual Value call(const std::vector<Value> &args) const = 0;
};

using NativeFunction = std::function<Value(const std::vector<Value> &)>;

class NativeFunctionObject : public FunctionObject {
public:
  NativeFunctionObject(std::string name, NativeFunction function)
      : functionName(std::move(name)), function(std::move(function)) {}

  std::string name() const override { return functionName; }
  Value call(const std::vector<Value> &args) const override {
    return function(args);
  }

private:
  std::string functionName;
  NativeFunction function;
};

// Result of an async function, `spawn` or `delay`
class TaskObject : public Object {
public:
  explicit TaskObject(Task<Value> task) : pending(std::move(task)) {}

  std::string typeName() const override { return "Task"; }
  std::vector<MemberInfo> members() const override;
  Value getMember(const std::string &name, bool isProperty) const override;

  const Task<Value> &task() const { return pending; }

private:
  Task<Value> pending;
};

} // namespace snap
