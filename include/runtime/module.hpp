#pragma once

#include "ast/ast.hpp"
#include "runtime/executionContext.hpp"
#include "runtime/scriptObjects.hpp"
#include "runtime/value.hpp"

#include <functional>
#include <map>
#include <memory>
#include <mutex>
#include <string>
#include <thread>
#include <vector>

namespace snap {

class Environment;
struct ClassInfo;

/**
 * @brief A compiled, loadable SnapScript unit
 *
 * Owns the syntax trees it was built from, the global environment and the
 * extern slots. Global initializers run on the first call. Always held by
 * shared_ptr: script objects refer back to their module.
 */
class Module {
public:
  explicit Module(std::vector<std::unique_ptr<Program>> units);
  ~Module();

  Module(const Module &) = delete;
  Module &operator=(const Module &) = delete;

  // Bind a declared `extern func`; throws std::invalid_argument for an
  // unknown name
  void bindExtern(const std::string &name, NativeFunction function);
  bool isBound(const std::string &name) const;
  std::vector<std::string> externNames() const;

  bool hasFunction(const std::string &name) const;

  // Call a global function on the calling thread
  Value call(const std::string &function, const std::vector<Value> &args = {});

  // Read a global variable; throws ScriptError when it does not exist
  Value global(const std::string &name);

  // Where `print` writes; standard output by default
  void setOutput(std::function<void(const std::string &)> output);

  // UI thread that `await` must pump instead of block; optional
  void setExecutionContext(std::shared_ptr<ExecutionContext> context);
  std::shared_ptr<ExecutionContext> executionContext() const;

private:
  friend class Interpreter;

  struct ExternSlot {
    bool isAsync{};
    NativeFunction function;
  };

  std::vector<std::unique_ptr<Program>> programs;
  std::shared_ptr<Environment> globals;
  std::map<std::string, std::shared_ptr<const ClassInfo>> classes;
  std::map<std::string, const FunctionDecl *> functions;

  mutable std::mutex externMutex;
  std::map<std::string, ExternSlot> externs;

  std::once_flag initialized;

  mutable std::mutex outputMutex;
  std::function<void(const std::string &)> output;
  std::shared_ptr<ExecutionContext> context;

  std::mutex threadsMutex;
  std::vector<std::thread> threads;

  void registerDeclarations();
  void initializeGlobals();
  void ensureInitialized();

  Value invokeExtern(const std::string &name, const std::vector<Value> &args);
  void print(const std::string &text);
  Task<Value> spawn(std::shared_ptr<const FunctionObject> function,
                    std::vector<Value> args);
};

} // namespace snap
