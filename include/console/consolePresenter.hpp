#pragma once

#include "console/variableNode.hpp"
#include "debugger/breakpointPresenter.hpp"
#include "debugger/sourceView.hpp"

#include <deque>
#include <iosfwd>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace snap {

/**
 * @brief Text front end for a paused breakpoint
 *
 * Commands: vars, show <path>, nonpublic, source, refs, continue, ignore,
 * help. A scripted presenter takes its commands from setScript() and
 * continues once they run out; otherwise end of input continues.
 */
class ConsolePresenter : public BreakpointPresenter {
public:
  ConsolePresenter(std::istream &in, std::ostream &out);

  void setScript(std::vector<std::string> commands);
  // Source shown for in-process breakpoints
  void setSource(std::shared_ptr<const SourceView> source) { localSource = std::move(source); }

  void show(const BreakpointInfo &info, std::function<void(bool)> resume) override;

  // Run one paused session; returns true to ignore further hits
  bool present(int64_t offset, const SourceView &source,
               const std::vector<std::shared_ptr<VariableNode>> &roots);

  // "a;b; c" -> {"a", "b", "c"}
  static std::vector<std::string> splitScript(const std::string &script);

private:
  std::istream &in;
  std::ostream &out;
  bool scripted{};
  std::deque<std::string> script;
  bool showNonPublic{};
  std::shared_ptr<const SourceView> localSource;

  std::optional<std::string> nextCommand();
  void printVariables(const std::vector<std::shared_ptr<VariableNode>> &roots);
  void printNode(const std::string &path, VariableNode &node);
  std::shared_ptr<VariableNode> resolve(const std::vector<std::shared_ptr<VariableNode>> &roots,
                                        const std::string &path);
  void printHelp();
};

} // namespace snap
