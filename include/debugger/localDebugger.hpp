#pragma once

#include "debugger/breakpointController.hpp"
#include "debugger/breakpointPresenter.hpp"
#include "debugger/dispatcher.hpp"

#include <memory>

namespace snap {

// In-process debugging: breakpoints are shown by a presenter on the
// dispatcher thread while the script thread waits
class LocalDebugger {
public:
  LocalDebugger(std::shared_ptr<Dispatcher> dispatcher,
                std::shared_ptr<BreakpointPresenter> presenter);

  // Blocks the calling script thread until the presenter resumes
  BreakpointController::SyncCallback synchronousCallback() const;
  // Completes the returned task when the presenter resumes
  BreakpointController::AsyncCallback asynchronousCallback() const;

private:
  std::shared_ptr<Dispatcher> dispatcher;
  std::shared_ptr<BreakpointPresenter> presenter;
};

} // namespace snap
