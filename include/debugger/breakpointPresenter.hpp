#pragma once

#include "debugger/breakpointInfo.hpp"

#include <functional>

namespace snap {

/**
 * @brief User interface for a paused in-process breakpoint
 *
 * show() runs on the dispatcher thread. The presenter calls resume exactly
 * once, passing true to ignore further hits of the same breakpoint. It may
 * call it from within show() or later.
 */
class BreakpointPresenter {
public:
  virtual ~BreakpointPresenter() = default;
  virtual void show(const BreakpointInfo &info, std::function<void(bool)> resume) = 0;
};

} // namespace snap
