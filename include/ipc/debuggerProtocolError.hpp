#pragma once

#include <stdexcept>
#include <string>

namespace snap {

// The debugger process pair could not be set up or broke its protocol
class DebuggerProtocolError : public std::runtime_error {
public:
  explicit DebuggerProtocolError(const std::string &message)
      : std::runtime_error(message) {}
};

} // namespace snap
