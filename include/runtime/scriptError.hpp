#pragma once

#include "lexer/sourceLocation.hpp"

#include <stdexcept>
#include <string>

namespace snap {

// Raised when a script fails at run time
class ScriptError : public std::runtime_error {
public:
  explicit ScriptError(const std::string &message, SourceLocation location = {})
      : std::runtime_error(format(message, location)), text(message),
        where(std::move(location)) {}

  // Message without the location prefix
  const std::string &message() const { return text; }
  const SourceLocation &location() const { return where; }

private:
  std::string text;
  SourceLocation where;

  static std::string format(const std::string &message,
                            const SourceLocation &location) {
    if (!location.isKnown()) {
      return message;
    }
    return location.toString() + ": " + message;
  }
};

} // namespace snap
