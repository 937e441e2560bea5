#pragma once

#include "compiler/diagnosticSeverity.hpp"

#include <string>
#include <vector>

namespace snap {

inline const char *severityName(DiagnosticSeverity severity) {
  switch (severity) {
  case DiagnosticSeverity::Error:
    return "error";
  case DiagnosticSeverity::Warning:
    return "warning";
  case DiagnosticSeverity::Information:
    return "info";
  case DiagnosticSeverity::Hint:
    return "hint";
  }
  return "error";
}

/**
 * @brief A problem found while compiling a document
 *
 * Positions refer to the source handed to the lexer, which for a Document
 * is its full source (pre source, text and post source).
 */
struct Diagnostic {
  std::string message;
  std::string filePath;
  int line;   // 1-based line, 0 when unknown
  int column; // 0-based start column
  DiagnosticSeverity severity;

  Diagnostic(std::string msg, std::string file = "", int lineNum = 0,
             int colNum = 0, DiagnosticSeverity sev = DiagnosticSeverity::Error)
      : message(std::move(msg)), filePath(std::move(file)), line(lineNum),
        column(colNum), severity(sev) {}

  bool isError() const { return severity == DiagnosticSeverity::Error; }

  // "file:3:5: error: message", the way compilers print it
  std::string toString() const {
    std::string text;
    if (!filePath.empty()) {
      text += filePath + ":";
    }
    if (line > 0) {
      text += std::to_string(line) + ":" + std::to_string(column + 1) + ":";
    }
    if (!text.empty()) {
      text += " ";
    }
    return text + severityName(severity) + ": " + message;
  }
};

inline bool hasErrors(const std::vector<Diagnostic> &diagnostics) {
  for (const auto &diagnostic : diagnostics) {
    if (diagnostic.isError()) {
      return true;
    }
  }
  return false;
}

} // namespace snap
