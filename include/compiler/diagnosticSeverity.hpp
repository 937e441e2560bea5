#pragma once

namespace snap {

enum class DiagnosticSeverity { Error = 1, Warning = 2, Information = 3, Hint = 4 };

} // namespace snap
