#pragma once

#include <chrono>

namespace snap {

struct DebuggerOptions {
  // How long to wait for the other process to open its pipe ends and
  // complete the handshake
  std::chrono::milliseconds connectTimeout{10000};
  // Sleep between connection attempts and liveness checks
  std::chrono::milliseconds pollInterval{20};
  // How long a disposed peer gets to exit on its own before it is killed
  std::chrono::milliseconds shutdownTimeout{1000};
  bool debug{};
};

} // namespace snap
