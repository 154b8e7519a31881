#pragma once

namespace turbonet {

class SignalHandler {
 public:
  SignalHandler() noexcept = delete;

  // Sets up signal handlers for SIGINT and SIGTERM to request graceful shutdown.
  static void Enable();

  // Restores default behavior for SIGINT and SIGTERM.
  static void Disable();

  // Returns true if a termination signal was received.
  static bool IsStopRequested() noexcept;

  // Resets the stop-requested flag. Needed by forked workers, which inherit the parent's state.
  static void ResetStopRequest() noexcept;
};

}  // namespace turbonet
