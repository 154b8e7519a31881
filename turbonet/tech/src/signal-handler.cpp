#include "turbonet/signal-handler.hpp"

#include <csignal>

namespace {

volatile std::sig_atomic_t g_signalStatus{};

constexpr int kStopSignals[] = {SIGINT, SIGTERM};

void Install(void (*handler)(int)) {
  struct sigaction action{};
  action.sa_handler = handler;
  sigemptyset(&action.sa_mask);
  // no SA_RESTART: a blocking epoll_wait or waitpid returns EINTR and the flag is checked right away
  action.sa_flags = 0;
  for (int sigNum : kStopSignals) {
    ::sigaction(sigNum, &action, nullptr);
  }
}

}  // namespace

// Async-signal-safe only: the flag is polled by the event loops and the worker supervisor.
extern "C" void TurbonetSignalHandler(int sigNum) { g_signalStatus = sigNum; }

namespace turbonet {

void SignalHandler::Enable() { Install(::TurbonetSignalHandler); }

void SignalHandler::Disable() { Install(SIG_DFL); }

bool SignalHandler::IsStopRequested() noexcept { return g_signalStatus != 0; }

void SignalHandler::ResetStopRequest() noexcept { g_signalStatus = 0; }

}  // namespace turbonet
