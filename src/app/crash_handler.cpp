#include "app/crash_handler.hpp"

#include <cstdlib>

#ifdef __linux__
#include <csignal>
#include <iostream>
#include <stacktrace>
#include <unistd.h>
#endif

namespace app {

#ifdef __linux__
namespace {

constexpr auto kDebuggerWaitVariable = "COOKD_WAIT_FOR_DEBUGGER";

auto SignalName(int sig) -> const char* {
  switch (sig) {
    case SIGSEGV:
      return "SIGSEGV";
    case SIGFPE:
      return "SIGFPE";
    case SIGILL:
      return "SIGILL";
    case SIGBUS:
      return "SIGBUS";
    case SIGABRT:
      return "SIGABRT";
    default:
      return "unknown";
  }
}

void HandleFatalSignal(int sig) noexcept {
  std::signal(sig, SIG_DFL);

  std::cerr << "\ncookd: fatal signal " << SignalName(sig) << " (" << sig
            << ")\n";
  std::cerr << "Stack trace:\n";
  try {
    std::cerr << std::stacktrace::current() << "\n";
  } catch (const std::exception& e) {
    std::cerr << "(stack trace unavailable: " << e.what() << ")\n";
  }
  std::cerr.flush();

  ::raise(sig);
}

}  // namespace
#endif

void InitializeCrashHandlers() {
#ifdef __linux__
  for (int sig : {SIGSEGV, SIGFPE, SIGILL, SIGBUS, SIGABRT}) {
    std::signal(sig, HandleFatalSignal);
  }
#endif
}

void WaitForDebuggerIfRequested() {
#ifdef __linux__
  if (std::getenv(kDebuggerWaitVariable) != nullptr) {
    std::raise(SIGSTOP);
  }
#endif
}

}  // namespace app
