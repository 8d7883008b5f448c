#pragma once

namespace app {

/// Installs handlers for SIGSEGV, SIGFPE, SIGILL, SIGBUS and SIGABRT that
/// write the signal name and a stack trace to stderr, then re-raise
void InitializeCrashHandlers();

/// Stops the process with SIGSTOP when COOKD_WAIT_FOR_DEBUGGER is set
void WaitForDebuggerIfRequested();

}  // namespace app
