#pragma once

#include <string>

namespace skyread {

/*
 * Installs a handler for fatal and termination signals. The handler prints the signal and, in debug builds, a
 * stacktrace to stderr. It then restores the default disposition and raises the signal again.
 */
void RegisterSignalHandler();

/*
 * Restores the default signal handling behavior.
 */
void DeregisterSignalHandler();

/*
 * E.g., "SIGSEGV".
 */
std::string SignalToString(int signal_number);

}  // namespace skyread
