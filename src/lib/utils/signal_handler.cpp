#include "signal_handler.hpp"

#include <array>
#include <csignal>
#include <iostream>

#include <boost/stacktrace.hpp>

#include "constants.hpp"

namespace skyread {

namespace {

constexpr std::array<int, 6> kSignalNumbers{SIGTERM, SIGSEGV, SIGINT, SIGILL, SIGABRT, SIGFPE};

void HandleSignal(int signal_number) {
  std::cerr << kBaseTag << "\tSignal received: " << SignalToString(signal_number) << '\n';
#if SKYREAD_DEBUG
  std::cerr << boost::stacktrace::stacktrace(0, 15);
#endif
  std::cerr << std::flush;

  std::signal(signal_number, SIG_DFL);
  std::raise(signal_number);
}

}  // namespace

void RegisterSignalHandler() {
  for (const auto signal_number : kSignalNumbers) {
    std::signal(signal_number, HandleSignal);
  }
}

void DeregisterSignalHandler() {
  for (const auto signal_number : kSignalNumbers) {
    std::signal(signal_number, SIG_DFL);
  }
}

std::string SignalToString(int signal_number) {
  switch (signal_number) {
    case SIGTERM:
      return "SIGTERM";
    case SIGSEGV:
      return "SIGSEGV";
    case SIGINT:
      return "SIGINT";
    case SIGILL:
      return "SIGILL";
    case SIGABRT:
      return "SIGABRT";
    case SIGFPE:
      return "SIGFPE";
    default:
      return "UNKNOWN(" + std::to_string(signal_number) + ")";
  }
}

}  // namespace skyread
