#include "utils/signal_handler.hpp"

#include <csignal>

#include <gtest/gtest.h>

namespace skyread {

TEST(SignalHandlerTest, SignalToString) {
  EXPECT_EQ(SignalToString(SIGSEGV), "SIGSEGV");
  EXPECT_EQ(SignalToString(SIGTERM), "SIGTERM");
  EXPECT_EQ(SignalToString(SIGABRT), "SIGABRT");
  EXPECT_EQ(SignalToString(0), "UNKNOWN(0)");
}

TEST(SignalHandlerTest, RegisterAndDeregister) {
  RegisterSignalHandler();
  DeregisterSignalHandler();

  // The default disposition of SIGTERM is restored.
  struct sigaction action {};
  ASSERT_EQ(sigaction(SIGTERM, nullptr, &action), 0);
  EXPECT_EQ(action.sa_handler, SIG_DFL);
}

}  // namespace skyread
