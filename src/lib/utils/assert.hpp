#pragma once

#include <stdexcept>
#include <string>

#include "string.hpp"

/**
 * Assertions used throughout skyread instead of the std cassert/assert.h.
 *
 * --> Assert(condition, msg) checks an invariant in all build types. Use it when the check is cheap or the invariant
 *     is considered very important, e.g., legal task state transitions.
 *
 * --> DebugAssert(condition, msg) checks an invariant in debug builds (SKYREAD_DEBUG) only.
 *
 * --> Fail(msg) marks an illegal code path, e.g., the default branch of an exhaustive switch.
 *
 * --> AssertInput(condition, msg) and FailInput(msg) reject wrong user input, e.g., malformed CLI options. They throw
 *     an InvalidInputException so that callers can tell input errors apart from programming errors.
 *
 * Expected runtime failures of the object store (missing keys, denied access, network errors) are never reported
 * through these macros. They are returned as StorageError values.
 */

namespace skyread {

// Handles errors related to wrong user input.
class InvalidInputException : public std::runtime_error {
 public:
  explicit InvalidInputException(const std::string& what) : std::runtime_error(what) {}
};

namespace detail {

// The indirection allows throwing from destructors without compiler warnings.
[[noreturn]] inline void Fail(const std::string& message) { throw std::logic_error(message); }

}  // namespace detail

#define Fail(message)                                                                                              \
  skyread::detail::Fail(skyread::TrimSourceFilePath(__FILE__) + ":" + std::to_string(__LINE__) + " " + (message)); \
  static_assert(true, "End macro call with a semicolon")

[[noreturn]] inline void FailInput(const std::string& message) {
  throw InvalidInputException(std::string("Error: Invalid input; ") + message);
}

}  // namespace skyread

#define Assert(expression, message)     \
  if (!static_cast<bool>(expression)) { \
    Fail(message);                      \
  }                                     \
  static_assert(true, "End macro call with a semicolon")

#define AssertInput(expression, message)      \
  if (!static_cast<bool>(expression)) {       \
    skyread::FailInput(std::string(message)); \
  }                                           \
  static_assert(true, "End macro call with a semicolon")

#if SKYREAD_DEBUG
#define DebugAssert(expression, message) Assert(expression, message)
#else
#define DebugAssert(expression, message)
#endif
