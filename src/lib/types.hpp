#pragma once

#include <cstdint>
#include <limits>

namespace skyread {

class Noncopyable {
 public:
  Noncopyable() = default;
  Noncopyable(const Noncopyable&) = delete;
  Noncopyable(Noncopyable&&) noexcept = default;

  Noncopyable& operator=(Noncopyable&&) noexcept = default;
  const Noncopyable& operator=(const Noncopyable&) = delete;

  ~Noncopyable() = default;
};

using TaskId = uint32_t;

inline constexpr TaskId kInvalidTaskId = std::numeric_limits<TaskId>::max();

}  // namespace skyread
