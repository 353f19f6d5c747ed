#pragma once

#include "collab/Types.hpp"

namespace collab::util {

class Clock {
public:
  virtual ~Clock() = default;
  virtual Timestamp now() const = 0;
};

class SystemClock final : public Clock {
public:
  Timestamp now() const override { return std::chrono::system_clock::now(); }
};

// Process-wide wall clock used when no clock is injected.
inline const Clock& systemClock() {
  static SystemClock c;
  return c;
}

} // namespace collab::util
