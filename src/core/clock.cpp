#include "pulid/core/clock.h"

#include <chrono>

namespace pulid::core {

std::uint64_t SystemClock::now_unix_ms() {
  const auto now = std::chrono::system_clock::now().time_since_epoch();
  return static_cast<std::uint64_t>(
      std::chrono::duration_cast<std::chrono::milliseconds>(now).count());
}

std::uint64_t FixedClock::now_unix_ms() {
  return fixed_ms_.load(std::memory_order_relaxed);
}

}  // namespace pulid::core
