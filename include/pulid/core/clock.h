#pragma once

#include <atomic>
#include <cstdint>

namespace pulid::core {

// Abstract clock interface for timestamp injection.
// Allows production code to use system time while tests use fixed timestamps.
// Following C++ Core Guidelines I.25: Prefer abstract classes as interfaces to class hierarchies.
class IClock {
 public:
  virtual ~IClock() = default;

  // Return current time as Unix milliseconds (UTC).
  virtual std::uint64_t now_unix_ms() = 0;

 protected:
  IClock() = default;
  IClock(const IClock&) = default;
  IClock& operator=(const IClock&) = default;
  IClock(IClock&&) = default;
  IClock& operator=(IClock&&) = default;
};

// Production clock: returns actual system time.
class SystemClock final : public IClock {
 public:
  SystemClock() = default;
  ~SystemClock() override = default;

  SystemClock(const SystemClock&) = default;
  SystemClock& operator=(const SystemClock&) = default;
  SystemClock(SystemClock&&) = default;
  SystemClock& operator=(SystemClock&&) = default;

  std::uint64_t now_unix_ms() override;
};

// Fixed clock: returns a settable timestamp for deterministic tests.
// Thread-safe: the current value is atomic so tests may advance it while generating.
class FixedClock final : public IClock {
 public:
  explicit FixedClock(std::uint64_t fixed_ms) : fixed_ms_(fixed_ms) {}
  ~FixedClock() override = default;

  // Not copyable or movable (contains atomic)
  FixedClock(const FixedClock&) = delete;
  FixedClock& operator=(const FixedClock&) = delete;
  FixedClock(FixedClock&&) = delete;
  FixedClock& operator=(FixedClock&&) = delete;

  std::uint64_t now_unix_ms() override;

  void set(std::uint64_t ms) { fixed_ms_.store(ms, std::memory_order_relaxed); }
  void advance(std::uint64_t delta_ms) { fixed_ms_.fetch_add(delta_ms, std::memory_order_relaxed); }

 private:
  std::atomic<std::uint64_t> fixed_ms_;
};

}  // namespace pulid::core
