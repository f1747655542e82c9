#pragma once

#include "pulid/ulid/entropy.h"

#include <array>
#include <cstdint>
#include <mutex>

namespace pulid::ulid {

// MonotonicEntropy guarantees strictly increasing entropy for identifiers built within the
// same millisecond.
//
// - First read for a millisecond: 10 fresh bytes from the underlying source.
// - Later reads for the same millisecond: previous 80-bit value + random increment in
//   [1, increment]. An increment of 0 selects the default bound (2^32 - 1).
// - Exhausting the 80-bit space fails with kMonotonicOverflow.
//
// Not thread-safe; see LockedMonotonicEntropy. The underlying source must outlive this object.
class MonotonicEntropy final : public IEntropySource {
 public:
  static constexpr std::uint64_t kDefaultIncrement = 0xFFFFFFFFull;

  explicit MonotonicEntropy(IEntropySource& source, std::uint64_t increment = 0);
  ~MonotonicEntropy() override = default;

  MonotonicEntropy(const MonotonicEntropy&) = delete;
  MonotonicEntropy& operator=(const MonotonicEntropy&) = delete;
  MonotonicEntropy(MonotonicEntropy&&) = delete;
  MonotonicEntropy& operator=(MonotonicEntropy&&) = delete;

  [[nodiscard]] core::Status read(std::uint64_t ms, std::span<std::uint8_t> out) override;

  [[nodiscard]] std::uint64_t increment() const { return increment_; }

 private:
  // 80-bit unsigned integer: hi holds the top 16 bits.
  struct Uint80 {
    std::uint16_t hi{0};
    std::uint64_t lo{0};

    [[nodiscard]] bool is_zero() const { return hi == 0 && lo == 0; }
    void set_bytes(std::span<const std::uint8_t> bytes);
    void append_to(std::span<std::uint8_t> bytes) const;
    // Returns true on overflow.
    bool add(std::uint64_t n);
  };

  [[nodiscard]] core::Result<std::uint64_t, core::Error> random_increment();

  IEntropySource& source_;
  std::uint64_t increment_;
  std::uint64_t ms_{0};
  Uint80 entropy_;
};

// Thread-safe MonotonicEntropy: every read is serialized with a std::mutex so that
// concurrent callers in the same millisecond observe strictly increasing values.
class LockedMonotonicEntropy final : public IEntropySource {
 public:
  explicit LockedMonotonicEntropy(IEntropySource& source, std::uint64_t increment = 0)
      : inner_(source, increment) {}
  ~LockedMonotonicEntropy() override = default;

  // Disable copy/move (mutex not copyable)
  LockedMonotonicEntropy(const LockedMonotonicEntropy&) = delete;
  LockedMonotonicEntropy& operator=(const LockedMonotonicEntropy&) = delete;
  LockedMonotonicEntropy(LockedMonotonicEntropy&&) = delete;
  LockedMonotonicEntropy& operator=(LockedMonotonicEntropy&&) = delete;

  [[nodiscard]] core::Status read(std::uint64_t ms, std::span<std::uint8_t> out) override;

 private:
  std::mutex mutex_;
  MonotonicEntropy inner_;
};

}  // namespace pulid::ulid
