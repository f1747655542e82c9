#include "pulid/ulid/monotonic_entropy.h"

#include "pulid/ulid/ulid.h"

#include <array>

namespace pulid::ulid {

void MonotonicEntropy::Uint80::set_bytes(std::span<const std::uint8_t> bytes) {
  hi = static_cast<std::uint16_t>((bytes[0] << 8u) | bytes[1]);
  lo = 0;
  for (std::size_t i = 2; i < kEntropySize; ++i) {
    lo = (lo << 8u) | bytes[i];
  }
}

void MonotonicEntropy::Uint80::append_to(std::span<std::uint8_t> bytes) const {
  bytes[0] = static_cast<std::uint8_t>(hi >> 8u);
  bytes[1] = static_cast<std::uint8_t>(hi);
  for (std::size_t i = 0; i < 8u; ++i) {
    bytes[2 + i] = static_cast<std::uint8_t>(lo >> ((7u - i) * 8u));
  }
}

bool MonotonicEntropy::Uint80::add(const std::uint64_t n) {
  const std::uint64_t previous = lo;
  lo += n;
  if (lo < previous) {
    if (hi == 0xFFFFu) {
      return true;
    }
    ++hi;
  }
  return false;
}

MonotonicEntropy::MonotonicEntropy(IEntropySource& source, const std::uint64_t increment)
    : source_(source), increment_(increment == 0 ? kDefaultIncrement : increment) {}

core::Status MonotonicEntropy::read(const std::uint64_t ms, std::span<std::uint8_t> out) {
  if (out.size() != kEntropySize) {
    return core::Status::err(core::make_error(core::ErrorCode::kBufferSize));
  }

  if (!entropy_.is_zero() && ms_ == ms) {
    auto inc = random_increment();
    if (!inc.has_value()) {
      return core::Status::err(inc.error());
    }
    // State is only committed when the addition fits in 80 bits.
    Uint80 next = entropy_;
    if (next.add(inc.value())) {
      return core::Status::err(core::make_error(core::ErrorCode::kMonotonicOverflow));
    }
    entropy_ = next;
    entropy_.append_to(out);
    return core::ok_status();
  }

  auto fresh = source_.read(ms, out);
  if (!fresh.has_value()) {
    return fresh;
  }
  ms_ = ms;
  entropy_.set_bytes(out);
  return core::ok_status();
}

core::Result<std::uint64_t, core::Error> MonotonicEntropy::random_increment() {
  if (increment_ <= 1) {
    return core::Result<std::uint64_t, core::Error>::ok(1);
  }

  std::array<std::uint8_t, 8> raw{};
  auto read_result = source_.read(ms_, raw);
  if (!read_result.has_value()) {
    return core::Result<std::uint64_t, core::Error>::err(read_result.error());
  }

  std::uint64_t value = 0;
  for (const std::uint8_t byte : raw) {
    value = (value << 8u) | byte;
  }
  return core::Result<std::uint64_t, core::Error>::ok(1 + value % increment_);
}

core::Status LockedMonotonicEntropy::read(const std::uint64_t ms, std::span<std::uint8_t> out) {
  std::lock_guard<std::mutex> lock(mutex_);
  return inner_.read(ms, out);
}

}  // namespace pulid::ulid
