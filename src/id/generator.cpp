#include "pulid/id/generator.h"

#include "pulid/ulid/monotonic_entropy.h"

namespace pulid::id {

namespace {

core::Result<Pulid, core::Error> create_at(const std::string_view prefix, const std::int64_t ms,
                                           ulid::IEntropySource& entropy) {
  if (ms < 0) {
    return core::Result<Pulid, core::Error>::err(
        core::make_error(core::ErrorCode::kTimestampOverflow));
  }
  return Pulid::create(prefix, static_cast<std::uint64_t>(ms), entropy);
}

}  // namespace

core::Result<Pulid, core::Error> PulidGenerator::next(const std::string_view prefix) {
  std::lock_guard<std::mutex> lock(mutex_);
  const std::uint64_t now = clock_.now_unix_ms();
  if (now > last_ms_) {
    last_ms_ = now;
  }
  return Pulid::create(prefix, last_ms_, entropy_);
}

IPulidGenerator& default_generator() {
  // Function-local statics: initialization is thread-safe and ordered (source before wrapper).
  static core::SystemClock clock;
  static ulid::RandomEntropy random;
  static ulid::LockedMonotonicEntropy entropy(random);
  static PulidGenerator generator(clock, entropy);
  return generator;
}

core::Result<Pulid, core::Error> make(const std::string_view prefix) {
  return default_generator().next(prefix);
}

core::Result<Pulid, core::Error> new_pulid(const std::string_view prefix,
                                           const core::Timestamp time,
                                           ulid::IEntropySource& entropy) {
  return create_at(prefix, core::to_unix_millis(time), entropy);
}

core::Result<Pulid, core::Error> new_pulid(const std::string_view prefix,
                                           const core::TimestampMs time,
                                           ulid::IEntropySource& entropy) {
  return create_at(prefix, core::to_unix_millis(time), entropy);
}

}  // namespace pulid::id
