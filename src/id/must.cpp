#include "pulid/id/must.h"

#include "pulid/id/generator.h"

namespace pulid::id {

Pulid must_new(const std::string_view prefix, const std::uint64_t ms,
               ulid::IEntropySource& entropy) {
  return unwrap(Pulid::create(prefix, ms, entropy));
}

Pulid must_new_pulid(const std::string_view prefix, const core::Timestamp time,
                     ulid::IEntropySource& entropy) {
  return unwrap(new_pulid(prefix, time, entropy));
}

Pulid must_new_pulid(const std::string_view prefix, const core::TimestampMs time,
                     ulid::IEntropySource& entropy) {
  return unwrap(new_pulid(prefix, time, entropy));
}

Pulid must_make(const std::string_view prefix) {
  return unwrap(make(prefix));
}

Pulid must_parse(const std::string_view text) {
  return unwrap(Pulid::parse(text));
}

Pulid must_parse_strict(const std::string_view text) {
  return unwrap(Pulid::parse_strict(text));
}

}  // namespace pulid::id
