#pragma once

#include "pulid/core/error.h"
#include "pulid/core/time.h"
#include "pulid/id/pulid.h"
#include "pulid/ulid/entropy.h"

#include <stdexcept>
#include <utility>
#include <string_view>

namespace pulid::id {

// PulidException is thrown by the must_* convenience layer.
// The fallible Result-returning operations remain the primary API.
class PulidException : public std::runtime_error {
 public:
  explicit PulidException(core::Error error)
      : std::runtime_error(error.message), error_(std::move(error)) {}

  [[nodiscard]] const core::Error& error() const noexcept { return error_; }

 private:
  core::Error error_;
};

// unwrap returns the value or throws PulidException carrying the error.
template <typename T>
[[nodiscard]] T unwrap(const core::Result<T, core::Error>& result) {
  if (!result.has_value()) {
    throw PulidException(result.error());
  }
  return result.value();
}

[[nodiscard]] Pulid must_new(std::string_view prefix, std::uint64_t ms,
                             ulid::IEntropySource& entropy);
[[nodiscard]] Pulid must_new_pulid(std::string_view prefix, core::Timestamp time,
                                   ulid::IEntropySource& entropy);
[[nodiscard]] Pulid must_new_pulid(std::string_view prefix, core::TimestampMs time,
                                   ulid::IEntropySource& entropy);
[[nodiscard]] Pulid must_make(std::string_view prefix);
[[nodiscard]] Pulid must_parse(std::string_view text);
[[nodiscard]] Pulid must_parse_strict(std::string_view text);

}  // namespace pulid::id
