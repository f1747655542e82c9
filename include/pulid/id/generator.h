#pragma once

#include "pulid/core/clock.h"
#include "pulid/core/error.h"
#include "pulid/core/time.h"
#include "pulid/id/pulid.h"
#include "pulid/ulid/entropy.h"

#include <cstdint>
#include <mutex>
#include <string_view>

namespace pulid::id {

// Abstract PULID generator interface for dependency injection.
// Allows production code to use wall-clock, monotonic IDs while tests use deterministic ones.
// Following C++ Core Guidelines I.25: Prefer abstract classes as interfaces to class hierarchies.
class IPulidGenerator {
 public:
  virtual ~IPulidGenerator() = default;

  // Generate next ID with given prefix.
  // Contract: on success the returned ID starts with prefix.
  [[nodiscard]] virtual core::Result<Pulid, core::Error> next(std::string_view prefix) = 0;

 protected:
  IPulidGenerator() = default;
  IPulidGenerator(const IPulidGenerator&) = default;
  IPulidGenerator& operator=(const IPulidGenerator&) = default;
  IPulidGenerator(IPulidGenerator&&) = default;
  IPulidGenerator& operator=(IPulidGenerator&&) = default;
};

// PulidGenerator combines an injected clock and entropy source.
// Holds references (not ownership); both must outlive the generator.
// The clock read and the entropy read happen under one lock, and a clock reading older than
// the last one used is replaced by the last one. Generated timestamps therefore never go
// backwards, and with monotonic entropy every ID is greater than the one before it.
class PulidGenerator final : public IPulidGenerator {
 public:
  PulidGenerator(core::IClock& clock, ulid::IEntropySource& entropy)
      : clock_(clock), entropy_(entropy) {}
  ~PulidGenerator() override = default;

  PulidGenerator(const PulidGenerator&) = delete;
  PulidGenerator& operator=(const PulidGenerator&) = delete;
  PulidGenerator(PulidGenerator&&) = delete;
  PulidGenerator& operator=(PulidGenerator&&) = delete;

  [[nodiscard]] core::Result<Pulid, core::Error> next(std::string_view prefix) override;

 private:
  std::mutex mutex_;
  core::IClock& clock_;
  ulid::IEntropySource& entropy_;
  std::uint64_t last_ms_{0};
};

// Process-wide generator: system clock plus locked monotonic entropy over a randomly seeded
// RandomEntropy. Safe for concurrent use; IDs made with one prefix in the same millisecond
// compare strictly increasing.
[[nodiscard]] IPulidGenerator& default_generator();

// make builds a PULID for the current time with the process-wide generator.
[[nodiscard]] core::Result<Pulid, core::Error> make(std::string_view prefix);

// new_pulid maps a time point to Unix milliseconds and builds a PULID from it.
// Times before the epoch or beyond ulid::kMaxTime fail with kTimestampOverflow.
[[nodiscard]] core::Result<Pulid, core::Error> new_pulid(std::string_view prefix,
                                                         core::Timestamp time,
                                                         ulid::IEntropySource& entropy);
[[nodiscard]] core::Result<Pulid, core::Error> new_pulid(std::string_view prefix,
                                                         core::TimestampMs time,
                                                         ulid::IEntropySource& entropy);

}  // namespace pulid::id
