#pragma once

#include "pulid/ulid/entropy.h"

#include <cstdint>
#include <memory>
#include <optional>
#include <string>
#include <string_view>

namespace pulid::id {

// EntropyMode selects the entropy source behind a generator.
// kMonotonic: locked monotonic entropy over seeded pseudo-random bytes (default)
// kRandom   : pseudo-random bytes, no ordering guarantee within a millisecond
// kDevice   : std::random_device on every read
// kZero     : all-zero entropy (fixed values, tests)
enum class EntropyMode {
  kMonotonic,  // NOLINT(readability-identifier-naming)
  kRandom,     // NOLINT(readability-identifier-naming)
  kDevice,     // NOLINT(readability-identifier-naming)
  kZero,       // NOLINT(readability-identifier-naming)
};

// GeneratorConfig holds a parsed generator specification.
// Every field has an explicit default; optional fields mean "not configured".
struct GeneratorConfig {
  EntropyMode entropy_mode{EntropyMode::kMonotonic};  // NOLINT(readability-identifier-naming)
  // Upper bound of the random step between same-millisecond values; 0 selects the default.
  std::uint64_t monotonic_increment{0};  // NOLINT(readability-identifier-naming)
  // Seed for the pseudo-random engine; random_device seeding when absent.
  std::optional<std::uint64_t> seed;  // NOLINT(readability-identifier-naming)
};

// parse_entropy_mode accepts "monotonic", "random", "device" and "zero".
[[nodiscard]] std::optional<EntropyMode> parse_entropy_mode(std::string_view value);

[[nodiscard]] std::string_view entropy_mode_to_string(EntropyMode mode);

// parse_generator_config parses "mode[;inc=N][;seed=N]", e.g. "monotonic;inc=1;seed=42".
// Returns nullopt for an unknown mode, an unknown or repeated key, or a malformed number.
// "inc" is only accepted with the monotonic mode; "seed" only with monotonic and random.
[[nodiscard]] std::optional<GeneratorConfig> parse_generator_config(std::string_view spec);

// generator_config_to_log_string returns a deterministic, human-readable rendering for
// startup diagnostics, e.g. "entropy=monotonic inc=default seed=random_device".
[[nodiscard]] std::string generator_config_to_log_string(const GeneratorConfig& config);

// make_entropy_source builds the configured source. Monotonic sources own their underlying
// pseudo-random source and are safe for concurrent use.
[[nodiscard]] std::unique_ptr<ulid::IEntropySource> make_entropy_source(
    const GeneratorConfig& config);

}  // namespace pulid::id
