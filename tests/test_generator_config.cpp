#include "pulid/id/generator_config.h"
#include "pulid/ulid/ulid.h"

#include <catch2/catch.hpp>

#include <array>

using namespace pulid;
using namespace pulid::id;

// ── parse_entropy_mode ─────────────────────────────────────────────────────

TEST_CASE("parse_entropy_mode: accepted values", "[config]") {
  CHECK(parse_entropy_mode("monotonic") == EntropyMode::kMonotonic);
  CHECK(parse_entropy_mode("random") == EntropyMode::kRandom);
  CHECK(parse_entropy_mode("device") == EntropyMode::kDevice);
  CHECK(parse_entropy_mode("zero") == EntropyMode::kZero);
}

TEST_CASE("parse_entropy_mode: rejected values", "[config]") {
  CHECK_FALSE(parse_entropy_mode("").has_value());
  CHECK_FALSE(parse_entropy_mode("Monotonic").has_value());
  CHECK_FALSE(parse_entropy_mode("crypto").has_value());
}

// ── parse_generator_config ─────────────────────────────────────────────────

TEST_CASE("parse_generator_config: mode only uses defaults", "[config]") {
  const auto config = parse_generator_config("monotonic");
  REQUIRE(config.has_value());
  CHECK(config->entropy_mode == EntropyMode::kMonotonic);
  CHECK(config->monotonic_increment == 0);
  CHECK_FALSE(config->seed.has_value());
}

TEST_CASE("parse_generator_config: options", "[config]") {
  const auto config = parse_generator_config("monotonic;inc=1;seed=42");
  REQUIRE(config.has_value());
  CHECK(config->monotonic_increment == 1);
  REQUIRE(config->seed.has_value());
  CHECK(config->seed.value() == 42);

  const auto random = parse_generator_config("random;seed=7");
  REQUIRE(random.has_value());
  CHECK(random->entropy_mode == EntropyMode::kRandom);
  CHECK(random->seed == 7u);
}

TEST_CASE("parse_generator_config: rejected specs", "[config]") {
  CHECK_FALSE(parse_generator_config("").has_value());
  CHECK_FALSE(parse_generator_config("bogus").has_value());
  CHECK_FALSE(parse_generator_config("monotonic;").has_value());
  CHECK_FALSE(parse_generator_config("monotonic;inc").has_value());
  CHECK_FALSE(parse_generator_config("monotonic;inc=").has_value());
  CHECK_FALSE(parse_generator_config("monotonic;inc=-1").has_value());
  CHECK_FALSE(parse_generator_config("monotonic;inc=12x").has_value());
  CHECK_FALSE(parse_generator_config("monotonic;inc=1;inc=2").has_value());
  CHECK_FALSE(parse_generator_config("monotonic;color=1").has_value());
  CHECK_FALSE(parse_generator_config("random;inc=1").has_value());
  CHECK_FALSE(parse_generator_config("zero;seed=1").has_value());
}

// ── rendering ──────────────────────────────────────────────────────────────

TEST_CASE("generator_config_to_log_string: deterministic format", "[config]") {
  CHECK(generator_config_to_log_string(GeneratorConfig{}) ==
        "entropy=monotonic inc=default seed=random_device");

  GeneratorConfig seeded{EntropyMode::kMonotonic, 1, 42};
  CHECK(generator_config_to_log_string(seeded) == "entropy=monotonic inc=1 seed=42");

  GeneratorConfig random{EntropyMode::kRandom, 0, std::nullopt};
  CHECK(generator_config_to_log_string(random) == "entropy=random seed=random_device");

  GeneratorConfig zero{EntropyMode::kZero, 0, std::nullopt};
  CHECK(generator_config_to_log_string(zero) == "entropy=zero");
}

// ── make_entropy_source ────────────────────────────────────────────────────

TEST_CASE("make_entropy_source: zero mode", "[config]") {
  auto source = make_entropy_source(GeneratorConfig{EntropyMode::kZero, 0, std::nullopt});
  REQUIRE(source != nullptr);
  std::array<std::uint8_t, ulid::kEntropySize> out{};
  out.fill(1);
  REQUIRE(source->read(0, out).has_value());
  CHECK(out == std::array<std::uint8_t, ulid::kEntropySize>{});
}

TEST_CASE("make_entropy_source: seeded sources are reproducible", "[config]") {
  const GeneratorConfig config{EntropyMode::kRandom, 0, 123};
  auto a = make_entropy_source(config);
  auto b = make_entropy_source(config);

  std::array<std::uint8_t, ulid::kEntropySize> out_a{};
  std::array<std::uint8_t, ulid::kEntropySize> out_b{};
  REQUIRE(a->read(0, out_a).has_value());
  REQUIRE(b->read(0, out_b).has_value());
  CHECK(out_a == out_b);
}

TEST_CASE("make_entropy_source: monotonic mode counts within a millisecond", "[config]") {
  auto source = make_entropy_source(GeneratorConfig{EntropyMode::kMonotonic, 1, 5});
  std::array<std::uint8_t, ulid::kEntropySize> first{};
  std::array<std::uint8_t, ulid::kEntropySize> second{};
  REQUIRE(source->read(10, first).has_value());
  REQUIRE(source->read(10, second).has_value());
  CHECK(second > first);
}
