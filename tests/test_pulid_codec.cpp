#include "pulid/id/pulid.h"
#include "pulid/ulid/entropy.h"

#include <catch2/catch.hpp>

#include <algorithm>
#include <array>
#include <string>
#include <vector>

using namespace pulid;

// ── text codec ─────────────────────────────────────────────────────────────

TEST_CASE("Pulid text: reference example round-trips", "[codec][text]") {
  auto result = id::Pulid::parse_strict("PR01AN4Z07BY79KA1307SR9X4MV3");
  REQUIRE(result.has_value());

  const auto& pulid = result.value();
  CHECK(pulid.prefix() == "PR");
  CHECK(pulid.timestamp_ms() == 1465824320894ull);
  CHECK(pulid.to_string() == "PR01AN4Z07BY79KA1307SR9X4MV3");
}

TEST_CASE("Pulid text: encoding is always 28 upper-case characters", "[codec][text]") {
  auto lower = id::Pulid::parse("pr01an4z07by79ka1307sr9x4mv3");
  REQUIRE(lower.has_value());
  // Prefix is verbatim; the ULID part is re-encoded in upper case.
  CHECK(lower.value().to_string() == "pr01AN4Z07BY79KA1307SR9X4MV3");
  CHECK(lower.value().to_string().size() == id::Pulid::kEncodedSize);
}

TEST_CASE("Pulid text: prefix characters are not validated", "[codec][text]") {
  auto result = id::Pulid::parse_strict("#!01AN4Z07BY79KA1307SR9X4MV3");
  REQUIRE(result.has_value());
  CHECK(result.value().prefix() == "#!");
}

TEST_CASE("Pulid text: wrong length fails with kDataSize", "[codec][text]") {
  for (const std::string text : {"", "PR01AN4Z07BY79KA1307SR9X4MV", "PR01AN4Z07BY79KA1307SR9X4MV33"}) {
    auto lenient = id::Pulid::parse(text);
    REQUIRE_FALSE(lenient.has_value());
    CHECK(lenient.error().code == core::ErrorCode::kDataSize);

    auto strict = id::Pulid::parse_strict(text);
    REQUIRE_FALSE(strict.has_value());
    CHECK(strict.error().code == core::ErrorCode::kDataSize);
  }
}

TEST_CASE("Pulid text: strict rejects, lenient accepts invalid characters", "[codec][text]") {
  const std::string text = "PR01AN4Z07BY79KA1307SR9X4MU3";

  auto strict = id::Pulid::parse_strict(text);
  REQUIRE_FALSE(strict.has_value());
  CHECK(strict.error().code == core::ErrorCode::kInvalidCharacter);

  auto lenient = id::Pulid::parse(text);
  REQUIRE(lenient.has_value());
  CHECK(lenient.value().prefix() == "PR");
  CHECK(lenient.value().timestamp_ms() == 1465824320894ull);
}

TEST_CASE("Pulid text: strict rejects an overflowing time field", "[codec][text]") {
  auto strict = id::Pulid::parse_strict("PR8ZZZZZZZZZZZZZZZZZZZZZZZZZ");
  REQUIRE_FALSE(strict.has_value());
  CHECK(strict.error().code == core::ErrorCode::kTimestampOverflow);

  CHECK(id::Pulid::parse("PR8ZZZZZZZZZZZZZZZZZZZZZZZZZ").has_value());
}

TEST_CASE("Pulid text: marshal_text_to validates the buffer size", "[codec][text]") {
  ulid::ZeroEntropy zero;
  const auto pulid = id::Pulid::create("PR", 1, zero).value();

  std::array<char, 28> exact{};
  REQUIRE(pulid.marshal_text_to(exact).has_value());
  CHECK(std::string(exact.begin(), exact.end()) == pulid.to_string());

  std::array<char, 27> small{};
  auto too_small = pulid.marshal_text_to(small);
  REQUIRE_FALSE(too_small.has_value());
  CHECK(too_small.error().code == core::ErrorCode::kBufferSize);

  std::array<char, 29> large{};
  CHECK_FALSE(pulid.marshal_text_to(large).has_value());
}

TEST_CASE("Pulid text: unmarshal_text keeps the value on failure", "[codec][text]") {
  auto pulid = id::Pulid::parse("PR01AN4Z07BY79KA1307SR9X4MV3").value();
  const auto before = pulid;

  CHECK_FALSE(pulid.unmarshal_text("too short").has_value());
  CHECK(pulid == before);

  REQUIRE(pulid.unmarshal_text("US01AN4Z07BY79KA1307SR9X4MV3").has_value());
  CHECK(pulid.prefix() == "US");
}

TEST_CASE("Pulid text: round-trip across prefixes, times and entropy", "[codec][text]") {
  ulid::RandomEntropy random(2024);
  const std::vector<std::string> prefixes{"PR", "US", "zz", "0A", "~~"};
  const std::vector<std::uint64_t> times{1, 1000, 1465824320894ull, ulid::kMaxTime};

  for (const auto& prefix : prefixes) {
    for (const auto ms : times) {
      const auto pulid = id::Pulid::create(prefix, ms, random).value();
      auto lenient = id::Pulid::parse(pulid.to_string());
      auto strict = id::Pulid::parse_strict(pulid.to_string());
      REQUIRE(lenient.has_value());
      REQUIRE(strict.has_value());
      CHECK(lenient.value() == pulid);
      CHECK(strict.value() == pulid);
    }
  }
}

// ── nil ────────────────────────────────────────────────────────────────────

TEST_CASE("Pulid nil: encodes as 28 zeros and decodes back", "[codec][nil]") {
  const std::string zeros(28, '0');
  CHECK(id::Pulid::nil().to_string() == zeros);

  auto lenient = id::Pulid::parse(zeros);
  REQUIRE(lenient.has_value());
  CHECK(lenient.value().is_nil());

  auto strict = id::Pulid::parse_strict(zeros);
  REQUIRE(strict.has_value());
  CHECK(strict.value().is_nil());
}

TEST_CASE("Pulid nil: all-zero binary input is nil", "[codec][nil]") {
  const std::vector<std::uint8_t> zeros(18, 0);
  auto result = id::Pulid::from_bytes(zeros);
  REQUIRE(result.has_value());
  CHECK(result.value().is_nil());
  CHECK(result.value().to_string() == std::string(28, '0'));
}

TEST_CASE("Pulid nil: prefix \"00\" at time zero shares the nil text", "[codec][nil]") {
  ulid::ZeroEntropy zero;
  const auto zero_prefixed = id::Pulid::create("00", 0, zero).value();
  REQUIRE_FALSE(zero_prefixed.is_nil());
  CHECK(zero_prefixed.prefix_bytes()[0] == '0');

  // Its text form is the nil text, which always decodes to nil.
  CHECK(zero_prefixed.to_string() == std::string(28, '0'));
  CHECK(id::Pulid::parse(zero_prefixed.to_string()).value().is_nil());
  CHECK(id::Pulid::parse_strict(zero_prefixed.to_string()).value().is_nil());

  // The binary form keeps the two apart.
  const auto restored = id::Pulid::from_bytes(zero_prefixed.marshal_binary()).value();
  CHECK(restored == zero_prefixed);
}

// ── binary codec ───────────────────────────────────────────────────────────

TEST_CASE("Pulid binary: marshal returns the raw 18 bytes", "[codec][binary]") {
  const auto pulid = id::Pulid::parse("PR01AN4Z07BY79KA1307SR9X4MV3").value();
  const auto bytes = pulid.marshal_binary();
  REQUIRE(bytes.size() == id::Pulid::kSize);
  CHECK(std::equal(bytes.begin(), bytes.end(), pulid.bytes().begin()));

  auto decoded = id::Pulid::from_bytes(bytes);
  REQUIRE(decoded.has_value());
  CHECK(decoded.value() == pulid);
}

TEST_CASE("Pulid binary: size checks", "[codec][binary]") {
  const auto pulid = id::Pulid::parse("PR01AN4Z07BY79KA1307SR9X4MV3").value();

  SECTION("marshal_binary_to requires exactly 18 bytes") {
    std::array<std::uint8_t, 18> exact{};
    CHECK(pulid.marshal_binary_to(exact).has_value());

    std::array<std::uint8_t, 16> small{};
    auto result = pulid.marshal_binary_to(small);
    REQUIRE_FALSE(result.has_value());
    CHECK(result.error().code == core::ErrorCode::kBufferSize);
  }

  SECTION("unmarshal_binary requires exactly 18 bytes") {
    auto copy = pulid;
    const std::vector<std::uint8_t> ulid_only(16, 0x01);
    auto result = copy.unmarshal_binary(ulid_only);
    REQUIRE_FALSE(result.has_value());
    CHECK(result.error().code == core::ErrorCode::kDataSize);
    CHECK(copy == pulid);
  }
}

TEST_CASE("Pulid binary: any 18 bytes are accepted", "[codec][binary]") {
  std::vector<std::uint8_t> bytes(18, 0xFF);
  auto result = id::Pulid::from_bytes(bytes);
  REQUIRE(result.has_value());
  CHECK(result.value().timestamp_ms() == ulid::kMaxTime);
  CHECK(result.value().to_string().substr(2) == "7ZZZZZZZZZZZZZZZZZZZZZZZZZ");
}
