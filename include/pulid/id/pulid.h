#pragma once

#include "pulid/core/error.h"
#include "pulid/core/time.h"
#include "pulid/ulid/ulid.h"

#include <array>
#include <compare>
#include <cstddef>
#include <cstdint>
#include <functional>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace pulid::id {

// Pulid is a prefixed ULID: a caller-chosen 2-byte category prefix followed by a 16-byte ULID.
//
// Layout (18 bytes, no header):
//   [0, 2)   prefix     opaque bytes, not validated
//   [2, 8)   timestamp  big-endian Unix milliseconds (48 bits)
//   [8, 18)  entropy    random or caller-set bytes
//
// Byte-wise order equals (prefix, timestamp, entropy) order, so identifiers are time-sortable
// only within a shared prefix.
//
// Canonical text form is 28 characters: the two prefix bytes verbatim followed by the
// 26-character base32 encoding of the ULID, e.g. "PR01AN4Z07BY79KA1307SR9X4MV3".
// The all-zero value (nil) encodes as 28 '0' characters and that text decodes back to nil.
class Pulid {
 public:
  using Bytes = std::array<std::uint8_t, 18>;

  static constexpr std::size_t kSize = 18;
  static constexpr std::size_t kPrefixSize = 2;
  static constexpr std::size_t kEncodedSize = 28;

  constexpr Pulid() = default;
  explicit constexpr Pulid(const Bytes& bytes) : bytes_(bytes) {}
  Pulid(std::span<const std::uint8_t, kPrefixSize> prefix, const ulid::Ulid& ulid);

  // The distinguished all-zero identifier.
  [[nodiscard]] static constexpr Pulid nil() { return Pulid{}; }

  // Builds prefix || big-endian-48-bit(ms) || 10 bytes from entropy.
  //
  // Errors:
  //   kPrefixLength      prefix.size() != 2
  //   kTimestampOverflow ms > ulid::kMaxTime
  //   entropy errors     propagated unchanged
  [[nodiscard]] static core::Result<Pulid, core::Error> create(std::string_view prefix,
                                                               std::uint64_t ms,
                                                               ulid::IEntropySource& entropy);

  // Lenient text decode. Fails only with kDataSize when text.size() != 28. Characters outside
  // the base32 alphabet yield a well-defined but meaningless value.
  [[nodiscard]] static core::Result<Pulid, core::Error> parse(std::string_view text);

  // Strict text decode: also fails with kInvalidCharacter for characters outside the alphabet
  // in the last 26 positions, and kTimestampOverflow for encodings wider than 128 bits.
  [[nodiscard]] static core::Result<Pulid, core::Error> parse_strict(std::string_view text);

  // Binary decode: any 18 bytes are accepted. Fails with kDataSize otherwise.
  [[nodiscard]] static core::Result<Pulid, core::Error> from_bytes(
      std::span<const std::uint8_t> data);

  [[nodiscard]] bool is_nil() const { return *this == nil(); }

  [[nodiscard]] const Bytes& bytes() const { return bytes_; }
  [[nodiscard]] ulid::Ulid ulid() const;

  [[nodiscard]] std::string prefix() const;
  [[nodiscard]] std::array<std::uint8_t, kPrefixSize> prefix_bytes() const;

  [[nodiscard]] std::uint64_t timestamp_ms() const;
  [[nodiscard]] core::TimestampMs timestamp() const;
  // Rewrites bytes [2, 8). Fails with kTimestampOverflow when ms > ulid::kMaxTime.
  [[nodiscard]] core::Status set_timestamp_ms(std::uint64_t ms);

  [[nodiscard]] std::array<std::uint8_t, ulid::kEntropySize> entropy() const;
  // Rewrites bytes [8, 18). Fails with kDataSize when entropy.size() != 10.
  [[nodiscard]] core::Status set_entropy(std::span<const std::uint8_t> entropy);

  // Text codec
  [[nodiscard]] std::string to_string() const;
  [[nodiscard]] core::Status marshal_text_to(std::span<char> dst) const;
  [[nodiscard]] core::Status unmarshal_text(std::string_view text);

  // Binary codec
  [[nodiscard]] std::vector<std::uint8_t> marshal_binary() const;
  [[nodiscard]] core::Status marshal_binary_to(std::span<std::uint8_t> dst) const;
  [[nodiscard]] core::Status unmarshal_binary(std::span<const std::uint8_t> data);

  // Returns -1, 0 or +1 comparing the 18 bytes as unsigned values.
  [[nodiscard]] int compare(const Pulid& other) const;

  auto operator<=>(const Pulid&) const = default;

 private:
  [[nodiscard]] static core::Result<Pulid, core::Error> decode_text(std::string_view text,
                                                                    bool strict);

  Bytes bytes_{};
};

}  // namespace pulid::id

namespace std {

template <>
struct hash<pulid::id::Pulid> {
  std::size_t operator()(const pulid::id::Pulid& id) const noexcept {
    // FNV-1a over the raw bytes.
    std::uint64_t value = 14695981039346656037ull;
    for (const std::uint8_t byte : id.bytes()) {
      value ^= byte;
      value *= 1099511628211ull;
    }
    return static_cast<std::size_t>(value);
  }
};

}  // namespace std
