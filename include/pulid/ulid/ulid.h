#pragma once

#include "pulid/core/error.h"
#include "pulid/core/time.h"

#include <array>
#include <compare>
#include <cstddef>
#include <cstdint>
#include <span>
#include <string>
#include <string_view>

namespace pulid::ulid {

class IEntropySource;

// Largest millisecond timestamp representable in the 48-bit time field.
inline constexpr std::uint64_t kMaxTime = (std::uint64_t{1} << 48) - 1;

inline constexpr std::size_t kTimeSize = 6;
inline constexpr std::size_t kEntropySize = 10;

// Ulid is the 16-byte sortable unique identifier embedded in every Pulid.
//
// Layout: 6 bytes big-endian Unix milliseconds followed by 10 bytes of entropy.
// Byte-wise comparison orders ULIDs by time, then by entropy.
// Value type: copyable, comparable, no owned resources.
class Ulid {
 public:
  using Bytes = std::array<std::uint8_t, 16>;

  static constexpr std::size_t kSize = 16;
  static constexpr std::size_t kEncodedSize = 26;

  constexpr Ulid() = default;
  explicit constexpr Ulid(const Bytes& bytes) : bytes_(bytes) {}

  // Builds a ULID from a timestamp and 10 bytes read from entropy.
  // Fails with kTimestampOverflow when ms > kMaxTime; entropy errors are propagated unchanged.
  [[nodiscard]] static core::Result<Ulid, core::Error> create(std::uint64_t ms,
                                                              IEntropySource& entropy);

  // Lenient text decode. See decode_base32.
  [[nodiscard]] static core::Result<Ulid, core::Error> parse(std::string_view text);
  // Strict text decode. See decode_base32.
  [[nodiscard]] static core::Result<Ulid, core::Error> parse_strict(std::string_view text);

  [[nodiscard]] const Bytes& bytes() const { return bytes_; }

  [[nodiscard]] std::string to_string() const;
  [[nodiscard]] core::Status marshal_text_to(std::span<char> dst) const;
  [[nodiscard]] core::Status marshal_binary_to(std::span<std::uint8_t> dst) const;
  [[nodiscard]] core::Status unmarshal_binary(std::span<const std::uint8_t> data);

  [[nodiscard]] std::uint64_t timestamp_ms() const;
  [[nodiscard]] core::TimestampMs timestamp() const;
  [[nodiscard]] core::Status set_timestamp_ms(std::uint64_t ms);

  [[nodiscard]] std::array<std::uint8_t, kEntropySize> entropy() const;
  [[nodiscard]] core::Status set_entropy(std::span<const std::uint8_t> entropy);

  // Returns -1, 0 or +1 comparing bytes lexicographically.
  [[nodiscard]] int compare(const Ulid& other) const;

  auto operator<=>(const Ulid&) const = default;

 private:
  Bytes bytes_{};
};

// Converts a time point to Unix milliseconds. Times before the epoch clamp to 0.
[[nodiscard]] std::uint64_t to_unix_ms(core::Timestamp ts);
[[nodiscard]] std::uint64_t to_unix_ms(core::TimestampMs ts);

// Converts Unix milliseconds to a time point.
[[nodiscard]] core::TimestampMs from_unix_ms(std::uint64_t ms);

// Current system time in Unix milliseconds.
[[nodiscard]] std::uint64_t now_ms();

}  // namespace pulid::ulid
