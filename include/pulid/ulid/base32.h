#pragma once

#include "pulid/core/error.h"

#include <cstddef>
#include <cstdint>
#include <span>
#include <string_view>

namespace pulid::ulid {

// Crockford's base32 alphabet. Order-preserving: byte-wise order of the decoded
// value equals lexicographic order of the upper-case text.
inline constexpr std::string_view kAlphabet = "0123456789ABCDEFGHJKMNPQRSTVWXYZ";

inline constexpr std::size_t kBinarySize = 16;
inline constexpr std::size_t kEncodedSize = 26;

// encode_base32 writes the 26-character text form of 16 bytes.
// The 128-bit value is treated as 130 bits with two leading zero bits, 5 bits per character.
void encode_base32(std::span<const std::uint8_t, kBinarySize> src,
                   std::span<char, kEncodedSize> dst) noexcept;

// decode_base32 parses 26 characters into 16 bytes. Decoding is case-insensitive.
//
// Lenient mode (strict == false) fails only on a length mismatch (kDataSize). Characters
// outside the alphabet are mapped to an unspecified 5-bit value, so the output bytes are
// well-defined but carry no meaning.
//
// Strict mode additionally fails with kInvalidCharacter on any character outside the
// alphabet and with kTimestampOverflow when the first character is above '7' (the value
// would need more than 128 bits).
//
// dst is only written on success.
[[nodiscard]] core::Status decode_base32(std::string_view src, bool strict,
                                         std::span<std::uint8_t, kBinarySize> dst);

}  // namespace pulid::ulid
