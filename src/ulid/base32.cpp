#include "pulid/ulid/base32.h"

#include <algorithm>
#include <array>

namespace pulid::ulid {

namespace {

constexpr std::uint8_t kInvalid = 0xFF;

// Byte -> 5-bit value lookup. Lower-case letters decode like upper-case ones.
// I, L, O and U are not part of the alphabet and are not aliased.
constexpr std::array<std::uint8_t, 256> build_decode_table() {
  std::array<std::uint8_t, 256> table{};
  for (auto& entry : table) {
    entry = kInvalid;
  }
  for (std::size_t i = 0; i < kAlphabet.size(); ++i) {
    const auto ch = static_cast<unsigned char>(kAlphabet[i]);
    table[ch] = static_cast<std::uint8_t>(i);
    if (ch >= 'A' && ch <= 'Z') {
      constexpr char kCaseOffset = 'a' - 'A';
      table[static_cast<unsigned char>(ch + kCaseOffset)] = static_cast<std::uint8_t>(i);
    }
  }
  return table;
}

constexpr std::array<std::uint8_t, 256> kDecode = build_decode_table();

}  // namespace

void encode_base32(std::span<const std::uint8_t, kBinarySize> src,
                   std::span<char, kEncodedSize> dst) noexcept {
  // Two implicit zero bits lead the 128-bit value so that 26 * 5 = 130 bits line up.
  std::uint32_t buffer = 0;
  unsigned bits = 2;
  std::size_t out = 0;

  for (const std::uint8_t byte : src) {
    buffer = (buffer << 8u) | byte;
    bits += 8;
    while (bits >= 5) {
      bits -= 5;
      dst[out++] = kAlphabet[(buffer >> bits) & 0x1Fu];
    }
  }
}

core::Status decode_base32(const std::string_view src, const bool strict,
                           std::span<std::uint8_t, kBinarySize> dst) {
  if (src.size() != kEncodedSize) {
    return core::Status::err(core::make_error(core::ErrorCode::kDataSize));
  }

  if (strict) {
    for (const char ch : src) {
      if (kDecode[static_cast<unsigned char>(ch)] == kInvalid) {
        return core::Status::err(core::make_error(core::ErrorCode::kInvalidCharacter));
      }
    }
    // The first character carries only 3 significant bits.
    if (kDecode[static_cast<unsigned char>(src[0])] > 7) {
      return core::Status::err(core::make_error(core::ErrorCode::kTimestampOverflow));
    }
  }

  std::array<std::uint8_t, kBinarySize> decoded{};
  std::uint32_t buffer = 0;
  unsigned bits = 0;
  std::size_t out = 0;

  for (std::size_t i = 0; i < src.size(); ++i) {
    // Out-of-alphabet characters keep their low 5 bits in lenient mode.
    const std::uint8_t value = kDecode[static_cast<unsigned char>(src[i])] & 0x1Fu;
    buffer = (buffer << 5u) | value;
    bits += 5;
    if (i == 0) {
      // Drop the two padding bits.
      buffer &= 0x07u;
      bits -= 2;
    }
    if (bits >= 8) {
      bits -= 8;
      decoded[out++] = static_cast<std::uint8_t>(buffer >> bits);
    }
  }

  std::copy(decoded.begin(), decoded.end(), dst.begin());
  return core::ok_status();
}

}  // namespace pulid::ulid
