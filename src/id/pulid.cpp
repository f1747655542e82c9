#include "pulid/id/pulid.h"

#include "pulid/ulid/base32.h"

#include <algorithm>

namespace pulid::id {

namespace {

using PulidResult = core::Result<Pulid, core::Error>;

constexpr std::size_t kUlidOffset = Pulid::kPrefixSize;

bool is_nil_text(const std::string_view text) {
  return std::all_of(text.begin(), text.end(), [](const char ch) { return ch == '0'; });
}

}  // namespace

Pulid::Pulid(std::span<const std::uint8_t, kPrefixSize> prefix, const ulid::Ulid& ulid) {
  std::copy(prefix.begin(), prefix.end(), bytes_.begin());
  std::copy(ulid.bytes().begin(), ulid.bytes().end(), bytes_.begin() + kUlidOffset);
}

PulidResult Pulid::create(const std::string_view prefix, const std::uint64_t ms,
                          ulid::IEntropySource& entropy) {
  if (prefix.size() != kPrefixSize) {
    return PulidResult::err(core::make_error(core::ErrorCode::kPrefixLength));
  }

  auto ulid_result = ulid::Ulid::create(ms, entropy);
  if (!ulid_result.has_value()) {
    return PulidResult::err(ulid_result.error());
  }

  const std::array<std::uint8_t, kPrefixSize> prefix_bytes{static_cast<std::uint8_t>(prefix[0]),
                                                           static_cast<std::uint8_t>(prefix[1])};
  return PulidResult::ok(Pulid(prefix_bytes, ulid_result.value()));
}

PulidResult Pulid::parse(const std::string_view text) {
  return decode_text(text, false);
}

PulidResult Pulid::parse_strict(const std::string_view text) {
  return decode_text(text, true);
}

PulidResult Pulid::decode_text(const std::string_view text, const bool strict) {
  if (text.size() != kEncodedSize) {
    return PulidResult::err(core::make_error(core::ErrorCode::kDataSize));
  }

  // Counterpart of the nil special case in marshal_text_to.
  if (is_nil_text(text)) {
    return PulidResult::ok(nil());
  }

  ulid::Ulid::Bytes ulid_bytes{};
  auto decoded = ulid::decode_base32(text.substr(kPrefixSize), strict, ulid_bytes);
  if (!decoded.has_value()) {
    return PulidResult::err(decoded.error());
  }

  const std::array<std::uint8_t, kPrefixSize> prefix_bytes{static_cast<std::uint8_t>(text[0]),
                                                           static_cast<std::uint8_t>(text[1])};
  return PulidResult::ok(Pulid(prefix_bytes, ulid::Ulid(ulid_bytes)));
}

PulidResult Pulid::from_bytes(std::span<const std::uint8_t> data) {
  Pulid id;
  auto result = id.unmarshal_binary(data);
  if (!result.has_value()) {
    return PulidResult::err(result.error());
  }
  return PulidResult::ok(id);
}

ulid::Ulid Pulid::ulid() const {
  ulid::Ulid::Bytes ulid_bytes{};
  std::copy(bytes_.begin() + kUlidOffset, bytes_.end(), ulid_bytes.begin());
  return ulid::Ulid(ulid_bytes);
}

std::string Pulid::prefix() const {
  return std::string{static_cast<char>(bytes_[0]), static_cast<char>(bytes_[1])};
}

std::array<std::uint8_t, Pulid::kPrefixSize> Pulid::prefix_bytes() const {
  return {bytes_[0], bytes_[1]};
}

std::uint64_t Pulid::timestamp_ms() const {
  return ulid().timestamp_ms();
}

core::TimestampMs Pulid::timestamp() const {
  return ulid().timestamp();
}

core::Status Pulid::set_timestamp_ms(const std::uint64_t ms) {
  auto embedded = ulid();
  auto result = embedded.set_timestamp_ms(ms);
  if (!result.has_value()) {
    return result;
  }
  *this = Pulid(prefix_bytes(), embedded);
  return core::ok_status();
}

std::array<std::uint8_t, ulid::kEntropySize> Pulid::entropy() const {
  return ulid().entropy();
}

core::Status Pulid::set_entropy(std::span<const std::uint8_t> entropy) {
  auto embedded = ulid();
  auto result = embedded.set_entropy(entropy);
  if (!result.has_value()) {
    return result;
  }
  *this = Pulid(prefix_bytes(), embedded);
  return core::ok_status();
}

std::string Pulid::to_string() const {
  std::string text(kEncodedSize, '0');
  // Cannot fail: the buffer has the exact encoded size.
  (void)marshal_text_to(text);
  return text;
}

core::Status Pulid::marshal_text_to(std::span<char> dst) const {
  if (dst.size() != kEncodedSize) {
    return core::Status::err(core::make_error(core::ErrorCode::kBufferSize));
  }

  if (is_nil()) {
    std::fill(dst.begin(), dst.end(), '0');
    return core::ok_status();
  }

  dst[0] = static_cast<char>(bytes_[0]);
  dst[1] = static_cast<char>(bytes_[1]);
  return ulid().marshal_text_to(dst.subspan(kPrefixSize));
}

core::Status Pulid::unmarshal_text(const std::string_view text) {
  auto result = parse(text);
  if (!result.has_value()) {
    return core::Status::err(result.error());
  }
  *this = result.value();
  return core::ok_status();
}

std::vector<std::uint8_t> Pulid::marshal_binary() const {
  return {bytes_.begin(), bytes_.end()};
}

core::Status Pulid::marshal_binary_to(std::span<std::uint8_t> dst) const {
  if (dst.size() != kSize) {
    return core::Status::err(core::make_error(core::ErrorCode::kBufferSize));
  }
  std::copy(bytes_.begin(), bytes_.end(), dst.begin());
  return core::ok_status();
}

core::Status Pulid::unmarshal_binary(std::span<const std::uint8_t> data) {
  if (data.size() != kSize) {
    return core::Status::err(core::make_error(core::ErrorCode::kDataSize));
  }
  std::copy(data.begin(), data.end(), bytes_.begin());
  return core::ok_status();
}

int Pulid::compare(const Pulid& other) const {
  const auto order = bytes_ <=> other.bytes_;
  if (order < 0) {
    return -1;
  }
  return order > 0 ? 1 : 0;
}

}  // namespace pulid::id
