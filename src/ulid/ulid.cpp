#include "pulid/ulid/ulid.h"

#include "pulid/ulid/base32.h"
#include "pulid/ulid/entropy.h"

#include <algorithm>
#include <chrono>

namespace pulid::ulid {

namespace {

void put_time(Ulid::Bytes& bytes, const std::uint64_t ms) {
  for (std::size_t i = 0; i < kTimeSize; ++i) {
    bytes[i] = static_cast<std::uint8_t>(ms >> ((kTimeSize - 1 - i) * 8u));
  }
}

}  // namespace

core::Result<Ulid, core::Error> Ulid::create(const std::uint64_t ms, IEntropySource& entropy) {
  if (ms > kMaxTime) {
    return core::Result<Ulid, core::Error>::err(
        core::make_error(core::ErrorCode::kTimestampOverflow));
  }

  Bytes bytes{};
  put_time(bytes, ms);

  auto read_result = entropy.read(ms, std::span<std::uint8_t>(bytes).subspan(kTimeSize));
  if (!read_result.has_value()) {
    return core::Result<Ulid, core::Error>::err(read_result.error());
  }

  return core::Result<Ulid, core::Error>::ok(Ulid(bytes));
}

core::Result<Ulid, core::Error> Ulid::parse(const std::string_view text) {
  Bytes bytes{};
  auto result = decode_base32(text, false, bytes);
  if (!result.has_value()) {
    return core::Result<Ulid, core::Error>::err(result.error());
  }
  return core::Result<Ulid, core::Error>::ok(Ulid(bytes));
}

core::Result<Ulid, core::Error> Ulid::parse_strict(const std::string_view text) {
  Bytes bytes{};
  auto result = decode_base32(text, true, bytes);
  if (!result.has_value()) {
    return core::Result<Ulid, core::Error>::err(result.error());
  }
  return core::Result<Ulid, core::Error>::ok(Ulid(bytes));
}

std::string Ulid::to_string() const {
  std::string text(kEncodedSize, '0');
  encode_base32(bytes_, std::span<char, kEncodedSize>(text.data(), kEncodedSize));
  return text;
}

core::Status Ulid::marshal_text_to(std::span<char> dst) const {
  if (dst.size() != kEncodedSize) {
    return core::Status::err(core::make_error(core::ErrorCode::kBufferSize));
  }
  encode_base32(bytes_, dst.first<kEncodedSize>());
  return core::ok_status();
}

core::Status Ulid::marshal_binary_to(std::span<std::uint8_t> dst) const {
  if (dst.size() != kSize) {
    return core::Status::err(core::make_error(core::ErrorCode::kBufferSize));
  }
  std::copy(bytes_.begin(), bytes_.end(), dst.begin());
  return core::ok_status();
}

core::Status Ulid::unmarshal_binary(std::span<const std::uint8_t> data) {
  if (data.size() != kSize) {
    return core::Status::err(core::make_error(core::ErrorCode::kDataSize));
  }
  std::copy(data.begin(), data.end(), bytes_.begin());
  return core::ok_status();
}

std::uint64_t Ulid::timestamp_ms() const {
  std::uint64_t ms = 0;
  for (std::size_t i = 0; i < kTimeSize; ++i) {
    ms = (ms << 8u) | bytes_[i];
  }
  return ms;
}

core::TimestampMs Ulid::timestamp() const {
  return from_unix_ms(timestamp_ms());
}

core::Status Ulid::set_timestamp_ms(const std::uint64_t ms) {
  if (ms > kMaxTime) {
    return core::Status::err(core::make_error(core::ErrorCode::kTimestampOverflow));
  }
  put_time(bytes_, ms);
  return core::ok_status();
}

std::array<std::uint8_t, kEntropySize> Ulid::entropy() const {
  std::array<std::uint8_t, kEntropySize> out{};
  std::copy(bytes_.begin() + kTimeSize, bytes_.end(), out.begin());
  return out;
}

core::Status Ulid::set_entropy(std::span<const std::uint8_t> entropy) {
  if (entropy.size() != kEntropySize) {
    return core::Status::err(core::make_error(core::ErrorCode::kDataSize));
  }
  std::copy(entropy.begin(), entropy.end(), bytes_.begin() + kTimeSize);
  return core::ok_status();
}

int Ulid::compare(const Ulid& other) const {
  const auto order = bytes_ <=> other.bytes_;
  if (order < 0) {
    return -1;
  }
  return order > 0 ? 1 : 0;
}

std::uint64_t to_unix_ms(const core::Timestamp ts) {
  const std::int64_t ms = core::to_unix_millis(ts);
  return ms < 0 ? 0 : static_cast<std::uint64_t>(ms);
}

std::uint64_t to_unix_ms(const core::TimestampMs ts) {
  const std::int64_t ms = core::to_unix_millis(ts);
  return ms < 0 ? 0 : static_cast<std::uint64_t>(ms);
}

core::TimestampMs from_unix_ms(const std::uint64_t ms) {
  return core::from_unix_millis(ms);
}

std::uint64_t now_ms() {
  return to_unix_ms(core::now_utc());
}

}  // namespace pulid::ulid
