#include "pulid/json/pulid_json.h"

#include "pulid/id/must.h"
#include "pulid/storage/scan.h"

#include <array>
#include <cstdint>
#include <string>
#include <vector>

namespace pulid::json {

namespace {

// Only the two prefix bytes can leave ASCII; the rest of the text form is base32.
// Two bytes are valid UTF-8 when both are ASCII or they form one two-byte sequence.
bool prefix_is_utf8(const std::array<std::uint8_t, id::Pulid::kPrefixSize>& prefix) {
  if (prefix[0] < 0x80u) {
    return prefix[1] < 0x80u;
  }
  return prefix[0] >= 0xC2u && prefix[0] <= 0xDFu && (prefix[1] & 0xC0u) == 0x80u;
}

}  // namespace

core::Result<nlohmann::json, core::Error> pulid_to_json(const id::Pulid& id) {
  if (!prefix_is_utf8(id.prefix_bytes())) {
    return core::Result<nlohmann::json, core::Error>::err(
        core::make_error(core::ErrorCode::kInvalidUtf8));
  }
  return core::Result<nlohmann::json, core::Error>::ok(nlohmann::json(storage::value(id)));
}

core::Result<id::Pulid, core::Error> pulid_from_json(const nlohmann::json& j) {
  storage::ScanSource source;
  if (j.is_null()) {
    source = std::monostate{};
  } else if (j.is_string()) {
    source = j.get<std::string>();
  } else if (j.is_binary()) {
    const auto& binary = j.get_binary();
    source = std::vector<std::uint8_t>(binary.begin(), binary.end());
  } else {
    return core::Result<id::Pulid, core::Error>::err(
        core::make_error(core::ErrorCode::kUnrecognizedScanInput));
  }

  id::Pulid result;
  auto status = storage::scan(result, source);
  if (!status.has_value()) {
    return core::Result<id::Pulid, core::Error>::err(status.error());
  }
  return core::Result<id::Pulid, core::Error>::ok(result);
}

core::Status write_quoted(std::ostream& out, const id::Pulid& id) {
  auto j = pulid_to_json(id);
  if (!j.has_value()) {
    return core::Status::err(j.error());
  }
  out << j.value().dump();
  return core::ok_status();
}

}  // namespace pulid::json

namespace pulid::id {

void to_json(nlohmann::json& j, const Pulid& id) {
  j = unwrap(json::pulid_to_json(id));
}

void from_json(const nlohmann::json& j, Pulid& id) {
  id = unwrap(json::pulid_from_json(j));
}

}  // namespace pulid::id
