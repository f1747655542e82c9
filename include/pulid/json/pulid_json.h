#pragma once

#include "pulid/core/error.h"
#include "pulid/id/pulid.h"

#include <nlohmann/json.hpp>

#include <ostream>

namespace pulid::json {

/// Serialize a Pulid as its canonical 28-character text form (JSON string).
/// JSON strings carry UTF-8 only, so prefix bytes that are not valid UTF-8 fail with
/// kInvalidUtf8 instead of being replaced. Store such identifiers in binary form.
[[nodiscard]] core::Result<nlohmann::json, core::Error> pulid_to_json(const id::Pulid& id);

/// Deserialize following the scan contract: null -> nil, string -> lenient text decode,
/// binary -> 18-byte decode, any other JSON type -> kUnrecognizedScanInput.
[[nodiscard]] core::Result<id::Pulid, core::Error> pulid_from_json(const nlohmann::json& j);

/// Write the canonical text form as a quoted JSON string, e.g. "PR01AN4Z07BY79KA1307SR9X4MV3".
/// Writes nothing and fails with kInvalidUtf8 when pulid_to_json would.
[[nodiscard]] core::Status write_quoted(std::ostream& out, const id::Pulid& id);

}  // namespace pulid::json

namespace pulid::id {

// ADL hooks so Pulid works with nlohmann::json conversions directly.
// Both throw PulidException on failure.
void to_json(nlohmann::json& j, const Pulid& id);
void from_json(const nlohmann::json& j, Pulid& id);

}  // namespace pulid::id
