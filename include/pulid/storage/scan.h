#pragma once

#include "pulid/core/error.h"
#include "pulid/id/pulid.h"

#include <cstdint>
#include <string>
#include <variant>
#include <vector>

namespace pulid::storage {

// ScanSource models the values a database driver or structured-data decoder can hand over.
// std::monostate stands for NULL.
using ScanSource = std::variant<std::monostate, id::Pulid, std::string, std::vector<std::uint8_t>,
                                std::int64_t, double>;

// scan assigns a source value to dst:
// - NULL            dst unchanged, success
// - Pulid           copied
// - string          lenient text decode (kDataSize on length mismatch)
// - byte vector     binary decode (kDataSize on length mismatch)
// - anything else   kUnrecognizedScanInput
// dst is only modified on success.
[[nodiscard]] core::Status scan(id::Pulid& dst, const ScanSource& src);

// value returns the representation to persist: the canonical 28-character text form.
[[nodiscard]] std::string value(const id::Pulid& id);

}  // namespace pulid::storage
