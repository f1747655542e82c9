#pragma once

#include "pulid/core/error.h"
#include "pulid/id/pulid.h"

#include <string>

struct sqlite3_stmt;

namespace pulid::storage::sqlite {

// Column helpers that connect Pulid to SQLite prepared statements.
//
// Binding stores the canonical 28-character text form, which keeps TEXT columns ordered the
// same way as the identifiers themselves. bind_pulid_blob stores the raw 18 bytes instead.
// Reading follows the scan contract: NULL yields `fallback`, TEXT is text-decoded, BLOB is
// binary-decoded and INTEGER/FLOAT columns fail with kUnrecognizedScanInput.

// Returns the sqlite3_bind_* result code.
[[nodiscard]] int bind_pulid(sqlite3_stmt* stmt, int index, const id::Pulid& id);
[[nodiscard]] int bind_pulid_blob(sqlite3_stmt* stmt, int index, const id::Pulid& id);

[[nodiscard]] core::Result<id::Pulid, core::Error> column_pulid(
    sqlite3_stmt* stmt, int column, const id::Pulid& fallback = id::Pulid::nil());

}  // namespace pulid::storage::sqlite
