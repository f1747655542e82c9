#include "pulid/storage/sqlite/sqlite_pulid.h"

#include "pulid/storage/scan.h"

#include <sqlite3.h>

#include <vector>

namespace pulid::storage::sqlite {

namespace {

ScanSource column_to_scan_source(sqlite3_stmt* stmt, const int column) {
  switch (sqlite3_column_type(stmt, column)) {
    case SQLITE_TEXT: {
      const unsigned char* text = sqlite3_column_text(stmt, column);
      const int size = sqlite3_column_bytes(stmt, column);
      return std::string(reinterpret_cast<const char*>(text), static_cast<std::size_t>(size));
    }
    case SQLITE_BLOB: {
      const auto* blob = static_cast<const std::uint8_t*>(sqlite3_column_blob(stmt, column));
      const int size = sqlite3_column_bytes(stmt, column);
      return std::vector<std::uint8_t>(blob, blob + size);
    }
    case SQLITE_INTEGER:
      return static_cast<std::int64_t>(sqlite3_column_int64(stmt, column));
    case SQLITE_FLOAT:
      return sqlite3_column_double(stmt, column);
    default:
      return std::monostate{};
  }
}

}  // namespace

int bind_pulid(sqlite3_stmt* stmt, const int index, const id::Pulid& id) {
  const std::string text = value(id);
  return sqlite3_bind_text(stmt, index, text.data(), static_cast<int>(text.size()),
                           SQLITE_TRANSIENT);
}

int bind_pulid_blob(sqlite3_stmt* stmt, const int index, const id::Pulid& id) {
  return sqlite3_bind_blob(stmt, index, id.bytes().data(), static_cast<int>(id::Pulid::kSize),
                           SQLITE_TRANSIENT);
}

core::Result<id::Pulid, core::Error> column_pulid(sqlite3_stmt* stmt, const int column,
                                                  const id::Pulid& fallback) {
  id::Pulid result = fallback;
  auto status = scan(result, column_to_scan_source(stmt, column));
  if (!status.has_value()) {
    return core::Result<id::Pulid, core::Error>::err(status.error());
  }
  return core::Result<id::Pulid, core::Error>::ok(result);
}

}  // namespace pulid::storage::sqlite
