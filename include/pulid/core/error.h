#pragma once

#include "pulid/core/result.h"

#include <string>
#include <string_view>

namespace pulid::core {

// Error enumeration following E.14 (use purpose-designed types as error indicators).
// All codes are local and recoverable; none is fatal to the process.
enum class ErrorCode {
  kPrefixLength,           // prefix is not exactly 2 bytes
  kTimestampOverflow,      // millisecond timestamp does not fit in 48 bits
  kDataSize,               // fixed-size decode/copy input has the wrong length
  kBufferSize,             // caller-supplied output buffer has the wrong length
  kInvalidCharacter,       // strict decode met a character outside the alphabet
  kEntropySource,          // entropy source failed to produce bytes
  kMonotonicOverflow,      // monotonic entropy exhausted within one millisecond
  kUnrecognizedScanInput,  // adapter received an unsupported input type
  kInvalidUtf8,            // text form is not valid UTF-8 where an adapter requires it
};

// Error carries the code plus a human-readable message.
// Entropy source failures keep the source's own message verbatim.
struct Error {
  ErrorCode code;       // NOLINT(readability-identifier-naming)
  std::string message;  // NOLINT(readability-identifier-naming)

  bool operator==(const Error&) const = default;
};

// Canonical message for a code, e.g. "pulid: bad prefix length".
[[nodiscard]] std::string_view to_string(ErrorCode code);

[[nodiscard]] Error make_error(ErrorCode code);
[[nodiscard]] Error make_error(ErrorCode code, std::string message);

// Status is the payload-free result used by mutators and "write into buffer" operations.
using Status = Result<bool, Error>;

inline Status ok_status() { return Status::ok(true); }

}  // namespace pulid::core
