#include "pulid/core/error.h"

#include <utility>

namespace pulid::core {

std::string_view to_string(const ErrorCode code) {
  switch (code) {
    case ErrorCode::kPrefixLength:
      return "pulid: bad prefix length";
    case ErrorCode::kTimestampOverflow:
      return "ulid: timestamp too big";
    case ErrorCode::kDataSize:
      return "ulid: bad data size when unmarshaling";
    case ErrorCode::kBufferSize:
      return "ulid: bad buffer size when marshaling";
    case ErrorCode::kInvalidCharacter:
      return "ulid: bad data characters when unmarshaling";
    case ErrorCode::kEntropySource:
      return "ulid: entropy source failure";
    case ErrorCode::kMonotonicOverflow:
      return "ulid: monotonic entropy overflow";
    case ErrorCode::kUnrecognizedScanInput:
      return "ulid: source value must be a string or byte slice";
    case ErrorCode::kInvalidUtf8:
      return "pulid: prefix is not valid UTF-8";
  }
  return "ulid: unknown error";
}

Error make_error(const ErrorCode code) {
  return Error{code, std::string{to_string(code)}};
}

Error make_error(const ErrorCode code, std::string message) {
  return Error{code, std::move(message)};
}

}  // namespace pulid::core
