#include "pulid/storage/scan.h"

#include <type_traits>

namespace pulid::storage {

core::Status scan(id::Pulid& dst, const ScanSource& src) {
  return std::visit(
      [&dst](const auto& source) -> core::Status {
        using Source = std::decay_t<decltype(source)>;
        if constexpr (std::is_same_v<Source, std::monostate>) {
          return core::ok_status();
        } else if constexpr (std::is_same_v<Source, id::Pulid>) {
          dst = source;
          return core::ok_status();
        } else if constexpr (std::is_same_v<Source, std::string>) {
          return dst.unmarshal_text(source);
        } else if constexpr (std::is_same_v<Source, std::vector<std::uint8_t>>) {
          return dst.unmarshal_binary(source);
        } else {
          return core::Status::err(core::make_error(core::ErrorCode::kUnrecognizedScanInput));
        }
      },
      src);
}

std::string value(const id::Pulid& id) {
  return id.to_string();
}

}  // namespace pulid::storage
