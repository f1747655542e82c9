#include "pulid/ulid/entropy.h"

#include <algorithm>
#include <exception>
#include <string>

namespace pulid::ulid {

core::Status ZeroEntropy::read(std::uint64_t /*ms*/, std::span<std::uint8_t> out) {
  std::fill(out.begin(), out.end(), std::uint8_t{0});
  return core::ok_status();
}

RandomEntropy::RandomEntropy() : engine_(std::random_device{}()) {}

core::Status RandomEntropy::read(std::uint64_t /*ms*/, std::span<std::uint8_t> out) {
  std::size_t offset = 0;
  while (offset < out.size()) {
    std::uint64_t word = engine_();
    for (unsigned i = 0; i < 8u && offset < out.size(); ++i) {
      out[offset++] = static_cast<std::uint8_t>(word);
      word >>= 8u;
    }
  }
  return core::ok_status();
}

core::Status DeviceEntropy::read(std::uint64_t /*ms*/, std::span<std::uint8_t> out) {
  try {
    std::random_device device;
    std::size_t offset = 0;
    while (offset < out.size()) {
      // random_device yields 32-bit words.
      std::uint32_t word = device();
      for (unsigned i = 0; i < 4u && offset < out.size(); ++i) {
        out[offset++] = static_cast<std::uint8_t>(word);
        word >>= 8u;
      }
    }
  } catch (const std::exception& e) {
    return core::Status::err(
        core::make_error(core::ErrorCode::kEntropySource, std::string("random_device: ") + e.what()));
  }
  return core::ok_status();
}

}  // namespace pulid::ulid
