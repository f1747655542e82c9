#pragma once

#include "pulid/core/error.h"

#include <cstdint>
#include <random>
#include <span>

namespace pulid::ulid {

// Abstract entropy source for ULID construction.
// Following C++ Core Guidelines I.25: Prefer abstract classes as interfaces to class hierarchies.
//
// read() fills `out` completely or fails. The millisecond timestamp of the identifier being
// built is passed so that monotonic sources can keep per-millisecond state; plain random
// sources ignore it.
class IEntropySource {
 public:
  virtual ~IEntropySource() = default;

  [[nodiscard]] virtual core::Status read(std::uint64_t ms, std::span<std::uint8_t> out) = 0;

 protected:
  IEntropySource() = default;
  IEntropySource(const IEntropySource&) = default;
  IEntropySource& operator=(const IEntropySource&) = default;
  IEntropySource(IEntropySource&&) = default;
  IEntropySource& operator=(IEntropySource&&) = default;
};

// Produces all-zero entropy. Useful for fixed-value identifiers and tests.
class ZeroEntropy final : public IEntropySource {
 public:
  ZeroEntropy() = default;
  ~ZeroEntropy() override = default;

  ZeroEntropy(const ZeroEntropy&) = default;
  ZeroEntropy& operator=(const ZeroEntropy&) = default;
  ZeroEntropy(ZeroEntropy&&) = default;
  ZeroEntropy& operator=(ZeroEntropy&&) = default;

  [[nodiscard]] core::Status read(std::uint64_t ms, std::span<std::uint8_t> out) override;
};

// Pseudo-random entropy from a 64-bit Mersenne Twister.
// Not thread-safe. A fixed seed gives a reproducible byte stream.
class RandomEntropy final : public IEntropySource {
 public:
  // Seeds from std::random_device.
  RandomEntropy();
  explicit RandomEntropy(std::uint64_t seed) : engine_(seed) {}
  ~RandomEntropy() override = default;

  RandomEntropy(const RandomEntropy&) = delete;
  RandomEntropy& operator=(const RandomEntropy&) = delete;
  RandomEntropy(RandomEntropy&&) = default;
  RandomEntropy& operator=(RandomEntropy&&) = default;

  [[nodiscard]] core::Status read(std::uint64_t ms, std::span<std::uint8_t> out) override;

 private:
  std::mt19937_64 engine_;
};

// Entropy drawn directly from std::random_device, which may block depending on the platform.
// Device failures are reported as kEntropySource with the device's message.
class DeviceEntropy final : public IEntropySource {
 public:
  DeviceEntropy() = default;
  ~DeviceEntropy() override = default;

  DeviceEntropy(const DeviceEntropy&) = delete;
  DeviceEntropy& operator=(const DeviceEntropy&) = delete;
  DeviceEntropy(DeviceEntropy&&) = delete;
  DeviceEntropy& operator=(DeviceEntropy&&) = delete;

  [[nodiscard]] core::Status read(std::uint64_t ms, std::span<std::uint8_t> out) override;
};

}  // namespace pulid::ulid
