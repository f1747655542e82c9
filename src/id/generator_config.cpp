#include "pulid/id/generator_config.h"

#include "pulid/ulid/monotonic_entropy.h"

#include <charconv>
#include <utility>

namespace pulid::id {

namespace {

// Monotonic entropy that owns its underlying pseudo-random source.
class OwningMonotonicEntropy final : public ulid::IEntropySource {
 public:
  OwningMonotonicEntropy(std::unique_ptr<ulid::RandomEntropy> source, std::uint64_t increment)
      : source_(std::move(source)), monotonic_(*source_, increment) {}
  ~OwningMonotonicEntropy() override = default;

  OwningMonotonicEntropy(const OwningMonotonicEntropy&) = delete;
  OwningMonotonicEntropy& operator=(const OwningMonotonicEntropy&) = delete;
  OwningMonotonicEntropy(OwningMonotonicEntropy&&) = delete;
  OwningMonotonicEntropy& operator=(OwningMonotonicEntropy&&) = delete;

  [[nodiscard]] core::Status read(std::uint64_t ms, std::span<std::uint8_t> out) override {
    return monotonic_.read(ms, out);
  }

 private:
  std::unique_ptr<ulid::RandomEntropy> source_;
  ulid::LockedMonotonicEntropy monotonic_;
};

std::optional<std::uint64_t> parse_u64(const std::string_view text) {
  if (text.empty()) {
    return std::nullopt;
  }
  std::uint64_t value = 0;
  const auto [ptr, ec] = std::from_chars(text.data(), text.data() + text.size(), value);
  if (ec != std::errc{} || ptr != text.data() + text.size()) {
    return std::nullopt;
  }
  return value;
}

std::unique_ptr<ulid::RandomEntropy> make_random(const std::optional<std::uint64_t>& seed) {
  if (seed.has_value()) {
    return std::make_unique<ulid::RandomEntropy>(seed.value());
  }
  return std::make_unique<ulid::RandomEntropy>();
}

}  // namespace

std::optional<EntropyMode> parse_entropy_mode(const std::string_view value) {
  if (value == "monotonic") {
    return EntropyMode::kMonotonic;
  }
  if (value == "random") {
    return EntropyMode::kRandom;
  }
  if (value == "device") {
    return EntropyMode::kDevice;
  }
  if (value == "zero") {
    return EntropyMode::kZero;
  }
  return std::nullopt;
}

std::string_view entropy_mode_to_string(const EntropyMode mode) {
  switch (mode) {
    case EntropyMode::kMonotonic:
      return "monotonic";
    case EntropyMode::kRandom:
      return "random";
    case EntropyMode::kDevice:
      return "device";
    case EntropyMode::kZero:
      return "zero";
  }
  return "unknown";
}

std::optional<GeneratorConfig> parse_generator_config(const std::string_view spec) {
  GeneratorConfig config;

  // First segment is the mode.
  const auto first_sep = spec.find(';');
  const auto mode = parse_entropy_mode(spec.substr(0, first_sep));
  if (!mode.has_value()) {
    return std::nullopt;
  }
  config.entropy_mode = mode.value();

  bool seen_inc = false;
  bool seen_seed = false;
  std::string_view rest =
      first_sep == std::string_view::npos ? std::string_view{} : spec.substr(first_sep + 1);

  while (first_sep != std::string_view::npos) {
    const auto sep = rest.find(';');
    const std::string_view option = rest.substr(0, sep);

    const auto eq = option.find('=');
    if (eq == std::string_view::npos) {
      return std::nullopt;
    }
    const std::string_view key = option.substr(0, eq);
    const auto number = parse_u64(option.substr(eq + 1));
    if (!number.has_value()) {
      return std::nullopt;
    }

    if (key == "inc" && !seen_inc && config.entropy_mode == EntropyMode::kMonotonic) {
      config.monotonic_increment = number.value();
      seen_inc = true;
    } else if (key == "seed" && !seen_seed &&
               (config.entropy_mode == EntropyMode::kMonotonic ||
                config.entropy_mode == EntropyMode::kRandom)) {
      config.seed = number.value();
      seen_seed = true;
    } else {
      return std::nullopt;
    }

    if (sep == std::string_view::npos) {
      break;
    }
    rest = rest.substr(sep + 1);
  }

  return config;
}

std::string generator_config_to_log_string(const GeneratorConfig& config) {
  std::string out = "entropy=" + std::string{entropy_mode_to_string(config.entropy_mode)};
  if (config.entropy_mode == EntropyMode::kMonotonic) {
    out += " inc=";
    out += config.monotonic_increment == 0 ? std::string{"default"}
                                           : std::to_string(config.monotonic_increment);
  }
  if (config.entropy_mode == EntropyMode::kMonotonic ||
      config.entropy_mode == EntropyMode::kRandom) {
    out += " seed=";
    out += config.seed.has_value() ? std::to_string(config.seed.value())
                                   : std::string{"random_device"};
  }
  return out;
}

std::unique_ptr<ulid::IEntropySource> make_entropy_source(const GeneratorConfig& config) {
  switch (config.entropy_mode) {
    case EntropyMode::kMonotonic:
      return std::make_unique<OwningMonotonicEntropy>(make_random(config.seed),
                                                      config.monotonic_increment);
    case EntropyMode::kRandom:
      return make_random(config.seed);
    case EntropyMode::kDevice:
      return std::make_unique<ulid::DeviceEntropy>();
    case EntropyMode::kZero:
      return std::make_unique<ulid::ZeroEntropy>();
  }
  return std::make_unique<OwningMonotonicEntropy>(make_random(config.seed),
                                                  config.monotonic_increment);
}

}  // namespace pulid::id
