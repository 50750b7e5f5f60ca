#pragma once

#include "ksuid/core/constants.hpp"
#include "ksuid/core/error.hpp"
#include "ksuid/id/ksuid.hpp"
#include "ksuid/id/random_source.hpp"

#include <array>
#include <cstdint>
#include <memory>
#include <mutex>
#include <string>

namespace ksuid {

// Combines the current (or a given) time with 16 bytes from a random
// source. Calls are serialized: the source and the scratch buffer are
// shared by every caller of one generator.
class Generator {
public:
  Generator();
  explicit Generator(std::shared_ptr<RandomSource> source);

  Generator(const Generator &) = delete;
  Generator &operator=(const Generator &) = delete;

  [[nodiscard]] auto new_random() -> Result<Ksuid>;
  [[nodiscard]] auto new_random_with_time(TimePoint t) -> Result<Ksuid>;

  // Aborts the process if the random source fails.
  [[nodiscard]] auto generate() noexcept -> Ksuid;

  // Replaces the payload source; nullptr restores SystemRandomSource.
  // Intended for deterministic tests only.
  auto set_source(std::shared_ptr<RandomSource> source) -> void;

private:
  [[nodiscard]] auto fill_buffer() -> Result<void>;

  std::mutex mutex_;
  std::shared_ptr<RandomSource> source_;
  Ksuid::Payload buffer_{};
};

// Process-wide generator used by the free functions below.
[[nodiscard]] auto default_generator() -> Generator &;

[[nodiscard]] auto new_ksuid() noexcept -> Ksuid;
[[nodiscard]] auto new_random() -> Result<Ksuid>;
[[nodiscard]] auto new_random_with_time(TimePoint t) -> Result<Ksuid>;
[[nodiscard]] auto new_string() -> std::string;
[[nodiscard]] auto new_bytes() -> Ksuid::Bytes;
auto set_random_source(std::shared_ptr<RandomSource> source) -> void;

} // namespace ksuid
