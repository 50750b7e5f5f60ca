#pragma once

#include "ksuid/core/error.hpp"

#include <cstddef>
#include <cstdint>
#include <span>

namespace ksuid {

// Byte source for KSUID payloads. A read may fill less than `out`; a
// successful read of zero bytes means the source is exhausted.
class RandomSource {
public:
  virtual ~RandomSource() = default;

  [[nodiscard]] virtual auto read(std::span<std::uint8_t> out)
      -> Result<std::size_t> = 0;
};

// Kernel CSPRNG via getrandom(2).
class SystemRandomSource final : public RandomSource {
public:
  [[nodiscard]] auto read(std::span<std::uint8_t> out)
      -> Result<std::size_t> override;
};

} // namespace ksuid
