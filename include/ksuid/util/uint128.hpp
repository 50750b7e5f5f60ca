#pragma once

#include <array>
#include <cstddef>
#include <cstdint>
#include <span>

namespace ksuid::util {

// Unsigned 128-bit integer as two 64-bit limbs. Only what payload stepping
// needs: wrapping add/sub, equality and big-endian byte conversion.
struct Uint128 {
  std::uint64_t hi{0};
  std::uint64_t lo{0};

  [[nodiscard]] friend constexpr auto operator==(const Uint128 &lhs,
                                                 const Uint128 &rhs) noexcept
      -> bool = default;
};

[[nodiscard]] constexpr auto make_uint128(std::uint64_t hi,
                                          std::uint64_t lo) noexcept
    -> Uint128 {
  return Uint128{.hi = hi, .lo = lo};
}

// Wraps modulo 2^128.
[[nodiscard]] constexpr auto add128(Uint128 a, Uint128 b) noexcept
    -> Uint128 {
  const std::uint64_t lo = a.lo + b.lo;
  const std::uint64_t carry = lo < a.lo ? 1 : 0;
  return Uint128{.hi = a.hi + b.hi + carry, .lo = lo};
}

// Wraps modulo 2^128.
[[nodiscard]] constexpr auto sub128(Uint128 a, Uint128 b) noexcept
    -> Uint128 {
  const std::uint64_t lo = a.lo - b.lo;
  const std::uint64_t borrow = a.lo < b.lo ? 1 : 0;
  return Uint128{.hi = a.hi - b.hi - borrow, .lo = lo};
}

[[nodiscard]] constexpr auto
uint128_from_bytes(std::span<const std::uint8_t, 16> b) noexcept -> Uint128 {
  Uint128 v;
  for (std::size_t i = 0; i < 8; ++i) {
    v.hi = (v.hi << 8) | b[i];
    v.lo = (v.lo << 8) | b[i + 8];
  }
  return v;
}

constexpr auto uint128_to_bytes(Uint128 v,
                                std::span<std::uint8_t, 16> out) noexcept
    -> void {
  for (std::size_t i = 0; i < 8; ++i) {
    const auto shift = 56 - 8 * i;
    out[i] = static_cast<std::uint8_t>(v.hi >> shift);
    out[i + 8] = static_cast<std::uint8_t>(v.lo >> shift);
  }
}

[[nodiscard]] constexpr auto uint128_to_bytes(Uint128 v) noexcept
    -> std::array<std::uint8_t, 16> {
  std::array<std::uint8_t, 16> out{};
  uint128_to_bytes(v, std::span<std::uint8_t, 16>{out});
  return out;
}

} // namespace ksuid::util
