#pragma once

#include "ksuid/core/constants.hpp"
#include "ksuid/core/error.hpp"

#include <array>
#include <cstdint>
#include <span>
#include <string_view>

namespace ksuid::util {

// Digit rank equals position, and the ranks are in ASCII order, so string
// comparison of zero-padded encodings matches numeric comparison.
inline constexpr std::string_view kBase62Alphabet =
    "0123456789ABCDEFGHIJKLMNOPQRSTUVWXYZabcdefghijklmnopqrstuvwxyz";

using Base62Bytes = std::array<std::uint8_t, kByteLength>;
using Base62Text = std::array<char, kStringEncodedLength>;

// Returns the digit value of `c`, or -1 if it is not a base62 symbol.
[[nodiscard]] constexpr auto base62_value(char c) noexcept -> int {
  if (c >= '0' && c <= '9')
    return c - '0';
  if (c >= 'A' && c <= 'Z')
    return 10 + (c - 'A');
  if (c >= 'a' && c <= 'z')
    return 36 + (c - 'a');
  return -1;
}

// Encodes 20 big-endian bytes into exactly 27 characters, left padded with
// '0'. Total over the input domain.
auto base62_encode(std::span<const std::uint8_t, kByteLength> src,
                   std::span<char, kStringEncodedLength> dst) noexcept -> void;

[[nodiscard]] auto
base62_encode(std::span<const std::uint8_t, kByteLength> src) noexcept
    -> Base62Text;

// Decodes exactly 27 characters. Fails with Error::InvalidStringSize for any
// other length, Error::InvalidCharacter for a symbol outside the alphabet and
// Error::OutOfRange when the value exceeds 2^160 - 1.
[[nodiscard]] auto base62_decode(std::string_view src) noexcept
    -> Result<Base62Bytes>;

} // namespace ksuid::util
