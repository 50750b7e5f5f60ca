#include "ksuid/util/base62.hpp"

#include <algorithm>
#include <cstddef>
#include <utility>

namespace ksuid::util {

namespace {

constexpr std::size_t kWords = kByteLength / 4;
constexpr std::size_t kLimbs =
    (kStringEncodedLength + base62::kLimbDigits - 1) / base62::kLimbDigits;
// Digits held by the most significant limb (27 = 2 + 5 * 5).
constexpr std::size_t kLeadDigits =
    kStringEncodedLength - (kLimbs - 1) * base62::kLimbDigits;

static_assert(kByteLength % 4 == 0);
static_assert(base62::kLimbBase < base62::kWordBase);

[[nodiscard]] constexpr auto load_be32(const std::uint8_t *p) noexcept
    -> std::uint32_t {
  return (static_cast<std::uint32_t>(p[0]) << 24) |
         (static_cast<std::uint32_t>(p[1]) << 16) |
         (static_cast<std::uint32_t>(p[2]) << 8) |
         static_cast<std::uint32_t>(p[3]);
}

constexpr auto store_be32(std::uint8_t *p, std::uint64_t v) noexcept -> void {
  p[0] = static_cast<std::uint8_t>(v >> 24);
  p[1] = static_cast<std::uint8_t>(v >> 16);
  p[2] = static_cast<std::uint8_t>(v >> 8);
  p[3] = static_cast<std::uint8_t>(v);
}

} // namespace

auto base62_encode(std::span<const std::uint8_t, kByteLength> src,
                   std::span<char, kStringEncodedLength> dst) noexcept
    -> void {
  std::array<std::uint32_t, kWords> parts{};
  std::array<std::uint32_t, kWords> scratch{};
  for (std::size_t i = 0; i < kWords; ++i) {
    parts[i] = load_be32(src.data() + i * 4);
  }

  // Long division of the 2^32-radix number by 62^5; each pass yields the
  // next five low-order digits in the remainder.
  std::uint32_t *bp = parts.data();
  std::uint32_t *bq = scratch.data();
  std::size_t len = kWords;
  std::size_t pos = dst.size();

  while (len != 0 && pos != 0) {
    std::size_t qlen = 0;
    std::uint64_t remainder = 0;
    for (std::size_t i = 0; i < len; ++i) {
      const std::uint64_t value = bp[i] + remainder * base62::kWordBase;
      const std::uint64_t digit = value / base62::kLimbBase;
      remainder = value % base62::kLimbBase;
      if (qlen != 0 || digit != 0) {
        bq[qlen++] = static_cast<std::uint32_t>(digit);
      }
    }

    for (std::size_t k = 0; k < base62::kLimbDigits && pos != 0; ++k) {
      dst[--pos] = kBase62Alphabet[remainder % base62::kRadix];
      remainder /= base62::kRadix;
    }

    std::swap(bp, bq);
    len = qlen;
  }

  std::fill(dst.begin(), dst.begin() + static_cast<std::ptrdiff_t>(pos), '0');
}

auto base62_encode(std::span<const std::uint8_t, kByteLength> src) noexcept
    -> Base62Text {
  Base62Text out{};
  base62_encode(src, std::span<char, kStringEncodedLength>{out});
  return out;
}

auto base62_decode(std::string_view src) noexcept -> Result<Base62Bytes> {
  if (src.size() != kStringEncodedLength) {
    return fail(Error::InvalidStringSize);
  }

  // Pack the digits into base 62^5 limbs, most significant first.
  std::array<std::uint32_t, kLimbs> parts{};
  std::array<std::uint32_t, kLimbs> scratch{};
  std::size_t next = 0;
  for (std::size_t limb = 0; limb < kLimbs; ++limb) {
    const std::size_t n = limb == 0 ? kLeadDigits : base62::kLimbDigits;
    std::uint32_t acc = 0;
    for (std::size_t j = 0; j < n; ++j) {
      const int v = base62_value(src[next++]);
      if (v < 0) {
        return fail(Error::InvalidCharacter);
      }
      acc = acc * static_cast<std::uint32_t>(base62::kRadix) +
            static_cast<std::uint32_t>(v);
    }
    parts[limb] = acc;
  }

  // Long division by 2^32; each pass yields the next low-order 32-bit word.
  Base62Bytes dst{};
  std::uint32_t *bp = parts.data();
  std::uint32_t *bq = scratch.data();
  std::size_t len = kLimbs;
  std::size_t n = dst.size();

  while (len != 0) {
    std::size_t qlen = 0;
    std::uint64_t remainder = 0;
    for (std::size_t i = 0; i < len; ++i) {
      const std::uint64_t value = bp[i] + remainder * base62::kLimbBase;
      const std::uint64_t digit = value >> 32;
      remainder = value & 0xFFFFFFFFULL;
      if (qlen != 0 || digit != 0) {
        bq[qlen++] = static_cast<std::uint32_t>(digit);
      }
    }

    if (n < 4) {
      return fail(Error::OutOfRange);
    }
    store_be32(dst.data() + n - 4, remainder);
    n -= 4;

    std::swap(bp, bq);
    len = qlen;
  }

  return ok(dst);
}

} // namespace ksuid::util
