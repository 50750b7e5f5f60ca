#pragma once

#include <cstddef>
#include <cstdint>
#include <string_view>

namespace ksuid {

// Unix seconds subtracted from the stored timestamp. Pushes the 32-bit
// rollover out to the year 2150.
constexpr std::int64_t kEpochStamp = 1400000000;

constexpr std::size_t kTimestampLength = 4;
constexpr std::size_t kPayloadLength = 16;
constexpr std::size_t kByteLength = kTimestampLength + kPayloadLength;
constexpr std::size_t kStringEncodedLength = 27;

constexpr std::string_view kMinStringEncoded = "000000000000000000000000000";
constexpr std::string_view kMaxStringEncoded = "aWgEPTl1tmebfsQzFP4bxwgy80V";

namespace base62 {
constexpr std::uint64_t kRadix = 62;
// Largest power of 62 below 2^32. Conversions move five digits per limb.
constexpr std::uint64_t kLimbDigits = 5;
constexpr std::uint64_t kLimbBase = 62ULL * 62 * 62 * 62 * 62;
constexpr std::uint64_t kWordBase = 1ULL << 32;
} // namespace base62

} // namespace ksuid
