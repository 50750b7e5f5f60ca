#pragma once

#include "ksuid/core/constants.hpp"
#include "ksuid/core/error.hpp"

#include <array>
#include <chrono>
#include <compare>
#include <cstddef>
#include <cstdint>
#include <format>
#include <functional>
#include <ostream>
#include <span>
#include <string>
#include <string_view>
#include <vector>

namespace ksuid {

using Clock = std::chrono::system_clock;
using TimePoint = Clock::time_point;

[[nodiscard]] constexpr auto to_corrected_timestamp(TimePoint tp) noexcept
    -> std::uint32_t {
  const auto unix_seconds =
      std::chrono::floor<std::chrono::seconds>(tp).time_since_epoch().count();
  return static_cast<std::uint32_t>(unix_seconds - kEpochStamp);
}

[[nodiscard]] constexpr auto from_corrected_timestamp(std::uint32_t ts) noexcept
    -> TimePoint {
  return TimePoint{std::chrono::seconds{static_cast<std::int64_t>(ts) +
                                        kEpochStamp}};
}

// K-Sortable Unique IDentifier: a big-endian 32-bit corrected timestamp
// followed by a 128-bit payload. Byte order is chronological order.
class Ksuid {
public:
  using Bytes = std::array<std::uint8_t, kByteLength>;
  using Payload = std::array<std::uint8_t, kPayloadLength>;

  constexpr Ksuid() noexcept = default;
  constexpr explicit Ksuid(const Bytes &bytes) noexcept : bytes_(bytes) {}
  constexpr Ksuid(std::uint32_t ts, const Payload &body) noexcept {
    bytes_[0] = static_cast<std::uint8_t>(ts >> 24);
    bytes_[1] = static_cast<std::uint8_t>(ts >> 16);
    bytes_[2] = static_cast<std::uint8_t>(ts >> 8);
    bytes_[3] = static_cast<std::uint8_t>(ts);
    for (std::size_t i = 0; i < kPayloadLength; ++i) {
      bytes_[kTimestampLength + i] = body[i];
    }
  }

  // All-zero sentinel, used to represent a missing identifier.
  [[nodiscard]] static constexpr auto nil() noexcept -> Ksuid { return {}; }

  // All-0xFF sentinel, the largest representable identifier.
  [[nodiscard]] static constexpr auto max() noexcept -> Ksuid {
    Bytes b{};
    for (auto &v : b) {
      v = 0xFF;
    }
    return Ksuid{b};
  }

  [[nodiscard]] static auto from_parts(TimePoint t,
                                       std::span<const std::uint8_t> payload)
      -> Result<Ksuid>;
  [[nodiscard]] static auto from_bytes(std::span<const std::uint8_t> bytes)
      -> Result<Ksuid>;
  [[nodiscard]] static auto parse(std::string_view text) -> Result<Ksuid>;

  // Convenience forms that return nil() instead of an error.
  [[nodiscard]] static auto
  from_parts_or_nil(TimePoint t, std::span<const std::uint8_t> payload) noexcept
      -> Ksuid;
  [[nodiscard]] static auto
  from_bytes_or_nil(std::span<const std::uint8_t> bytes) noexcept -> Ksuid;
  [[nodiscard]] static auto parse_or_nil(std::string_view text) noexcept
      -> Ksuid;

  [[nodiscard]] constexpr auto timestamp() const noexcept -> std::uint32_t {
    return (static_cast<std::uint32_t>(bytes_[0]) << 24) |
           (static_cast<std::uint32_t>(bytes_[1]) << 16) |
           (static_cast<std::uint32_t>(bytes_[2]) << 8) |
           static_cast<std::uint32_t>(bytes_[3]);
  }

  [[nodiscard]] constexpr auto time() const noexcept -> TimePoint {
    return from_corrected_timestamp(timestamp());
  }

  // Views the payload bytes in place; not callable on temporaries.
  [[nodiscard]] constexpr auto payload() const & noexcept
      -> std::span<const std::uint8_t, kPayloadLength> {
    return std::span<const std::uint8_t, kByteLength>{bytes_}
        .subspan<kTimestampLength, kPayloadLength>();
  }
  auto payload() const && -> std::span<const std::uint8_t, kPayloadLength> =
      delete;

  [[nodiscard]] constexpr auto bytes() const noexcept -> const Bytes & {
    return bytes_;
  }

  [[nodiscard]] constexpr auto is_nil() const noexcept -> bool {
    return *this == nil();
  }

  [[nodiscard]] auto str() const -> std::string;
  auto append_to(std::string &out) const -> void;

  // Immediately following / preceding value in byte order. The payload
  // wraps and carries into (or borrows from) the timestamp.
  [[nodiscard]] auto next() const noexcept -> Ksuid;
  [[nodiscard]] auto prev() const noexcept -> Ksuid;

  [[nodiscard]] auto marshal_text() const -> std::string { return str(); }
  [[nodiscard]] auto marshal_binary() const -> std::vector<std::uint8_t> {
    return {bytes_.begin(), bytes_.end()};
  }
  [[nodiscard]] auto unmarshal_text(std::string_view text) -> Result<void>;
  [[nodiscard]] auto unmarshal_binary(std::span<const std::uint8_t> bytes)
      -> Result<void>;

  [[nodiscard]] friend constexpr auto operator<=>(const Ksuid &lhs,
                                                  const Ksuid &rhs) noexcept
      -> std::strong_ordering = default;
  [[nodiscard]] friend constexpr auto operator==(const Ksuid &lhs,
                                                 const Ksuid &rhs) noexcept
      -> bool = default;

private:
  Bytes bytes_{};
};

inline auto operator<<(std::ostream &os, const Ksuid &id) -> std::ostream & {
  return os << id.str();
}

} // namespace ksuid

// `is_avalanching` tells ankerl::unordered_dense::hash to delegate here
// instead of re-mixing the result.
template <> struct std::hash<ksuid::Ksuid> {
  using is_avalanching = void;
  auto operator()(const ksuid::Ksuid &id) const noexcept -> std::size_t {
    const auto &b = id.bytes();
    return std::hash<std::string_view>{}(std::string_view{
        reinterpret_cast<const char *>(b.data()), b.size()});
  }
};

template <>
struct std::formatter<ksuid::Ksuid> : std::formatter<std::string_view> {
  auto format(const ksuid::Ksuid &id, auto &ctx) const {
    return std::formatter<std::string_view>::format(id.str(), ctx);
  }
};
