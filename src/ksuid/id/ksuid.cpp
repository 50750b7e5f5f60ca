#include "ksuid/id/ksuid.hpp"

#include "ksuid/util/base62.hpp"
#include "ksuid/util/uint128.hpp"

#include <algorithm>
#include <limits>

namespace ksuid {

namespace {

[[nodiscard]] auto payload_value(const Ksuid &id) noexcept -> util::Uint128 {
  return util::uint128_from_bytes(id.payload());
}

[[nodiscard]] auto with_payload(std::uint32_t timestamp,
                                util::Uint128 value) noexcept -> Ksuid {
  return Ksuid{timestamp, util::uint128_to_bytes(value)};
}

} // namespace

auto Ksuid::from_parts(TimePoint t, std::span<const std::uint8_t> payload)
    -> Result<Ksuid> {
  if (payload.size() != kPayloadLength) {
    return fail(Error::InvalidPayloadSize);
  }
  Payload p{};
  std::ranges::copy(payload, p.begin());
  return ok(Ksuid{to_corrected_timestamp(t), p});
}

auto Ksuid::from_bytes(std::span<const std::uint8_t> bytes) -> Result<Ksuid> {
  if (bytes.size() != kByteLength) {
    return fail(Error::InvalidSize);
  }
  Bytes b{};
  std::ranges::copy(bytes, b.begin());
  return ok(Ksuid{b});
}

auto Ksuid::parse(std::string_view text) -> Result<Ksuid> {
  if (text.size() != kStringEncodedLength) {
    return fail(Error::InvalidStringSize);
  }
  auto decoded = util::base62_decode(text);
  if (!decoded) {
    // Bad symbols and oversized values look the same to callers.
    return fail(Error::InvalidStringValue);
  }
  return ok(Ksuid{*decoded});
}

auto Ksuid::from_parts_or_nil(TimePoint t,
                              std::span<const std::uint8_t> payload) noexcept
    -> Ksuid {
  return from_parts(t, payload).value_or(nil());
}

auto Ksuid::from_bytes_or_nil(std::span<const std::uint8_t> bytes) noexcept
    -> Ksuid {
  return from_bytes(bytes).value_or(nil());
}

auto Ksuid::parse_or_nil(std::string_view text) noexcept -> Ksuid {
  return parse(text).value_or(nil());
}

auto Ksuid::str() const -> std::string {
  std::string out;
  out.reserve(kStringEncodedLength);
  append_to(out);
  return out;
}

auto Ksuid::append_to(std::string &out) const -> void {
  auto text = util::base62_encode(bytes_);
  out.append(text.data(), text.size());
}

auto Ksuid::next() const noexcept -> Ksuid {
  auto t = timestamp();
  const auto v = util::add128(payload_value(*this), util::make_uint128(0, 1));
  if (v == util::make_uint128(0, 0)) {
    ++t;
  }
  return with_payload(t, v);
}

auto Ksuid::prev() const noexcept -> Ksuid {
  constexpr auto kAllOnes = std::numeric_limits<std::uint64_t>::max();
  auto t = timestamp();
  const auto v = util::sub128(payload_value(*this), util::make_uint128(0, 1));
  if (v == util::make_uint128(kAllOnes, kAllOnes)) {
    --t;
  }
  return with_payload(t, v);
}

auto Ksuid::unmarshal_text(std::string_view text) -> Result<void> {
  return parse(text).transform([this](Ksuid id) { *this = id; });
}

auto Ksuid::unmarshal_binary(std::span<const std::uint8_t> bytes)
    -> Result<void> {
  return from_bytes(bytes).transform([this](Ksuid id) { *this = id; });
}

} // namespace ksuid
