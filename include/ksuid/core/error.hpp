#pragma once

#include <array>
#include <cerrno>
#include <concepts>
#include <cstdint>
#include <expected>
#include <string>
#include <string_view>
#include <system_error>
#include <type_traits>
#include <utility>

namespace ksuid {

enum class Error : std::uint8_t {
  Success,
  InvalidSize,
  InvalidStringSize,
  InvalidStringValue,
  InvalidPayloadSize,
  OutOfRange,
  InvalidCharacter,
  RandomSourceError,
  UnsupportedScanType,
  FileNotFound,
  ParseError,
  InvalidArgument,
  Unknown,
};

class ErrorCategory : public std::error_category {
  static constexpr std::array<std::string_view, 13> messages = {
      "success",
      "valid KSUIDs are 20 bytes",
      "valid encoded KSUIDs are 27 characters",
      "valid encoded KSUIDs are bounded by 000000000000000000000000000 and "
      "aWgEPTl1tmebfsQzFP4bxwgy80V",
      "valid KSUID payloads are 16 bytes",
      "base62 value does not fit in 160 bits",
      "character outside the base62 alphabet",
      "failed to read from random source",
      "unable to scan value into KSUID",
      "file not found",
      "parse error",
      "invalid argument",
      "unknown error",
  };

public:
  [[nodiscard]] auto name() const noexcept -> const char * override {
    return "ksuid";
  }

  [[nodiscard]] auto message(int ev) const -> std::string override {
    auto idx = static_cast<std::size_t>(ev);
    if (idx >= std::size(messages)) {
      return "unknown error";
    }
    return std::string{messages.at(idx)};
  }
};

inline auto error_category() -> const ErrorCategory & {
  static const ErrorCategory instance;
  return instance;
}

inline auto make_error_code(Error e) -> std::error_code {
  return {std::to_underlying(e), error_category()};
}

template <typename T>
concept ResultValue = std::destructible<T> || std::is_void_v<T>;

template <typename T> using Result = std::expected<T, std::error_code>;

template <typename T>
  requires ResultValue<std::decay_t<T>>
[[nodiscard]] constexpr auto ok(T &&value) -> Result<std::decay_t<T>> {
  return std::forward<T>(value);
}

[[nodiscard]] constexpr auto ok() -> Result<void> { return {}; }

[[nodiscard]] inline auto fail(Error e) -> std::unexpected<std::error_code> {
  return std::unexpected{make_error_code(e)};
}

[[nodiscard]] inline auto fail(std::error_code ec)
    -> std::unexpected<std::error_code> {
  return std::unexpected{ec};
}

template <typename T> [[nodiscard]] auto sys_check(T val) -> Result<T> {
  if (val < 0)
    return fail(std::error_code(errno, std::system_category()));
  return ok(val);
}

} // namespace ksuid

template <> struct std::is_error_code_enum<ksuid::Error> : std::true_type {};
