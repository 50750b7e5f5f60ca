#pragma once

#include <boost/describe/enum.hpp>
#include <boost/describe/enumerators.hpp>
#include <boost/mp11/algorithm.hpp>

#include <array>
#include <cctype>
#include <optional>
#include <ranges>
#include <string>
#include <string_view>
#include <utility>
#include <vector>

namespace ksuid {

template <typename T>
[[nodiscard]] auto parse(std::string_view s) noexcept -> std::optional<T>;

namespace util {

[[nodiscard]] inline auto normalize_enum_token(std::string_view token)
    -> std::string {
  auto alnum_lower =
      token | std::views::filter([](char c) {
        return std::isalnum(static_cast<unsigned char>(c)) != 0;
      }) |
      std::views::transform([](char c) {
        return static_cast<char>(std::tolower(static_cast<unsigned char>(c)));
      });
  return std::string(alnum_lower.begin(), alnum_lower.end());
}

template <typename E>
[[nodiscard]] inline auto
enum_to_string_view(E value, std::string_view fallback = "unknown") noexcept
    -> std::string_view {
  std::string_view out = fallback;
  boost::mp11::mp_for_each<boost::describe::describe_enumerators<E>>(
      [&](auto descriptor) {
        if (value == descriptor.value) {
          out = descriptor.name;
        }
      });
  return out;
}

// Lower-case names of every enumerator, in declaration order.
template <typename E>
[[nodiscard]] inline auto enum_names() -> std::vector<std::string> {
  std::vector<std::string> out;
  boost::mp11::mp_for_each<boost::describe::describe_enumerators<E>>(
      [&](auto descriptor) {
        out.push_back(normalize_enum_token(descriptor.name));
      });
  return out;
}

template <typename E>
[[nodiscard]] inline auto parse_enum(std::string_view input) noexcept
    -> std::optional<E> {
  const auto normalized_input = normalize_enum_token(input);
  std::optional<E> out;
  boost::mp11::mp_for_each<boost::describe::describe_enumerators<E>>(
      [&](auto descriptor) {
        if (normalized_input == normalize_enum_token(descriptor.name)) {
          out = descriptor.value;
        }
      });
  return out;
}

} // namespace util

#define KSUID_DEFINE_ENUM_SERDE(EnumType)                                      \
  [[nodiscard]] inline auto to_string(EnumType value) -> std::string {         \
    return ::ksuid::util::normalize_enum_token(                                \
        ::ksuid::util::enum_to_string_view(value));                            \
  }                                                                            \
  template <>                                                                  \
  [[nodiscard]] inline auto parse<EnumType>(std::string_view s) noexcept       \
      -> std::optional<EnumType> {                                             \
    return ::ksuid::util::parse_enum<EnumType>(s);                             \
  }

} // namespace ksuid
