#pragma once

#include <chrono>
#include <format>
#include <string>

namespace ksuid::util {

// Always UTC, independent of the local time zone:
// YYYY-MM-DD HH:MM:SS +0000 UTC
[[nodiscard]] inline auto
format_utc_timestamp(std::chrono::system_clock::time_point tp) -> std::string {
  auto const sec_tp = std::chrono::floor<std::chrono::seconds>(tp);
  return std::format("{:%Y-%m-%d %H:%M:%S} +0000 UTC", sec_tp);
}

} // namespace ksuid::util
