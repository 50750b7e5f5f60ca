#pragma once

#include "ksuid/config/cli_config.hpp"
#include "ksuid/core/error.hpp"
#include "ksuid/id/ksuid.hpp"
#include "ksuid/util/time.hpp"

#include <boost/algorithm/hex.hpp>

#include <cstdint>
#include <format>
#include <iterator>
#include <span>
#include <string>
#include <string_view>

namespace ksuid::cli::fmt {

[[nodiscard]] inline auto hex_upper(std::span<const std::uint8_t> bytes)
    -> std::string {
  std::string out;
  out.reserve(bytes.size() * 2);
  boost::algorithm::hex(bytes.begin(), bytes.end(), std::back_inserter(out));
  return out;
}

[[nodiscard]] inline auto format_inspect(const Ksuid &id) -> std::string {
  return std::format("\n"
                     "REPRESENTATION:\n"
                     "\n"
                     "  String: {}\n"
                     "     Raw: {}\n"
                     "\n"
                     "COMPONENTS:\n"
                     "\n"
                     "       Time: {}\n"
                     "  Timestamp: {}\n"
                     "    Payload: {}\n"
                     "\n",
                     id.str(), hex_upper(id.bytes()),
                     util::format_utc_timestamp(id.time()), id.timestamp(),
                     hex_upper(id.payload()));
}

[[nodiscard]] inline auto raw_bytes(std::span<const std::uint8_t> bytes)
    -> std::string {
  return {reinterpret_cast<const char *>(bytes.data()), bytes.size()};
}

} // namespace ksuid::cli::fmt

namespace ksuid::cli {

// Renders one identifier as `ksuid -f <format>` writes it. Binary formats
// (payload, raw) carry no trailing newline.
[[nodiscard]] auto format_id(const Ksuid &id, OutputFormat format,
                             std::string_view tmpl) -> Result<std::string>;

} // namespace ksuid::cli
