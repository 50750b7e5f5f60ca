#pragma once

#include "ksuid/core/error.hpp"
#include "ksuid/id/ksuid.hpp"

#include <chrono>
#include <cstdint>
#include <span>
#include <string>
#include <variant>
#include <vector>

namespace ksuid::storage {

// A single cell as handed over by a SQL driver. std::monostate is NULL.
using DriverValue =
    std::variant<std::monostate, std::int64_t, double, bool,
                 std::vector<std::uint8_t>, std::string, TimePoint>;

// Nil is stored as NULL, everything else as the 27-character string.
[[nodiscard]] auto to_driver_value(const Ksuid &id) -> DriverValue;

// Accepts NULL, raw 20-byte binary, 27-character text, or an empty value
// (read back as nil). Other driver types fail with UnsupportedScanType.
[[nodiscard]] auto scan(const DriverValue &value) -> Result<Ksuid>;

[[nodiscard]] auto scan_bytes(std::span<const std::uint8_t> bytes)
    -> Result<Ksuid>;

} // namespace ksuid::storage
