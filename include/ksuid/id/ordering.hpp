#pragma once

#include "ksuid/id/ksuid.hpp"

#include <span>

namespace ksuid {

// -1, 0 or 1 by unsigned lexicographic order of the 20-byte forms.
[[nodiscard]] auto compare(const Ksuid &a, const Ksuid &b) noexcept -> int;

auto sort(std::span<Ksuid> ids) noexcept -> void;

[[nodiscard]] auto is_sorted(std::span<const Ksuid> ids) noexcept -> bool;

} // namespace ksuid
