#include "ksuid/id/ordering.hpp"

#include <algorithm>
#include <compare>
#include <cstddef>

namespace ksuid {

auto compare(const Ksuid &a, const Ksuid &b) noexcept -> int {
  const auto order = a <=> b;
  if (order < 0)
    return -1;
  if (order > 0)
    return 1;
  return 0;
}

auto sort(std::span<Ksuid> ids) noexcept -> void {
  // Equal elements are byte-identical, so stability is irrelevant.
  std::ranges::sort(ids);
}

auto is_sorted(std::span<const Ksuid> ids) noexcept -> bool {
  for (std::size_t i = 1; i < ids.size(); ++i) {
    if (compare(ids[i - 1], ids[i]) > 0) {
      return false;
    }
  }
  return true;
}

} // namespace ksuid
