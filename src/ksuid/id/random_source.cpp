#include "ksuid/id/random_source.hpp"

#include <cerrno>
#include <sys/random.h>
#include <sys/types.h>

namespace ksuid {

auto SystemRandomSource::read(std::span<std::uint8_t> out)
    -> Result<std::size_t> {
  for (;;) {
    auto res = sys_check(::getrandom(out.data(), out.size(), 0));
    if (res) {
      return ok(static_cast<std::size_t>(*res));
    }
    if (res.error() != std::errc::interrupted) {
      return fail(res.error());
    }
  }
}

} // namespace ksuid
