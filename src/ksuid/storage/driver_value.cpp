#include "ksuid/storage/driver_value.hpp"

#include "ksuid/util/log.hpp"

#include <string_view>
#include <type_traits>

namespace ksuid::storage {

auto to_driver_value(const Ksuid &id) -> DriverValue {
  if (id.is_nil()) {
    return std::monostate{};
  }
  return id.str();
}

auto scan_bytes(std::span<const std::uint8_t> bytes) -> Result<Ksuid> {
  switch (bytes.size()) {
  case 0:
    return ok(Ksuid::nil());
  case kByteLength:
    return Ksuid::from_bytes(bytes);
  case kStringEncodedLength:
    return Ksuid::parse(std::string_view{
        reinterpret_cast<const char *>(bytes.data()), bytes.size()});
  default:
    return fail(Error::InvalidSize);
  }
}

auto scan(const DriverValue &value) -> Result<Ksuid> {
  return std::visit(
      [](const auto &v) -> Result<Ksuid> {
        using T = std::decay_t<decltype(v)>;
        if constexpr (std::is_same_v<T, std::monostate>) {
          return ok(Ksuid::nil());
        } else if constexpr (std::is_same_v<T, std::vector<std::uint8_t>>) {
          return scan_bytes(v);
        } else if constexpr (std::is_same_v<T, std::string>) {
          return scan_bytes(std::span<const std::uint8_t>{
              reinterpret_cast<const std::uint8_t *>(v.data()), v.size()});
        } else {
          log::debug("scan: unsupported driver value alternative");
          return fail(Error::UnsupportedScanType);
        }
      },
      value);
}

} // namespace ksuid::storage
