#pragma once

#include "ksuid/config/cli_config.hpp"
#include "ksuid/core/error.hpp"

#include <string_view>

namespace ksuid {

// Reads the [cli] table of a TOML file. KSUID_COUNT, KSUID_FORMAT and
// KSUID_LOG_LEVEL override the file.
class ConfigLoader {
public:
  // Missing file -> FileNotFound; a path that exists but cannot be read
  // reports the system error (e.g. std::errc::is_a_directory).
  [[nodiscard]] static auto load_from_file(std::string_view path)
      -> Result<CliConfig>;
  [[nodiscard]] static auto load_from_string(std::string_view toml_str)
      -> Result<CliConfig>;

  // Applies the KSUID_* environment variables on top of `cfg`.
  [[nodiscard]] static auto apply_env_overrides(CliConfig &cfg)
      -> Result<void>;
  [[nodiscard]] static auto validate(const CliConfig &cfg) -> Result<void>;
};

} // namespace ksuid
