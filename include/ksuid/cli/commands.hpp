#pragma once

#include "ksuid/config/cli_config.hpp"
#include "ksuid/core/error.hpp"
#include "ksuid/id/ksuid.hpp"

#include <cstdio>
#include <optional>
#include <span>
#include <string>
#include <vector>

namespace ksuid::cli {

// Command-line values; unset optionals fall back to the config file.
struct GenerateOptions {
  std::string config_file;
  std::optional<int> count;
  std::optional<std::string> format;
  std::optional<std::string> template_text;
  bool verbose{false};
  std::optional<std::string> log_level;
  std::optional<std::string> log_file;
  std::vector<std::string> ids;
};

// Layers config file, then KSUID_* environment, then command-line values.
[[nodiscard]] auto resolve_config(const GenerateOptions &opts)
    -> Result<CliConfig>;

// Parses `args`, or generates `cfg.count` new identifiers when `args` is
// empty. On a parse failure `bad_arg` receives the offending argument.
[[nodiscard]] auto collect_ids(const std::vector<std::string> &args,
                               const CliConfig &cfg,
                               std::string *bad_arg = nullptr)
    -> Result<std::vector<Ksuid>>;

[[nodiscard]] auto write_ids(std::span<const Ksuid> ids, const CliConfig &cfg,
                             std::FILE *out) -> Result<void>;

// Identifiers generated per write_generated() round.
inline constexpr int kGenerateBatch = 1024;

// Generates `cfg.count` identifiers and writes them in batches, so the
// count never dictates a single allocation. A count of zero writes nothing.
[[nodiscard]] auto write_generated(const CliConfig &cfg, std::FILE *out)
    -> Result<void>;

auto cmd_generate(const GenerateOptions &opts) -> int;

} // namespace ksuid::cli
