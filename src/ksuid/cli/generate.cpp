#include "ksuid/cli/commands.hpp"
#include "ksuid/cli/formatting.hpp"
#include "ksuid/config/config.hpp"
#include "ksuid/id/generator.hpp"
#include "ksuid/util/log.hpp"

#include <algorithm>
#include <cstdio>
#include <print>
#include <span>
#include <string>
#include <utility>
#include <vector>

namespace ksuid::cli {

auto resolve_config(const GenerateOptions &opts) -> Result<CliConfig> {
  CliConfig cfg{};
  if (!opts.config_file.empty()) {
    auto loaded = ConfigLoader::load_from_file(opts.config_file);
    if (!loaded) {
      return fail(loaded.error());
    }
    cfg = std::move(*loaded);
  } else if (auto env = ConfigLoader::apply_env_overrides(cfg); !env) {
    return fail(env.error());
  }

  if (opts.count) {
    cfg.count = *opts.count;
  }
  if (opts.format) {
    auto format = parse<OutputFormat>(*opts.format);
    if (!format) {
      log::error("Bad formatting function: {}", *opts.format);
      return fail(Error::InvalidArgument);
    }
    cfg.format = *format;
  }
  if (opts.template_text) {
    cfg.template_text = *opts.template_text;
  }
  if (opts.verbose) {
    cfg.verbose = true;
  }
  if (opts.log_level) {
    cfg.log_level = *opts.log_level;
  }
  if (opts.log_file) {
    cfg.log_file = *opts.log_file;
  }

  if (auto valid = ConfigLoader::validate(cfg); !valid) {
    return fail(valid.error());
  }
  return ok(std::move(cfg));
}

auto collect_ids(const std::vector<std::string> &args, const CliConfig &cfg,
                 std::string *bad_arg) -> Result<std::vector<Ksuid>> {
  std::vector<Ksuid> ids;
  if (args.empty()) {
    ids.reserve(
        static_cast<std::size_t>(std::clamp(cfg.count, 0, kGenerateBatch)));
    for (int i = 0; i < cfg.count; ++i) {
      auto id = new_random();
      if (!id) {
        return fail(id.error());
      }
      ids.push_back(*id);
    }
    log::debug("Generated {} KSUID(s)", ids.size());
    return ok(std::move(ids));
  }

  ids.reserve(args.size());
  for (const auto &arg : args) {
    auto id = Ksuid::parse(arg);
    if (!id) {
      if (bad_arg) {
        *bad_arg = arg;
      }
      return fail(id.error());
    }
    ids.push_back(*id);
  }
  return ok(std::move(ids));
}

auto write_ids(std::span<const Ksuid> ids, const CliConfig &cfg,
               std::FILE *out) -> Result<void> {
  for (const auto &id : ids) {
    auto text = format_id(id, cfg.format, cfg.template_text);
    if (!text) {
      return fail(text.error());
    }
    if (cfg.verbose) {
      std::print(out, "{}: ", id);
    }
    std::fwrite(text->data(), 1, text->size(), out);
  }
  std::fflush(out);
  return ok();
}

auto write_generated(const CliConfig &cfg, std::FILE *out) -> Result<void> {
  CliConfig batch_cfg = cfg;
  int remaining = cfg.count;
  while (remaining > 0) {
    batch_cfg.count = std::min(remaining, kGenerateBatch);
    auto ids = collect_ids({}, batch_cfg);
    if (!ids) {
      return fail(ids.error());
    }
    if (auto written = write_ids(*ids, cfg, out); !written) {
      return fail(written.error());
    }
    remaining -= batch_cfg.count;
  }
  return ok();
}

auto cmd_generate(const GenerateOptions &opts) -> int {
  auto cfg = resolve_config(opts);
  if (!cfg) {
    std::println(stderr, "Error: {}", cfg.error().message());
    return 1;
  }

  log::set_level(cfg->log_level);
  if (!cfg->log_file.empty() && !log::set_output_file(cfg->log_file)) {
    std::println(stderr, "Error: cannot open log file {}", cfg->log_file);
    return 1;
  }

  if (opts.ids.empty()) {
    if (auto written = write_generated(*cfg, stdout); !written) {
      std::println(stderr, "Error: {}", written.error().message());
      return 1;
    }
    return 0;
  }

  std::string bad_arg;
  auto ids = collect_ids(opts.ids, *cfg, &bad_arg);
  if (!ids) {
    if (!bad_arg.empty()) {
      std::println(stderr, "Error when parsing \"{}\": {}", bad_arg,
                   ids.error().message());
    } else {
      std::println(stderr, "Error: {}", ids.error().message());
    }
    return 1;
  }

  if (auto written = write_ids(*ids, *cfg, stdout); !written) {
    std::println(stderr, "Error: {}", written.error().message());
    return 1;
  }
  return 0;
}

} // namespace ksuid::cli
