#include "ksuid/config/config.hpp"

#include "ksuid/core/error.hpp"
#include "ksuid/util/log.hpp"

#include <boost/lexical_cast.hpp>
#include <glaze/toml.hpp>

#include <cerrno>
#include <cstdlib>
#include <filesystem>
#include <fstream>
#include <iterator>
#include <string>
#include <string_view>
#include <system_error>
#include <utility>

namespace ksuid {
namespace detail {

struct CliToml {
  int count{1};
  std::string format{"string"};
  std::string template_text;
  bool verbose{false};
  std::string log_level{"warn"};
  std::string log_file;
};

struct KsuidToml {
  CliToml cli{};
};

} // namespace detail
} // namespace ksuid

namespace glz {
template <> struct meta<ksuid::detail::CliToml> {
  using T = ksuid::detail::CliToml;
  static constexpr auto value =
      object("count", &T::count, "format", &T::format, "template",
             &T::template_text, "verbose", &T::verbose, "log_level",
             &T::log_level, "log_file", &T::log_file);
};

template <> struct meta<ksuid::detail::KsuidToml> {
  using T = ksuid::detail::KsuidToml;
  static constexpr auto value = object("cli", &T::cli);
};
} // namespace glz

namespace ksuid {
namespace {

[[nodiscard]] auto read_config_text(std::string_view path)
    -> Result<std::string> {
  const std::filesystem::path p{path};
  std::error_code ec;
  const auto status = std::filesystem::status(p, ec);
  if (!std::filesystem::exists(status)) {
    return fail(Error::FileNotFound);
  }
  if (std::filesystem::is_directory(status)) {
    return fail(std::make_error_code(std::errc::is_a_directory));
  }

  std::ifstream in(p, std::ios::binary);
  if (!in) {
    const int err = errno != 0 ? errno : EACCES;
    return fail(std::error_code(err, std::system_category()));
  }
  return ok(std::string((std::istreambuf_iterator<char>(in)),
                        std::istreambuf_iterator<char>()));
}

[[nodiscard]] auto parse_ksuid_toml(std::string_view text)
    -> Result<detail::KsuidToml> {
  detail::KsuidToml raw{};
  constexpr auto kOpts =
      glz::opts{.format = glz::TOML, .error_on_unknown_keys = false};
  if (auto ec = glz::read<kOpts>(raw, text); ec) {
    log::error("Invalid ksuid config: {}", glz::format_error(ec, text));
    return fail(Error::ParseError);
  }
  return ok(std::move(raw));
}

[[nodiscard]] auto convert_toml(std::string_view toml_text)
    -> Result<CliConfig> {
  auto raw_result = parse_ksuid_toml(toml_text);
  if (!raw_result)
    return fail(raw_result.error());
  auto &raw = raw_result->cli;

  auto format = parse<OutputFormat>(raw.format);
  if (!format) {
    log::error("Unknown output format '{}'", raw.format);
    return fail(Error::InvalidArgument);
  }

  CliConfig cfg{};
  cfg.count = raw.count;
  cfg.format = *format;
  cfg.template_text = std::move(raw.template_text);
  cfg.verbose = raw.verbose;
  cfg.log_level = std::move(raw.log_level);
  cfg.log_file = std::move(raw.log_file);

  if (auto env = ConfigLoader::apply_env_overrides(cfg); !env)
    return fail(env.error());
  if (auto valid = ConfigLoader::validate(cfg); !valid)
    return fail(valid.error());
  return ok(std::move(cfg));
}

} // namespace

auto ConfigLoader::load_from_file(std::string_view path) -> Result<CliConfig> {
  auto text = read_config_text(path);
  if (!text) {
    log::error("Cannot read config file '{}': {}", path,
               text.error().message());
    return fail(text.error());
  }
  log::debug("Loading config from {}", path);
  return convert_toml(*text);
}

auto ConfigLoader::load_from_string(std::string_view toml_str)
    -> Result<CliConfig> {
  return convert_toml(toml_str);
}

auto ConfigLoader::apply_env_overrides(CliConfig &cfg) -> Result<void> {
  if (const char *v = std::getenv("KSUID_COUNT"); v != nullptr) {
    if (!boost::conversion::try_lexical_convert(v, cfg.count)) {
      log::error("KSUID_COUNT is not an integer: '{}'", v);
      return fail(Error::InvalidArgument);
    }
  }
  if (const char *v = std::getenv("KSUID_FORMAT"); v != nullptr) {
    auto format = parse<OutputFormat>(v);
    if (!format) {
      log::error("KSUID_FORMAT names an unknown output format: '{}'", v);
      return fail(Error::InvalidArgument);
    }
    cfg.format = *format;
  }
  if (const char *v = std::getenv("KSUID_LOG_LEVEL"); v != nullptr) {
    cfg.log_level = v;
  }
  return ok();
}

auto ConfigLoader::validate(const CliConfig &cfg) -> Result<void> {
  // Zero is allowed and produces no output.
  if (cfg.count < 0) {
    log::error("count must not be negative, got {}", cfg.count);
    return fail(Error::InvalidArgument);
  }
  if (!log::parse_level(cfg.log_level)) {
    log::error("Unknown log level '{}'", cfg.log_level);
    return fail(Error::InvalidArgument);
  }
  return ok();
}

} // namespace ksuid
