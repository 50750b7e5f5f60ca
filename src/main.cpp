#include "ksuid/cli/commands.hpp"
#include "ksuid/config/cli_config.hpp"
#include "ksuid/util/enum.hpp"
#include "ksuid/util/log.hpp"

#include <CLI/CLI.hpp>

#include <cstdio>
#include <cstdlib>
#include <string>

namespace {
auto default_config() -> std::string {
  if (const char *env = std::getenv("KSUID_CONFIG"); env && *env) {
    return env;
  }
  return {};
}

auto format_names() -> std::string {
  std::string out;
  for (const auto &name : ksuid::util::enum_names<ksuid::OutputFormat>()) {
    if (!out.empty())
      out += ", ";
    out += name;
  }
  return out;
}
} // namespace

int main(int argc, char *argv[]) {
  // Identifiers go to stdout; keep diagnostics out of the way.
  ksuid::log::set_output_stderr();
  ksuid::log::set_level(ksuid::log::Level::Warn);

  CLI::App app{"ksuid", "Generate and inspect K-Sortable Unique IDentifiers"};
  app.footer("\nExamples:\n"
             "  ksuid -n 4\n"
             "  ksuid -f inspect 0ujtsYcgvSTl8PAuAdqWYSMnLOv\n"
             "  ksuid -f template -t '{{ .Time }} {{ .Payload }}'\n"
             "\nTip: Set KSUID_CONFIG=ksuid.toml to load defaults.");

  ksuid::cli::GenerateOptions opts;
  opts.config_file = default_config();

  app.add_option("-n", opts.count,
                 "Number of KSUIDs to generate when called with no other "
                 "arguments");
  app.add_option("-f", opts.format, "One of " + format_names());
  app.add_option("-t", opts.template_text,
                 "The template used to format the output");
  app.add_flag("-v", opts.verbose, "Turn on verbose mode");
  app.add_option("-c,--config", opts.config_file, "Config file (TOML)")
      ->check(CLI::ExistingFile);
  app.add_option("--log-level", opts.log_level,
                 "Log level override: trace|debug|info|warn|error");
  app.add_option("--log-file", opts.log_file, "Append logs to this file");
  app.add_option("ksuids", opts.ids, "KSUIDs to parse and print");

  CLI11_PARSE(app, argc, argv);

  const int rc = ksuid::cli::cmd_generate(opts);
  if (rc != 0) {
    std::fputs(app.help().c_str(), stderr);
  }
  return rc;
}
