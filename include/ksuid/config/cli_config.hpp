#pragma once

#include "ksuid/util/enum.hpp"
#include <boost/describe/enum.hpp>
#include <cstdint>
#include <string>

namespace ksuid {

enum class OutputFormat : std::uint8_t {
  String,
  Inspect,
  Time,
  Timestamp,
  Payload,
  Raw,
  Template
};
BOOST_DESCRIBE_ENUM(OutputFormat, String, Inspect, Time, Timestamp, Payload,
                    Raw, Template)
KSUID_DEFINE_ENUM_SERDE(OutputFormat)

// Defaults for the `ksuid` command; every field can be overridden on the
// command line.
struct CliConfig {
  int count{1};
  OutputFormat format{OutputFormat::String};
  std::string template_text;
  bool verbose{false};
  std::string log_level{"warn"};
  std::string log_file;

  auto operator==(const CliConfig &) const -> bool = default;
};

} // namespace ksuid
