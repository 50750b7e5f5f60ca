#pragma once

#include "ksuid/core/error.hpp"
#include "ksuid/id/ksuid.hpp"

#include <cstdint>
#include <string>
#include <string_view>

namespace ksuid::cli {

// Values a `-t` template can reference as {{ .Name }}.
struct TemplateContext {
  std::string string;
  std::string raw;
  std::string time;
  std::uint32_t timestamp{0};
  std::string payload;

  [[nodiscard]] static auto from(const Ksuid &id) -> TemplateContext;
};

// Expands {{ .String }}, {{ .Raw }}, {{ .Time }}, {{ .Timestamp }} and
// {{ .Payload }}. `\{{` emits a literal "{{"; an unterminated "{{" is copied
// through. Any other field name fails with Error::InvalidArgument.
[[nodiscard]] auto render_template(std::string_view tmpl,
                                   const TemplateContext &ctx)
    -> Result<std::string>;

} // namespace ksuid::cli
