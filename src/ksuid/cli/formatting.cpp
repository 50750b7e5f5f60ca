#include "ksuid/cli/formatting.hpp"

#include "ksuid/cli/template_renderer.hpp"

#include <string>

namespace ksuid::cli {

auto format_id(const Ksuid &id, OutputFormat format, std::string_view tmpl)
    -> Result<std::string> {
  switch (format) {
  case OutputFormat::String:
    return ok(id.str() + "\n");
  case OutputFormat::Inspect:
    return ok(fmt::format_inspect(id));
  case OutputFormat::Time:
    return ok(util::format_utc_timestamp(id.time()) + "\n");
  case OutputFormat::Timestamp:
    return ok(std::to_string(id.timestamp()) + "\n");
  case OutputFormat::Payload:
    return ok(fmt::raw_bytes(id.payload()));
  case OutputFormat::Raw:
    return ok(fmt::raw_bytes(id.bytes()));
  case OutputFormat::Template:
    return render_template(tmpl, TemplateContext::from(id))
        .transform([](std::string s) { return s + "\n"; });
  }
  return fail(Error::InvalidArgument);
}

} // namespace ksuid::cli
