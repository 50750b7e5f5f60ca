#include "ksuid/cli/template_renderer.hpp"

#include "ksuid/cli/formatting.hpp"
#include "ksuid/util/log.hpp"
#include "ksuid/util/time.hpp"

#include <boost/algorithm/string/trim.hpp>

#include <string>
#include <string_view>

namespace ksuid::cli {

auto TemplateContext::from(const Ksuid &id) -> TemplateContext {
  return TemplateContext{.string = id.str(),
                         .raw = fmt::hex_upper(id.bytes()),
                         .time = util::format_utc_timestamp(id.time()),
                         .timestamp = id.timestamp(),
                         .payload = fmt::hex_upper(id.payload())};
}

namespace {

// Returns false when `field` is not a known template field.
auto try_replace_field(std::string &output, std::string_view field,
                       const TemplateContext &ctx) -> bool {
  if (field == "String") {
    output.append(ctx.string);
    return true;
  }
  if (field == "Raw") {
    output.append(ctx.raw);
    return true;
  }
  if (field == "Time") {
    output.append(ctx.time);
    return true;
  }
  if (field == "Timestamp") {
    output.append(std::to_string(ctx.timestamp));
    return true;
  }
  if (field == "Payload") {
    output.append(ctx.payload);
    return true;
  }
  return false;
}

} // namespace

auto render_template(std::string_view tmpl, const TemplateContext &ctx)
    -> Result<std::string> {
  std::string output;
  output.reserve(tmpl.size() * 2);

  std::size_t pos = 0;
  while (pos < tmpl.size()) {
    // Escape sequence: \{{ -> {{
    if (pos + 2 < tmpl.size() && tmpl[pos] == '\\' && tmpl[pos + 1] == '{' &&
        tmpl[pos + 2] == '{') {
      output.append("{{");
      pos += 3;
      continue;
    }

    if (pos + 1 < tmpl.size() && tmpl[pos] == '{' && tmpl[pos + 1] == '{') {
      auto close_pos = tmpl.find("}}", pos + 2);
      if (close_pos == std::string_view::npos) {
        output.append("{{");
        pos += 2;
        continue;
      }

      auto token = boost::trim_copy(tmpl.substr(pos + 2, close_pos - pos - 2));
      std::string_view field{token};
      if (field.starts_with('.')) {
        field.remove_prefix(1);
      }

      if (!try_replace_field(output, field, ctx)) {
        log::error("Template references unknown field '{}'", token);
        return fail(Error::InvalidArgument);
      }
      pos = close_pos + 2;
      continue;
    }

    output.push_back(tmpl[pos]);
    ++pos;
  }

  return ok(std::move(output));
}

} // namespace ksuid::cli
