#include "converter.hpp"

#include "sax_source.hpp"

namespace sax2md {

std::string strip_layout_whitespace(std::string_view html) {
    std::string out;
    out.reserve(html.size());
    for (char c : html) {
        if (c != '\n' && c != '\t') out += c;
    }
    return out;
}

std::expected<std::string, std::string> Converter::convert(std::string_view html) const {
    RenderMachine machine(options.dialect, RenderOptions{options.strip_tags, options.on_diagnostic});
    auto parsed = parse_html(strip_layout_whitespace(html), machine);
    if (!parsed) return std::unexpected(parsed.error());
    return machine.finish();
}

}
