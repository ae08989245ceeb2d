#include "tag_rebuild.hpp"

#include <algorithm>
#include <cctype>

namespace sax2md {

bool is_void_tag_name(std::string_view tag_name) {
    std::string t(tag_name);
    std::transform(t.begin(), t.end(), t.begin(), [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    return (t=="img"||t=="br"||t=="meta"||t=="link"||t=="hr"||t=="input"||t=="area"||t=="base"||t=="col"||t=="embed"||t=="param"||t=="source"||t=="track"||t=="wbr");
}

std::string escape_attr_value(std::string_view s) {
    std::string out;
    out.reserve(s.length());
    for (char c : s) {
        if (c == '&') out += "&amp;";
        else if (c == '<') out += "&lt;";
        else if (c == '>') out += "&gt;";
        else if (c == '"') out += "&quot;";
        else out += c;
    }
    return out;
}

std::string rebuild_tag(std::string_view name, const Attrs& attrs, TagPhase phase) {
    if (phase == TagPhase::CLOSE) {
        if (is_void_tag_name(name)) return "";
        return "</" + std::string(name) + ">";
    }
    std::string out = "<" + std::string(name);
    for (auto& [k, v] : attrs) {
        out += " " + k + "=\"" + escape_attr_value(v) + "\"";
    }
    out += ">";
    return out;
}

std::string rebuild_tag(std::string_view name, TagPhase phase) {
    return rebuild_tag(name, {}, phase);
}

}
