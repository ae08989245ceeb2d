#include "dialect.hpp"

#include <algorithm>
#include <cctype>

namespace sax2md {

TagKind classify_tag(std::string_view tag_name) {
    std::string name(tag_name);
    std::transform(name.begin(), name.end(), name.begin(), [](unsigned char c) { return static_cast<char>(std::tolower(c)); });
    if (name == "li") return TagKind::LIST_ITEM;
    if (name == "ol") return TagKind::ORDERED_LIST;
    if (name == "ul") return TagKind::UNORDERED_LIST;
    if (name == "code") return TagKind::CODE_BLOCK;
    if (name == "pre") return TagKind::PREFORMATTED;
    return TagKind::OTHER;
}

const TagSpec* Dialect::resolve(std::string_view name) const {
    auto it = tags.find(std::string(name));
    if (it == tags.end()) return nullptr;
    return &it->second;
}

void Dialect::set(std::string name, TagSpec spec) {
    tags.insert_or_assign(std::move(name), std::move(spec));
}

bool Dialect::erase(std::string_view name) {
    return tags.erase(std::string(name)) > 0;
}

Dialect Dialect::markdown() {
    Dialect d;

    TagSpec bold{"**", "**"};
    TagSpec italic{"*", "*"};
    d.set("b", bold);
    d.set("strong", bold);
    d.set("i", italic);
    d.set("em", italic);

    TagSpec img{"!", ""};
    img.attrs = {{"alt", "[", "]"}, {"src", "(", ")"}};
    d.set("img", img);

    TagSpec anchor;
    anchor.attrs = {{std::string(TEXT_ATTR), "[", "]"}, {"href", "(", ")"}};
    d.set("a", anchor);

    TagSpec quote{"> ", ""};
    quote.block = true;
    quote.indent = true;
    quote.indent_text = "> ";
    d.set("blockquote", quote);

    TagSpec code{"```\n", "\n```"};
    code.block = true;
    d.set("code", code);
    d.set("pre", TagSpec{"`", "`"});

    TagSpec para;
    para.block = true;
    d.set("p", para);

    TagSpec list;
    list.block = true;
    list.indent = true;
    list.indent_text = "\t";
    d.set("ol", list);
    d.set("ul", list);
    d.set(std::string(ORDERED_ITEM), TagSpec{"1. ", "\n"});
    d.set(std::string(UNORDERED_ITEM), TagSpec{"* ", "\n"});

    TagSpec rule{"- - -", ""};
    rule.block = true;
    d.set("hr", rule);

    for (int level = 1; level <= 6; ++level) {
        TagSpec heading{std::string(level, '#') + " ", ""};
        heading.block = true;
        d.set("h" + std::to_string(level), heading);
    }
    return d;
}

}
