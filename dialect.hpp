#pragma once

#include <string>
#include <string_view>
#include <unordered_map>
#include <vector>

// -----------------------------------------------------------------------------
// Dialect table: tag name -> rendering rule for the target markup.
// -----------------------------------------------------------------------------

namespace sax2md {

    // Attribute rendering rule. The key "text" stands for the element's own
    // inner text rather than a markup attribute.
    struct AttrRule {
        std::string key;
        std::string open;
        std::string close;
    };

    inline constexpr std::string_view TEXT_ATTR = "text";

    struct TagSpec {
        std::string open;
        std::string close;
        bool block = false;
        bool indent = false;
        std::string indent_text;
        std::vector<AttrRule> attrs; // declared order is render order
    };

    // Tags whose handling differs from plain table lookup.
    enum class TagKind { OTHER, LIST_ITEM, ORDERED_LIST, UNORDERED_LIST, CODE_BLOCK, PREFORMATTED };

    TagKind classify_tag(std::string_view name);

    // Lookup names of the two synthetic list-item variants.
    inline constexpr std::string_view ORDERED_ITEM = "olli";
    inline constexpr std::string_view UNORDERED_ITEM = "ulli";

    class Dialect {
        std::unordered_map<std::string, TagSpec> tags;

    public:
        Dialect() = default;

        // nullptr when the name is not mapped
        const TagSpec* resolve(std::string_view name) const;

        void set(std::string name, TagSpec spec);
        bool erase(std::string_view name);
        size_t size() const { return tags.size(); }

        static Dialect markdown();
    };

}
