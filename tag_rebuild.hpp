#pragma once

#include <string>
#include <string_view>

#include "events.hpp"

namespace sax2md {

    enum class TagPhase { OPEN, CLOSE };

    bool is_void_tag_name(std::string_view name);

    std::string escape_attr_value(std::string_view s);

    // Literal markup for a tag the dialect does not map. Void elements have
    // no closing tag, so their CLOSE phase yields "".
    std::string rebuild_tag(std::string_view name, const Attrs& attrs, TagPhase phase);
    std::string rebuild_tag(std::string_view name, TagPhase phase);

}
