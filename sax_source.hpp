#pragma once

#include <expected>
#include <string>
#include <string_view>

#include "events.hpp"

// -----------------------------------------------------------------------------
// HTML tokenizer: libxml2's HTML SAX parser forwarding into an EventSink.
// -----------------------------------------------------------------------------

namespace sax2md {

    // Runs the whole input through the parser. Unclosed elements are closed by
    // libxml2 at end of input. Fails only if a parser cannot be created.
    std::expected<void, std::string> parse_html(std::string_view html, EventSink& sink);

}
