#pragma once

#include <expected>
#include <string>
#include <string_view>

#include "dialect.hpp"
#include "render_machine.hpp"

// -----------------------------------------------------------------------------
// HTML -> dialect markup facade.
// -----------------------------------------------------------------------------

namespace sax2md {

    struct Options {
        Dialect dialect = Dialect::markdown();
        bool strip_tags = false;
        DiagnosticHandler on_diagnostic;
    };

    // Drops newline and tab characters; the source markup treats them as
    // insignificant.
    std::string strip_layout_whitespace(std::string_view html);

    class Converter {
        Options options;

    public:
        Converter() = default;
        explicit Converter(Options opts) : options(std::move(opts)) {}

        // Each call renders with its own machine and parser; nothing carries
        // over between calls.
        std::expected<std::string, std::string> convert(std::string_view html) const;

        const Options& config() const { return options; }
    };

}
