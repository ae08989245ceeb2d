#include "sax_source.hpp"

#include <libxml/HTMLparser.h>
#include <libxml/parser.h>
#include <libxml/parserInternals.h>

#include <climits>

namespace sax2md {

namespace {

    // libxml2 splits character data around entity references; pending text is
    // flushed as one event before the next tag event.
    struct SaxState {
        EventSink& sink;
        std::string pending_text;

        void flush() {
            if (pending_text.empty()) return;
            sink.on_text(pending_text);
            pending_text.clear();
        }
    };

    const char* as_chars(const xmlChar* s) {
        return reinterpret_cast<const char*>(s);
    }

    void on_start_element(void* ctx, const xmlChar* name, const xmlChar** atts) {
        auto* state = static_cast<SaxState*>(ctx);
        state->flush();
        Attrs attrs;
        if (atts != nullptr) {
            for (int i = 0; atts[i] != nullptr; i += 2) {
                const xmlChar* value = atts[i + 1];
                attrs.emplace_back(as_chars(atts[i]), value ? as_chars(value) : "");
            }
        }
        state->sink.on_open(as_chars(name), attrs);
    }

    void on_end_element(void* ctx, const xmlChar* name) {
        auto* state = static_cast<SaxState*>(ctx);
        state->flush();
        state->sink.on_close(as_chars(name));
    }

    void on_characters(void* ctx, const xmlChar* ch, int len) {
        auto* state = static_cast<SaxState*>(ctx);
        state->pending_text.append(as_chars(ch), static_cast<size_t>(len));
    }

    // Malformed markup is recovered by the parser, so its reports are dropped.
    void ignore_parser_message(void*, const char*, ...) {}

}

std::expected<void, std::string> parse_html(std::string_view html, EventSink& sink) {
    if (html.empty()) return {};
    if (html.size() > static_cast<size_t>(INT_MAX)) {
        return std::unexpected(std::string("input too large for the HTML parser"));
    }
    xmlInitParser();

    htmlParserCtxtPtr ctxt = htmlCreateMemoryParserCtxt(html.data(), static_cast<int>(html.size()));
    if (ctxt == nullptr) {
        return std::unexpected(std::string("could not create HTML parser context"));
    }
    if (xmlSwitchEncoding(ctxt, XML_CHAR_ENCODING_UTF8) < 0) {
        htmlFreeParserCtxt(ctxt);
        return std::unexpected(std::string("could not switch the HTML parser to UTF-8"));
    }

    htmlSAXHandler handler{};
    handler.startElement = on_start_element;
    handler.endElement = on_end_element;
    handler.characters = on_characters;
    handler.ignorableWhitespace = on_characters;
    handler.warning = ignore_parser_message;
    handler.error = ignore_parser_message;
    handler.fatalError = ignore_parser_message;

    SaxState state{sink, {}};
    htmlSAXHandlerPtr default_sax = ctxt->sax;
    ctxt->sax = &handler;
    ctxt->userData = &state;
    htmlCtxtUseOptions(ctxt, HTML_PARSE_NOIMPLIED | HTML_PARSE_NONET);

    // Nonzero only for recoverable markup errors; events were still delivered.
    (void)htmlParseDocument(ctxt);

    ctxt->sax = default_sax;
    ctxt->userData = nullptr;
    htmlFreeParserCtxt(ctxt);

    state.flush();
    return {};
}

}
