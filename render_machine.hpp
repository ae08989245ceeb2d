#pragma once

#include <functional>
#include <list>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

#include "dialect.hpp"
#include "events.hpp"

// -----------------------------------------------------------------------------
// Render stack machine: parse events in, dialect markup out.
// -----------------------------------------------------------------------------

namespace sax2md {

    enum class DiagnosticKind { MISMATCHED_CLOSE, UNCLOSED_TAG, UNMAPPED_TAG };

    struct Diagnostic {
        DiagnosticKind kind;
        std::string tag;
        std::string message;
    };

    using DiagnosticHandler = std::function<void(const Diagnostic&)>;

    struct RenderOptions {
        bool strip_tags = false;         // drop unmapped markup instead of passing it through
        DiagnosticHandler on_diagnostic; // optional, never required for correct output
    };

    // Squeezes runs of spaces to one and drops a space right before a newline.
    std::string collapse_whitespace(std::string_view s);

    class RenderMachine : public EventSink {
    public:
        RenderMachine(const Dialect& dialect, RenderOptions options = {});
        RenderMachine(Dialect&&, RenderOptions = {}) = delete; // the table must outlive the machine

        // Open tags and splice frames hold cursors into this machine's own buffer.
        RenderMachine(const RenderMachine&) = delete;
        RenderMachine& operator=(const RenderMachine&) = delete;

        void on_open(std::string_view name, const Attrs& attrs) override;
        void on_text(std::string_view value) override;
        void on_close(std::string_view name) override;

        // Synthesizes a close for every tag still open, most recent first.
        // Returns the number of closes synthesized.
        size_t close_open_tags();

        // Closes what is left open, joins and cleans the buffer, resets state.
        std::string finish();

        // Convenience: replay + finish.
        std::string render(const std::vector<Event>& events);

        void reset();

        size_t open_depth() const { return open_tags.size(); }
        size_t indent_depth() const { return indents.size(); }
        bool splicing() const { return !splices.empty(); }

    private:
        using Buffer = std::list<std::string>;
        using Cursor = Buffer::iterator;

        struct OpenTag {
            std::string name;
            TagKind kind = TagKind::OTHER;
            std::optional<Cursor> open_marker;
            bool absorbed = false; // pre wrapper whose code child renders the block
        };

        struct IndentLevel {
            std::string name;
            std::string unit;
        };

        // Tag deferring its inner text; text is inserted before `at`.
        struct SpliceFrame {
            std::string name;
            Cursor at;
        };

        // Result of the last open event, read by the following text events.
        struct OpenResult {
            std::string name;
            const TagSpec* spec = nullptr;
        };

        const Dialect& dialect;
        RenderOptions options;

        Buffer out;
        std::vector<OpenTag> open_tags;
        std::vector<TagKind> list_types;
        std::vector<IndentLevel> indents;
        std::vector<SpliceFrame> splices;
        int open_items = 0;
        OpenResult current;

        std::string effective_name(std::string_view name, TagKind kind) const;
        Cursor emit(std::string fragment);
        Buffer::const_iterator insert_point() const;
        std::string_view last_fragment() const;
        bool ends_with(std::string_view suffix) const;
        void report(DiagnosticKind kind, std::string_view tag, std::string message) const;
    };

}
