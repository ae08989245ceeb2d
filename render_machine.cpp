#include "render_machine.hpp"

#include <format>
#include <iterator>

#include "tag_rebuild.hpp"

namespace sax2md {

std::string collapse_whitespace(std::string_view s) {
    std::string out;
    out.reserve(s.size());
    for (char c : s) {
        if (c == ' ' && !out.empty() && out.back() == ' ') continue;
        if (c == '\n' && !out.empty() && out.back() == ' ') out.pop_back();
        out += c;
    }
    return out;
}

RenderMachine::RenderMachine(const Dialect& dialect, RenderOptions options)
    : dialect(dialect), options(std::move(options)) {}

void RenderMachine::reset() {
    out.clear();
    open_tags.clear();
    list_types.clear();
    indents.clear();
    splices.clear();
    open_items = 0;
    current = {};
}

/**
 * ------------------------------------------------------------------------
 * Buffer helpers
 * ------------------------------------------------------------------------
 */
RenderMachine::Cursor RenderMachine::emit(std::string fragment) {
    // While a tag defers its text everything lands at its cursor, in order.
    if (!splices.empty()) return out.insert(splices.back().at, std::move(fragment));
    out.push_back(std::move(fragment));
    return std::prev(out.end());
}

// Where the next fragment goes: the active splice cursor, else the end.
RenderMachine::Buffer::const_iterator RenderMachine::insert_point() const {
    if (splices.empty()) return out.end();
    return splices.back().at;
}

std::string_view RenderMachine::last_fragment() const {
    for (auto it = insert_point(); it != out.begin();) {
        --it;
        if (!it->empty()) return *it;
    }
    return {};
}

bool RenderMachine::ends_with(std::string_view suffix) const {
    std::string tail;
    for (auto it = insert_point(); it != out.begin() && tail.size() < suffix.size();) {
        --it;
        tail.insert(0, *it);
    }
    return tail.ends_with(suffix);
}

void RenderMachine::report(DiagnosticKind kind, std::string_view tag, std::string message) const {
    if (options.on_diagnostic) options.on_diagnostic(Diagnostic{kind, std::string(tag), std::move(message)});
}

std::string RenderMachine::effective_name(std::string_view name, TagKind kind) const {
    if (kind != TagKind::LIST_ITEM || list_types.empty()) return std::string(name);
    return std::string(list_types.back() == TagKind::ORDERED_LIST ? ORDERED_ITEM : UNORDERED_ITEM);
}

/**
 * ------------------------------------------------------------------------
 * EVENT: open
 * ------------------------------------------------------------------------
 */
void RenderMachine::on_open(std::string_view name, const Attrs& attrs) {
    TagKind kind = classify_tag(name);
    if (kind == TagKind::LIST_ITEM) ++open_items;

    std::string lookup = effective_name(name, kind);
    const TagSpec* spec = dialect.resolve(lookup);
    current = OpenResult{std::string(name), spec};
    if (!spec) {
        report(DiagnosticKind::UNMAPPED_TAG, name, std::format("no dialect entry for <{}>", lookup));
        if (!options.strip_tags) emit(rebuild_tag(name, attrs, TagPhase::OPEN));
        return;
    }

    OpenTag entry{std::string(name), kind};
    if (kind == TagKind::ORDERED_LIST || kind == TagKind::UNORDERED_LIST) list_types.push_back(kind);

    // <pre><code> renders as a single code block; only the direct parent counts.
    if (kind == TagKind::CODE_BLOCK && !open_tags.empty() && open_tags.back().kind == TagKind::PREFORMATTED) {
        auto& wrapper = open_tags.back();
        if (wrapper.open_marker) {
            out.erase(*wrapper.open_marker);
            wrapper.open_marker.reset();
        }
        wrapper.absorbed = true;
    }

    /** Block spacing */
    if (spec->block && !out.empty() && !ends_with("\n\n")) {
        emit(indents.empty() ? "\n\n" : "\n");
    }

    /** Indent prefix */
    if (!indents.empty()) {
        std::string prefix;
        for (size_t i = 0; i < indents.size(); ++i) prefix += indents.back().unit;
        if (!prefix.empty()) emit(prefix);
    }

    // The outermost list level is not indented itself.
    if (spec->indent && list_types.size() != 1) {
        indents.push_back({std::string(name), spec->indent_text});
    }

    if (!spec->open.empty()) entry.open_marker = emit(spec->open);

    /** Attributes, in declared order */
    std::optional<Cursor> text_at;
    for (const auto& rule : spec->attrs) {
        if (!rule.open.empty()) emit(rule.open);
        if (rule.key == TEXT_ATTR) {
            // Inner text arrives later; it goes before everything emitted from here on.
            text_at = emit("");
        } else {
            for (const auto& [k, v] : attrs) {
                if (k == rule.key) {
                    if (!v.empty()) emit(v);
                    break;
                }
            }
        }
        if (!rule.close.empty()) emit(rule.close);
    }
    if (text_at) splices.push_back({std::string(name), *text_at});

    open_tags.push_back(std::move(entry));
}

/**
 * ------------------------------------------------------------------------
 * EVENT: text
 * ------------------------------------------------------------------------
 */
void RenderMachine::on_text(std::string_view value) {
    if (value.empty()) return;

    const TagSpec* spec = current.spec;
    if (spec && spec->block && !spec->open.empty() && last_fragment() != spec->open) {
        emit(spec->open);
    }

    if (!splices.empty()) {
        emit(std::string(value));
        return;
    }

    std::string text(value);
    if (open_items > 0 || (text == "\n" && ends_with("\n"))) {
        std::erase(text, '\n');
    }
    if (!text.empty()) emit(std::move(text));
}

/**
 * ------------------------------------------------------------------------
 * EVENT: close
 * ------------------------------------------------------------------------
 */
void RenderMachine::on_close(std::string_view name) {
    TagKind kind = classify_tag(name);
    if ((kind == TagKind::ORDERED_LIST || kind == TagKind::UNORDERED_LIST) &&
        !list_types.empty() && list_types.back() == kind) {
        list_types.pop_back();
    }
    // Items resolve against the list that is still open around them.
    std::string lookup = effective_name(name, kind);
    if (kind == TagKind::LIST_ITEM && open_items > 0) --open_items;

    if (current.spec && current.name == name) current = {};

    const TagSpec* spec = dialect.resolve(lookup);
    if (!spec) {
        if (!options.strip_tags) {
            std::string literal = rebuild_tag(name, TagPhase::CLOSE);
            if (!literal.empty()) emit(std::move(literal));
        }
        return;
    }

    bool matched = !open_tags.empty() && open_tags.back().name == name;

    // The code block inside an absorbed pre already closed the rendering.
    bool absorbed = matched && open_tags.back().absorbed;
    if (!absorbed && !spec->close.empty()) emit(spec->close);

    if (spec->indent && !indents.empty() && indents.back().name == name) indents.pop_back();

    if (!splices.empty() && splices.back().name == name) splices.pop_back();

    if (spec->block) emit(indents.empty() ? "\n\n" : "\n");

    if (matched) {
        open_tags.pop_back();
    } else {
        report(DiagnosticKind::MISMATCHED_CLOSE, name,
               open_tags.empty() ? std::format("</{}> with no open tag", name)
                                 : std::format("</{}> while <{}> is open", name, open_tags.back().name));
    }
}

/**
 * ------------------------------------------------------------------------
 * End of input
 * ------------------------------------------------------------------------
 */
size_t RenderMachine::close_open_tags() {
    size_t synthesized = 0;
    while (!open_tags.empty()) {
        std::string name = open_tags.back().name;
        size_t depth = open_tags.size();
        report(DiagnosticKind::UNCLOSED_TAG, name, std::format("<{}> closed at end of input", name));
        on_close(name);
        // An item whose list is gone no longer resolves, so pop it here.
        if (open_tags.size() == depth) open_tags.pop_back();
        ++synthesized;
    }
    return synthesized;
}

std::string RenderMachine::finish() {
    close_open_tags();
    std::string joined;
    for (const auto& fragment : out) joined += fragment;
    reset();
    return collapse_whitespace(joined);
}

std::string RenderMachine::render(const std::vector<Event>& events) {
    reset();
    replay(events, *this);
    return finish();
}

}
