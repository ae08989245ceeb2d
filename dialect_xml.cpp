#include "dialect_xml.hpp"

#include <libxml/parser.h>
#include <libxml/tree.h>

#include <climits>
#include <format>
#include <fstream>
#include <memory>
#include <optional>
#include <sstream>

namespace sax2md {

namespace {

    using DocPtr = std::unique_ptr<xmlDoc, decltype(&xmlFreeDoc)>;

    bool is_element(xmlNodePtr n, const char* name) {
        return n->type == XML_ELEMENT_NODE && xmlStrEqual(n->name, BAD_CAST name);
    }

    std::optional<std::string> get_prop(xmlNodePtr n, const char* key) {
        xmlChar* raw = xmlGetProp(n, BAD_CAST key);
        if (raw == nullptr) return std::nullopt;
        std::string value(reinterpret_cast<const char*>(raw));
        xmlFree(raw);
        return value;
    }

    std::expected<bool, std::string> parse_flag(const std::optional<std::string>& v, std::string_view where) {
        if (!v || v->empty() || *v == "false" || *v == "0" || *v == "no") return false;
        if (*v == "true" || *v == "1" || *v == "yes") return true;
        return std::unexpected(std::format("{}: expected a boolean, got \"{}\"", where, *v));
    }

    std::expected<TagSpec, std::string> parse_tag(xmlNodePtr node, const std::string& name) {
        TagSpec spec;
        spec.open = get_prop(node, "open").value_or("");
        spec.close = get_prop(node, "close").value_or("");

        auto block = parse_flag(get_prop(node, "block"), std::format("<tag name=\"{}\"> block", name));
        if (!block) return std::unexpected(block.error());
        spec.block = *block;

        spec.indent_text = get_prop(node, "indent").value_or("");
        spec.indent = !spec.indent_text.empty();

        for (xmlNodePtr c = node->children; c != nullptr; c = c->next) {
            if (c->type != XML_ELEMENT_NODE) continue;
            if (!is_element(c, "attr")) {
                return std::unexpected(std::format("<tag name=\"{}\">: unexpected element <{}> (line {})",
                                                   name, reinterpret_cast<const char*>(c->name), xmlGetLineNo(c)));
            }
            auto key = get_prop(c, "key");
            if (!key || key->empty()) {
                return std::unexpected(std::format("<tag name=\"{}\">: <attr> without key (line {})", name, xmlGetLineNo(c)));
            }
            spec.attrs.push_back({*key, get_prop(c, "open").value_or(""), get_prop(c, "close").value_or("")});
        }
        return spec;
    }

    std::expected<Dialect, std::string> build_dialect(xmlDocPtr doc) {
        xmlNodePtr root = xmlDocGetRootElement(doc);
        if (root == nullptr || !is_element(root, "dialect")) {
            return std::unexpected(std::string("root element must be <dialect>"));
        }

        Dialect dialect;
        std::string base = get_prop(root, "base").value_or("markdown");
        if (base == "markdown") dialect = Dialect::markdown();
        else if (base != "empty") return std::unexpected(std::format("unknown dialect base \"{}\"", base));

        for (xmlNodePtr n = root->children; n != nullptr; n = n->next) {
            if (n->type != XML_ELEMENT_NODE) continue;
            if (!is_element(n, "tag")) {
                return std::unexpected(std::format("unexpected element <{}> (line {})",
                                                   reinterpret_cast<const char*>(n->name), xmlGetLineNo(n)));
            }
            auto name = get_prop(n, "name");
            if (!name || name->empty()) {
                return std::unexpected(std::format("<tag> without name (line {})", xmlGetLineNo(n)));
            }
            auto spec = parse_tag(n, *name);
            if (!spec) return std::unexpected(spec.error());
            dialect.set(*name, std::move(*spec));
        }
        return dialect;
    }

}

std::expected<Dialect, std::string> parse_dialect(std::string_view xml) {
    if (xml.size() > static_cast<size_t>(INT_MAX)) {
        return std::unexpected(std::string("dialect file too large for the XML parser"));
    }
    xmlInitParser();
    DocPtr doc(xmlReadMemory(xml.data(), static_cast<int>(xml.size()), "dialect.xml", nullptr,
                             XML_PARSE_NONET | XML_PARSE_NOERROR | XML_PARSE_NOWARNING),
               &xmlFreeDoc);
    if (!doc) {
        const xmlError* err = xmlGetLastError();
        if (err != nullptr && err->message != nullptr) {
            std::string msg = err->message;
            while (!msg.empty() && msg.back() == '\n') msg.pop_back();
            return std::unexpected(std::format("malformed dialect XML (line {}): {}", err->line, msg));
        }
        return std::unexpected(std::string("malformed dialect XML"));
    }
    return build_dialect(doc.get());
}

std::expected<Dialect, std::string> load_dialect(const std::string& path) {
    std::ifstream f(path);
    if (!f) return std::unexpected(std::format("could not open dialect file {}", path));
    std::stringstream buf;
    buf << f.rdbuf();
    auto dialect = parse_dialect(buf.str());
    if (!dialect) return std::unexpected(std::format("{}: {}", path, dialect.error()));
    return dialect;
}

}
