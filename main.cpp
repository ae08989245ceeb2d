#include <fstream>
#include <iostream>
#include <sstream>
#include <string>

#include "converter.hpp"
#include "dialect_xml.hpp"

namespace {

const char* kind_name(sax2md::DiagnosticKind kind) {
    switch (kind) {
    case sax2md::DiagnosticKind::MISMATCHED_CLOSE: return "mismatched-close";
    case sax2md::DiagnosticKind::UNCLOSED_TAG:     return "unclosed-tag";
    case sax2md::DiagnosticKind::UNMAPPED_TAG:     return "unmapped-tag";
    }
    return "diagnostic";
}

void print_usage(std::ostream& os, const char* argv0) {
    os << "Usage: " << argv0 << " [-strip] [-dialect <file.xml>] [-v] [input.html]\n"
       << "  Converts HTML to Markdown. Reads stdin when no input file is given.\n"
       << "  -strip            drop tags the dialect does not map\n"
       << "  -dialect <file>   load dialect overrides from an XML file\n"
       << "  -v                report mismatched and unmapped tags on stderr\n"
       << "  -h                print this help\n";
}

}

int main(int argc, char** argv) {
    sax2md::Options options;
    std::string input_path;
    bool verbose = false;

    for (int i = 1; i < argc; ++i) {
        std::string arg = argv[i];
        if (arg == "-h" || arg == "--help") { print_usage(std::cout, argv[0]); return 0; }
        if (arg == "-strip") { options.strip_tags = true; continue; }
        if (arg == "-v") { verbose = true; continue; }
        if (arg == "-dialect") {
            if (i + 1 >= argc) {
                std::cerr << "-dialect needs a file argument\n";
                print_usage(std::cerr, argv[0]);
                return 2;
            }
            auto dialect = sax2md::load_dialect(argv[++i]);
            if (!dialect) {
                std::cerr << "error: " << dialect.error() << "\n";
                return 1;
            }
            options.dialect = std::move(*dialect);
            continue;
        }
        if (!arg.empty() && arg[0] == '-' && arg != "-") {
            std::cerr << "unknown option: " << arg << "\n";
            print_usage(std::cerr, argv[0]);
            return 2;
        }
        if (!input_path.empty()) {
            std::cerr << "only one input file is accepted\n";
            print_usage(std::cerr, argv[0]);
            return 2;
        }
        input_path = arg;
    }

    if (verbose) {
        options.on_diagnostic = [](const sax2md::Diagnostic& d) {
            std::cerr << "warning: " << kind_name(d.kind) << ": " << d.message << "\n";
        };
    }

    std::stringstream buffer;
    if (input_path.empty() || input_path == "-") {
        buffer << std::cin.rdbuf();
    } else {
        std::ifstream file(input_path);
        if (!file) {
            std::cerr << "Could not open file " << input_path << "\n";
            return 1;
        }
        buffer << file.rdbuf();
    }

    sax2md::Converter converter(std::move(options));
    auto markdown = converter.convert(buffer.str());
    if (!markdown) {
        std::cerr << "error: " << markdown.error() << "\n";
        return 1;
    }
    std::cout << *markdown;
    return 0;
}
