// main.cpp – `tiki` command-line front end: view, export, validate.
//
// Usage:
//   tiki [--config <file.xml>] view <file>
//   tiki [--config <file.xml>] export <file> [--format json|ascii|tree] [-o <path>]
//   tiki [--config <file.xml>] validate <file> [-v]

#include "TerminalSession.hpp"

#include "TikiLang/ConfigLoader.hpp"
#include "TikiLang/JsonExport.hpp"
#include "TikiLang/Metadata.hpp"
#include "TikiLang/Navigator.hpp"
#include "TikiLang/Output.hpp"
#include "TikiLang/Parser.hpp"
#include "TikiLang/Renderer.hpp"

#include <unistd.h>

#include <filesystem>
#include <iostream>
#include <optional>
#include <stdexcept>
#include <string>
#include <vector>

namespace fs = std::filesystem;
using namespace tiki;

namespace {

constexpr const char* kVersion = "0.1.0";

// ─── Command line ─────────────────────────────────────────────────────────────

struct CliOptions {
    std::string                command;
    std::string                file;
    std::optional<fs::path>    config;
    std::string                format{"tree"};
    std::optional<fs::path>    output;
    bool                       verbose{false};
    bool                       help{false};
    bool                       version{false};
};

// Bad command line; reported with the usage text.
class UsageError : public std::runtime_error {
public:
    using std::runtime_error::runtime_error;
};

void printUsage(std::ostream& os) {
    os << "Tiki hierarchical specification language tools\n"
          "\n"
          "Usage: tiki [--config <file.xml>] <command> [options]\n"
          "\n"
          "Commands:\n"
          "  view <file>                     browse a .tiki file interactively\n"
          "  export <file> [options]         export to another format\n"
          "      --format json|ascii|tree    output format (default: tree)\n"
          "      --output, -o <path>         output file (default: stdout)\n"
          "  validate <file> [--verbose|-v]  check syntax and report structure\n"
          "\n"
          "Global options:\n"
          "  --config <file.xml>             parser and style configuration\n"
          "  --help, -h                      show this message\n"
          "  --version                       show the version\n";
}

CliOptions parseArgs(int argc, char* argv[]) {
    CliOptions opt;
    std::vector<std::string> positional;

    auto value = [&](int& i, const std::string& flag) -> std::string {
        if (i + 1 >= argc)
            throw UsageError("option " + flag + " requires a value");
        return argv[++i];
    };

    for (int i = 1; i < argc; ++i) {
        const std::string arg = argv[i];
        if      (arg == "--help" || arg == "-h")     opt.help = true;
        else if (arg == "--version")                 opt.version = true;
        else if (arg == "--verbose" || arg == "-v")  opt.verbose = true;
        else if (arg == "--config")                  opt.config = value(i, arg);
        else if (arg == "--format")                  opt.format = value(i, arg);
        else if (arg == "--output" || arg == "-o")   opt.output = value(i, arg);
        else if (arg.size() > 1 && arg[0] == '-')    throw UsageError("unknown option " + arg);
        else                                         positional.push_back(arg);
    }
    if (opt.help || opt.version)
        return opt;

    if (positional.empty())
        throw UsageError("no command given");
    opt.command = positional[0];
    if (opt.command != "view" && opt.command != "export" && opt.command != "validate")
        throw UsageError("unknown command '" + opt.command + "'");
    if (positional.size() != 2)
        throw UsageError(opt.command + " expects exactly one file argument");
    opt.file = positional[1];

    if (opt.command == "export" &&
        opt.format != "json" && opt.format != "ascii" && opt.format != "tree")
        throw UsageError("--format must be one of json, ascii, tree");
    if (opt.output && opt.command != "export")
        throw UsageError("--output only applies to export");
    if (opt.verbose && opt.command != "validate")
        throw UsageError("--verbose only applies to validate");
    return opt;
}

bool useColor(const Config& cfg, bool to_terminal) {
    switch (cfg.color) {
    case ColorMode::Always: return true;
    case ColorMode::Never:  return false;
    case ColorMode::Auto:   break;
    }
    return to_terminal;
}

void printWarnings(const Document& doc) {
    for (const auto& w : doc.warnings)
        std::cerr << "[tiki] warning: " << w << '\n';
}

// ─── Commands ─────────────────────────────────────────────────────────────────

int runView(const CliOptions& opt, const Config& cfg) {
    const fs::path path = opt.file;
    if (!fs::exists(path)) {
        std::cerr << "[tiki] error: File not found: " << path.string() << '\n';
        return 1;
    }
    if (!app::terminalAvailable()) {
        std::cerr << "[tiki] error: view needs an interactive terminal\n";
        return 1;
    }

    Document doc = Parser(cfg.parse).parseFile(path);
    printWarnings(doc);

    Navigator nav(*doc.root, StyledRenderer(cfg.style, useColor(cfg, true)));
    app::TerminalSession session(nav, "Tiki Specification: " + path.filename().string());
    return session.run();
}

int runExport(const CliOptions& opt, const Config& cfg) {
    const fs::path path = opt.file;
    Document doc = Parser(cfg.parse).parseFile(path);
    printWarnings(doc);

    std::string content;
    if (opt.format == "json") {
        content = toJsonString(doc);
    } else if (opt.format == "ascii") {
        content = renderAsciiTree(*doc.root, cfg.style.collapse_marker);
    } else {
        const bool color = useColor(cfg, !opt.output && ::isatty(STDOUT_FILENO) == 1);
        StyledRenderer renderer(cfg.style, color);
        content = renderer.render(*doc.root, nullptr,
                                  "Tiki Specification: " + path.filename().string());
    }

    if (!opt.output) {
        writeText(content, std::cout);
        return 0;
    }

    writeTextFile(content, *opt.output);
    std::cout << "Exported to: " << opt.output->string() << '\n';
    return 0;
}

int runValidate(const CliOptions& opt, const Config& cfg) {
    const fs::path path = opt.file;
    Document doc;
    try {
        doc = Parser(cfg.parse).parseFile(path);
    } catch (const SyntaxError& e) {
        std::cout << "✗ Invalid Tiki file: " << path.string() << '\n';
        std::cout << "Error: " << e.what() << '\n';
        if (opt.verbose)
            std::cout << "Tip: Check the syntax around line " << e.line() << '\n';
        return 1;
    } catch (const FileAccessError& e) {
        std::cout << "✗ Validation failed: " << path.string() << '\n';
        std::cout << "Error: " << e.what() << '\n';
        return 1;
    }

    const ConceptNode& root = *doc.root;
    std::cout << "✓ Valid Tiki file: " << path.string() << '\n';
    std::cout << "Concepts: " << root.conceptCount() << '\n';
    if (!opt.verbose) {
        printWarnings(doc);
        return 0;
    }

    std::cout << "Root concept: " << root.title() << '\n';
    std::cout << "Max depth: " << root.maxDepth() << '\n';
    if (!doc.frontmatter.empty()) {
        std::cout << "Frontmatter:\n";
        for (const auto& [key, value] : doc.frontmatter)
            std::cout << "  " << key << ": " << formatValue(value) << '\n';
    }
    if (!doc.warnings.empty()) {
        std::cout << "Warnings:\n";
        for (const auto& w : doc.warnings)
            std::cout << "  " << w << '\n';
    }

    const bool color = useColor(cfg, ::isatty(STDOUT_FILENO) == 1);
    StyledRenderer renderer(cfg.style, color);
    std::cout << '\n' << renderer.render(root, nullptr, "Parsed Structure:") << '\n';
    return 0;
}

} // namespace

// ─────────────────────────────────────────────────────────────────────────────
//  main
// ─────────────────────────────────────────────────────────────────────────────
int main(int argc, char* argv[]) {
    CliOptions opt;
    try {
        opt = parseArgs(argc, argv);
    } catch (const UsageError& e) {
        std::cerr << "[tiki] usage error: " << e.what() << "\n\n";
        printUsage(std::cerr);
        return 1;
    }

    if (opt.help) {
        printUsage(std::cout);
        return 0;
    }
    if (opt.version) {
        std::cout << "tiki " << kVersion << '\n';
        return 0;
    }

    try {
        const Config cfg = opt.config ? loadConfig(*opt.config) : Config{};

        if (opt.command == "view")     return runView(opt, cfg);
        if (opt.command == "export")   return runExport(opt, cfg);
        return runValidate(opt, cfg);
    } catch (const ConfigLoadError& e) {
        std::cerr << "[tiki] config error: " << e.what() << '\n';
    } catch (const SyntaxError& e) {
        std::cerr << "[tiki] parse error: " << e.what() << '\n';
    } catch (const FileAccessError& e) {
        std::cerr << "[tiki] file error: " << e.what() << '\n';
    } catch (const ExportError& e) {
        std::cerr << "[tiki] export error: " << e.what() << '\n';
    } catch (const TikiError& e) {
        std::cerr << "[tiki] error: " << e.what() << '\n';
    } catch (const std::filesystem::filesystem_error& e) {
        std::cerr << "[tiki] file error: " << e.what() << '\n';
    }
    return 1;
}
