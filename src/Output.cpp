// Output.cpp – Shared text writers for the exporters and the CLI.

#include "TikiLang/Output.hpp"

#include <fstream>

namespace tiki {

void writeText(std::string_view text, std::ostream& out) {
    out << text << '\n';
    out.flush();
    if (!out)
        throw ExportError("failed to write output");
}

void writeTextFile(std::string_view text, const std::filesystem::path& path) {
    std::ofstream out(path, std::ios::binary | std::ios::trunc);
    if (!out)
        throw ExportError("cannot open '" + path.string() + "' for writing");
    out << text << '\n';
    out.flush();
    if (!out)
        throw ExportError("failed writing '" + path.string() + "'");
}

} // namespace tiki
