#include "diagnostics.hpp"
#include <text/file_registry.hpp>
#include <text/utf8.hpp>
#include <sstream>

namespace voxlasm {
namespace diagnostics {

std::string headline(const lexer::LexError& error) {
    text::Position start = error.start();
    std::ostringstream oss;
    oss << (error.file() ? error.file()->name : std::string("<input>"))
        << ":" << start.row + 1 << ":" << start.column + 1
        << ": error: " << error.what();
    return oss.str();
}

std::string source_excerpt(const lexer::LexError& error) {
    const auto& file = error.file();
    if (!file) return {};

    text::Position start = error.start();
    text::Position end = error.end();

    std::string line = file->line(start.row);

    // Tabs are kept in the marker line so it lines up under the source
    std::u32string decoded = text::decode_utf8(line);
    std::string marker;
    for (size_t i = 0; i < start.column && i < decoded.size(); ++i) {
        marker += (decoded[i] == U'\t') ? '\t' : ' ';
    }
    for (size_t i = decoded.size(); i < start.column; ++i) {
        marker += ' ';
    }

    marker += '^';
    size_t length = end.offset > start.offset ? end.offset - start.offset : 1;
    for (size_t i = 1; i < length; ++i) {
        marker += '~';
    }

    return " " + line + "\n " + marker + "\n";
}

std::string render(const lexer::LexError& error) {
    return headline(error) + "\n" + source_excerpt(error);
}

}  // namespace diagnostics
}  // namespace voxlasm
