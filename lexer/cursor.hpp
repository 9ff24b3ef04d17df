#ifndef VOXLASM_LEXER_CURSOR_HPP
#define VOXLASM_LEXER_CURSOR_HPP

#include <text/position.hpp>
#include <memory>
#include <optional>
#include <string>
#include <string_view>

namespace voxlasm {
namespace lexer {

// Read position over a decoded character buffer.
// The index only moves forward. advance_line() is the only way to step over
// a newline; every other character goes through advance().
class Cursor {
public:
    Cursor(std::u32string chars, std::shared_ptr<const text::FileInfo> file);

    std::optional<char32_t> current() const;
    std::optional<char32_t> peek(size_t offset = 1) const;

    bool at_end() const { return index_ >= chars_.size(); }

    void advance();
    void advance_line();

    text::Position position() const { return {index_, row_, col_}; }

    // Range over the last `length` consumed characters; they must all lie on
    // the current line
    text::TextRange range_back(size_t length) const;

    // Range from an earlier position on the current line to the cursor
    text::TextRange range_from(const text::Position& start) const;

    // Zero-width range at the cursor
    text::TextRange empty_range() const;

    // Characters in [start, start + length) of the buffer
    std::u32string_view view(size_t start, size_t length) const;

    const std::shared_ptr<const text::FileInfo>& file() const { return file_; }

private:
    std::u32string chars_;
    std::shared_ptr<const text::FileInfo> file_;
    size_t index_ = 0;
    size_t row_ = 0;
    size_t col_ = 0;
};

}  // namespace lexer
}  // namespace voxlasm

#endif // VOXLASM_LEXER_CURSOR_HPP
