#include "cursor.hpp"
#include <utility>

namespace voxlasm {
namespace lexer {

Cursor::Cursor(std::u32string chars, std::shared_ptr<const text::FileInfo> file)
    : chars_(std::move(chars)), file_(std::move(file)) {}

std::optional<char32_t> Cursor::current() const {
    if (at_end()) return std::nullopt;
    return chars_[index_];
}

std::optional<char32_t> Cursor::peek(size_t offset) const {
    if (index_ + offset >= chars_.size()) return std::nullopt;
    return chars_[index_ + offset];
}

void Cursor::advance() {
    ++index_;
    ++col_;
}

void Cursor::advance_line() {
    ++index_;
    col_ = 0;
    ++row_;
}

text::TextRange Cursor::range_back(size_t length) const {
    text::Position start{index_ - length, row_, col_ - length};
    return text::TextRange(start, position(), file_);
}

text::TextRange Cursor::range_from(const text::Position& start) const {
    return text::TextRange(start, position(), file_);
}

text::TextRange Cursor::empty_range() const {
    return text::TextRange(position(), position(), file_);
}

std::u32string_view Cursor::view(size_t start, size_t length) const {
    return std::u32string_view(chars_).substr(start, length);
}

}  // namespace lexer
}  // namespace voxlasm
