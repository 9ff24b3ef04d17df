#ifndef VOXLASM_TEXT_POSITION_HPP
#define VOXLASM_TEXT_POSITION_HPP

#include <cstddef>
#include <memory>
#include <string>

namespace voxlasm {
namespace text {

struct FileInfo;

// Zero-based source coordinate, counted in Unicode scalar values
struct Position {
    size_t offset = 0;
    size_t row = 0;
    size_t column = 0;

    bool operator==(const Position&) const = default;
};

// Half-open span [start, end) on a single line of one registered file
struct TextRange {
    Position start;
    Position end;
    std::shared_ptr<const FileInfo> file;

    TextRange() = default;
    TextRange(Position start, Position end, std::shared_ptr<const FileInfo> file);

    size_t length() const { return end.offset - start.offset; }
    bool empty() const { return length() == 0; }

    // UTF-8 spelling of the covered characters
    std::string text() const;

    // Ranges are equal when they cover the same span of the same file handle
    bool operator==(const TextRange& other) const {
        return start == other.start && end == other.end && file == other.file;
    }
};

}  // namespace text
}  // namespace voxlasm

#endif // VOXLASM_TEXT_POSITION_HPP
