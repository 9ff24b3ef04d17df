#include "position.hpp"
#include "file_registry.hpp"
#include "utf8.hpp"
#include <utility>

namespace voxlasm {
namespace text {

TextRange::TextRange(Position start, Position end, std::shared_ptr<const FileInfo> file)
    : start(start), end(end), file(std::move(file)) {}

std::string TextRange::text() const {
    if (!file) return {};
    return encode_utf8(file->slice(start.offset, end.offset));
}

}  // namespace text
}  // namespace voxlasm
