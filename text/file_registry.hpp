#ifndef VOXLASM_TEXT_FILE_REGISTRY_HPP
#define VOXLASM_TEXT_FILE_REGISTRY_HPP

#include "position.hpp"
#include <cstdint>
#include <memory>
#include <string>
#include <string_view>
#include <vector>

namespace voxlasm {
namespace text {

// An immutable registered source file. Shared read-only by every token and
// error range that points into it.
struct FileInfo {
    uint32_t id = 0;
    std::string name;
    std::string contents;     // Original UTF-8 bytes
    std::u32string chars;     // Decoded scalar values, indexed by Position::offset

    // Number of lines; a trailing newline does not open a new line
    size_t line_count() const;

    // UTF-8 text of a zero-based line, without its terminator.
    // Returns an empty string for rows past the end.
    std::string line(size_t row) const;

    // Decoded characters covered by [start, end)
    std::u32string_view slice(size_t start, size_t end) const;

private:
    friend class FileRegistry;
    std::vector<size_t> line_starts_;
};

// Owns every registered file and hands out stable shared handles
class FileRegistry {
public:
    std::shared_ptr<const FileInfo> add(std::string name, std::string contents);

    // Read a file from disk and register it under its path
    std::shared_ptr<const FileInfo> load(const std::string& path);

    std::shared_ptr<const FileInfo> get(uint32_t id) const;
    size_t size() const { return files_.size(); }

    const std::vector<std::shared_ptr<const FileInfo>>& files() const { return files_; }

private:
    std::vector<std::shared_ptr<const FileInfo>> files_;
};

}  // namespace text
}  // namespace voxlasm

#endif // VOXLASM_TEXT_FILE_REGISTRY_HPP
