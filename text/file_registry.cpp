#include "file_registry.hpp"
#include "utf8.hpp"
#include <fstream>
#include <sstream>
#include <stdexcept>

namespace voxlasm {
namespace text {

size_t FileInfo::line_count() const {
    size_t count = line_starts_.size();
    // A final line start at the very end belongs to a trailing newline
    if (count > 1 && line_starts_.back() == chars.size()) {
        --count;
    }
    return count;
}

std::string FileInfo::line(size_t row) const {
    if (row >= line_starts_.size()) return {};

    size_t begin = line_starts_[row];
    size_t end = (row + 1 < line_starts_.size()) ? line_starts_[row + 1] - 1 : chars.size();
    if (end > begin && chars[end - 1] == U'\r') {
        --end;
    }
    return encode_utf8(slice(begin, end));
}

std::u32string_view FileInfo::slice(size_t start, size_t end) const {
    if (start > chars.size()) start = chars.size();
    if (end > chars.size()) end = chars.size();
    if (end < start) end = start;
    return std::u32string_view(chars).substr(start, end - start);
}

std::shared_ptr<const FileInfo> FileRegistry::add(std::string name, std::string contents) {
    auto info = std::make_shared<FileInfo>();
    info->id = static_cast<uint32_t>(files_.size());
    info->name = std::move(name);
    info->contents = std::move(contents);

    try {
        info->chars = decode_utf8(info->contents);
    } catch (const std::runtime_error& e) {
        throw std::runtime_error(info->name + ": " + e.what());
    }

    info->line_starts_.push_back(0);
    for (size_t i = 0; i < info->chars.size(); ++i) {
        if (info->chars[i] == U'\n') {
            info->line_starts_.push_back(i + 1);
        }
    }

    files_.push_back(info);
    return info;
}

std::shared_ptr<const FileInfo> FileRegistry::load(const std::string& path) {
    std::ifstream file(path, std::ios::binary);
    if (!file) {
        throw std::runtime_error("Cannot open file: " + path);
    }
    std::stringstream buffer;
    buffer << file.rdbuf();
    return add(path, buffer.str());
}

std::shared_ptr<const FileInfo> FileRegistry::get(uint32_t id) const {
    if (id >= files_.size()) {
        throw std::out_of_range("Unknown file id: " + std::to_string(id));
    }
    return files_[id];
}

}  // namespace text
}  // namespace voxlasm
