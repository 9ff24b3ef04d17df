#include "utf8.hpp"
#include <stdexcept>

namespace voxlasm {
namespace text {

namespace {

std::runtime_error utf8_error(const std::string& what, size_t offset) {
    return std::runtime_error("Invalid UTF-8 (" + what + ") at byte " + std::to_string(offset));
}

bool is_continuation(unsigned char b) {
    return (b & 0xC0) == 0x80;
}

}  // namespace

std::u32string decode_utf8(std::string_view bytes) {
    std::u32string out;
    out.reserve(bytes.size());

    size_t i = 0;
    while (i < bytes.size()) {
        unsigned char lead = static_cast<unsigned char>(bytes[i]);

        if (lead < 0x80) {
            out.push_back(static_cast<char32_t>(lead));
            ++i;
            continue;
        }

        size_t extra;
        char32_t value;
        char32_t min_value;
        if ((lead & 0xE0) == 0xC0) {
            extra = 1;
            value = lead & 0x1F;
            min_value = 0x80;
        } else if ((lead & 0xF0) == 0xE0) {
            extra = 2;
            value = lead & 0x0F;
            min_value = 0x800;
        } else if ((lead & 0xF8) == 0xF0) {
            extra = 3;
            value = lead & 0x07;
            min_value = 0x10000;
        } else {
            throw utf8_error("bad lead byte", i);
        }

        if (i + extra >= bytes.size()) {
            throw utf8_error("truncated sequence", i);
        }

        for (size_t k = 1; k <= extra; ++k) {
            unsigned char b = static_cast<unsigned char>(bytes[i + k]);
            if (!is_continuation(b)) {
                throw utf8_error("truncated sequence", i);
            }
            value = (value << 6) | (b & 0x3F);
        }

        if (value < min_value) {
            throw utf8_error("overlong form", i);
        }
        if (value >= 0xD800 && value <= 0xDFFF) {
            throw utf8_error("surrogate", i);
        }
        if (value > 0x10FFFF) {
            throw utf8_error("out of range", i);
        }

        out.push_back(value);
        i += extra + 1;
    }

    return out;
}

std::string encode_utf8(char32_t c) {
    std::string out;
    if (c < 0x80) {
        out.push_back(static_cast<char>(c));
    } else if (c < 0x800) {
        out.push_back(static_cast<char>(0xC0 | (c >> 6)));
        out.push_back(static_cast<char>(0x80 | (c & 0x3F)));
    } else if (c < 0x10000) {
        out.push_back(static_cast<char>(0xE0 | (c >> 12)));
        out.push_back(static_cast<char>(0x80 | ((c >> 6) & 0x3F)));
        out.push_back(static_cast<char>(0x80 | (c & 0x3F)));
    } else {
        out.push_back(static_cast<char>(0xF0 | (c >> 18)));
        out.push_back(static_cast<char>(0x80 | ((c >> 12) & 0x3F)));
        out.push_back(static_cast<char>(0x80 | ((c >> 6) & 0x3F)));
        out.push_back(static_cast<char>(0x80 | (c & 0x3F)));
    }
    return out;
}

std::string encode_utf8(std::u32string_view chars) {
    std::string out;
    out.reserve(chars.size());
    for (char32_t c : chars) {
        out += encode_utf8(c);
    }
    return out;
}

}  // namespace text
}  // namespace voxlasm
