#ifndef VOXLASM_TEXT_UTF8_HPP
#define VOXLASM_TEXT_UTF8_HPP

#include <string>
#include <string_view>

namespace voxlasm {
namespace text {

// Decode a UTF-8 byte string into Unicode scalar values.
// Throws std::runtime_error on ill-formed input (bad lead byte, truncated
// sequence, overlong form, surrogate, or a value above U+10FFFF).
std::u32string decode_utf8(std::string_view bytes);

std::string encode_utf8(char32_t c);
std::string encode_utf8(std::u32string_view chars);

}  // namespace text
}  // namespace voxlasm

#endif // VOXLASM_TEXT_UTF8_HPP
