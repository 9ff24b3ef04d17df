#include "lex_error.hpp"
#include <text/utf8.hpp>
#include <cstdio>
#include <type_traits>
#include <utility>

namespace voxlasm {
namespace lexer {

namespace {

template <typename T, typename = void>
struct has_range : std::false_type {};

template <typename T>
struct has_range<T, std::void_t<decltype(std::declval<T>().range)>> : std::true_type {};

std::string describe_character(char32_t c) {
    if (c >= 0x20 && c < 0x7F) {
        return "'" + text::encode_utf8(c) + "'";
    }
    char buffer[16];
    std::snprintf(buffer, sizeof(buffer), "U+%04X", static_cast<unsigned>(c));
    return buffer;
}

std::string quoted_range(const text::TextRange& range) {
    return "'" + range.text() + "'";
}

}  // namespace

std::string_view lex_error_name(const LexErrorDetail& detail) {
    return std::visit([](const auto& e) -> std::string_view {
        using T = std::decay_t<decltype(e)>;
        if constexpr (std::is_same_v<T, error::UnexpectedCharacter>) return "UnexpectedCharacter";
        else if constexpr (std::is_same_v<T, error::EmptyIdentifier>) return "EmptyIdentifier";
        else if constexpr (std::is_same_v<T, error::InvalidHexLiteral>) return "InvalidHexLiteral";
        else if constexpr (std::is_same_v<T, error::InvalidBinaryLiteral>) return "InvalidBinaryLiteral";
        else if constexpr (std::is_same_v<T, error::UnexpectedSecondDecimalPoint>) return "UnexpectedSecondDecimalPoint";
        else if constexpr (std::is_same_v<T, error::InvalidFloatLiteral>) return "InvalidFloatLiteral";
        else if constexpr (std::is_same_v<T, error::InvalidUnsignedIntegerLiteral>) return "InvalidUnsignedIntegerLiteral";
        else if constexpr (std::is_same_v<T, error::InvalidSignedIntegerLiteral>) return "InvalidSignedIntegerLiteral";
        else if constexpr (std::is_same_v<T, error::InvalidRegister>) return "InvalidRegister";
        else if constexpr (std::is_same_v<T, error::ExpectedRegisterFoundEOF>) return "ExpectedRegisterFoundEOF";
        else if constexpr (std::is_same_v<T, error::UnknownDirective>) return "UnknownDirective";
    }, detail);
}

std::string lex_error_message(const LexErrorDetail& detail) {
    return std::visit([](const auto& e) -> std::string {
        using T = std::decay_t<decltype(e)>;
        if constexpr (std::is_same_v<T, error::UnexpectedCharacter>) {
            return "unexpected character " + describe_character(e.character);
        } else if constexpr (std::is_same_v<T, error::EmptyIdentifier>) {
            return "expected an identifier";
        } else if constexpr (std::is_same_v<T, error::InvalidHexLiteral>) {
            if (e.range.empty()) return "expected hexadecimal digits after '0x'";
            return "hexadecimal literal " + quoted_range(e.range) + " does not fit in 64 bits";
        } else if constexpr (std::is_same_v<T, error::InvalidBinaryLiteral>) {
            if (e.range.empty()) return "expected binary digits after '0b'";
            return "binary literal has more than 64 digits";
        } else if constexpr (std::is_same_v<T, error::UnexpectedSecondDecimalPoint>) {
            return "unexpected second decimal point";
        } else if constexpr (std::is_same_v<T, error::InvalidFloatLiteral>) {
            return "invalid floating-point literal " + quoted_range(e.range);
        } else if constexpr (std::is_same_v<T, error::InvalidUnsignedIntegerLiteral>) {
            if (e.range.empty()) return "expected decimal digits";
            return "unsigned literal " + quoted_range(e.range) + " does not fit in 64 bits";
        } else if constexpr (std::is_same_v<T, error::InvalidSignedIntegerLiteral>) {
            if (e.range.empty()) return "expected decimal digits";
            return "signed literal " + quoted_range(e.range) + " does not fit in 64 bits";
        } else if constexpr (std::is_same_v<T, error::InvalidRegister>) {
            return "invalid register " + quoted_range(e.range);
        } else if constexpr (std::is_same_v<T, error::ExpectedRegisterFoundEOF>) {
            return "expected a register name, found end of file";
        } else if constexpr (std::is_same_v<T, error::UnknownDirective>) {
            return "unknown directive " + quoted_range(e.range);
        }
    }, detail);
}

text::Position lex_error_start(const LexErrorDetail& detail) {
    return std::visit([](const auto& e) -> text::Position {
        using T = std::decay_t<decltype(e)>;
        if constexpr (has_range<T>::value) return e.range.start;
        else return e.position;
    }, detail);
}

text::Position lex_error_end(const LexErrorDetail& detail) {
    return std::visit([](const auto& e) -> text::Position {
        using T = std::decay_t<decltype(e)>;
        if constexpr (has_range<T>::value) return e.range.end;
        else return e.position;
    }, detail);
}

LexError::LexError(LexErrorDetail detail, std::shared_ptr<const text::FileInfo> file)
    : std::runtime_error(lex_error_message(detail)),
      detail_(std::move(detail)),
      file_(std::move(file)) {}

}  // namespace lexer
}  // namespace voxlasm
