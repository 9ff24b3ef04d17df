#ifndef VOXLASM_LEXER_LEX_ERROR_HPP
#define VOXLASM_LEXER_LEX_ERROR_HPP

#include <text/position.hpp>
#include <memory>
#include <stdexcept>
#include <string>
#include <string_view>
#include <variant>

namespace voxlasm {

// Raised for features that are deliberately not implemented yet.
// Kept outside the LexError hierarchy so callers can never mistake it for a
// diagnosable source error.
class NotImplementedError : public std::logic_error {
public:
    explicit NotImplementedError(const std::string& what) : std::logic_error(what) {}
};

namespace lexer {
namespace error {

// Failures located at a single position
struct UnexpectedCharacter { char32_t character; text::Position position; };
struct EmptyIdentifier { text::Position position; };
struct UnexpectedSecondDecimalPoint { text::Position position; };  // Reserved for float literals
struct ExpectedRegisterFoundEOF { text::Position position; };

// Failures covering a range of source
struct InvalidHexLiteral { text::TextRange range; };
struct InvalidBinaryLiteral { text::TextRange range; };
struct InvalidFloatLiteral { text::TextRange range; };  // Reserved for float literals
struct InvalidUnsignedIntegerLiteral { text::TextRange range; };
struct InvalidSignedIntegerLiteral { text::TextRange range; };
struct InvalidRegister { text::TextRange range; };
struct UnknownDirective { text::TextRange range; };

}  // namespace error

using LexErrorDetail = std::variant<
    error::UnexpectedCharacter, error::EmptyIdentifier,
    error::InvalidHexLiteral, error::InvalidBinaryLiteral,
    error::UnexpectedSecondDecimalPoint, error::InvalidFloatLiteral,
    error::InvalidUnsignedIntegerLiteral, error::InvalidSignedIntegerLiteral,
    error::InvalidRegister, error::ExpectedRegisterFoundEOF,
    error::UnknownDirective
>;

// Variant name, e.g. "InvalidHexLiteral"
std::string_view lex_error_name(const LexErrorDetail& detail);

// One-line human readable description, without location
std::string lex_error_message(const LexErrorDetail& detail);

// Start and end of the offending source; equal for position errors
text::Position lex_error_start(const LexErrorDetail& detail);
text::Position lex_error_end(const LexErrorDetail& detail);

// The single error a Tokenizer run can produce
class LexError : public std::runtime_error {
public:
    LexError(LexErrorDetail detail, std::shared_ptr<const text::FileInfo> file);

    const LexErrorDetail& detail() const { return detail_; }
    const std::shared_ptr<const text::FileInfo>& file() const { return file_; }

    std::string_view kind_name() const { return lex_error_name(detail_); }
    text::Position start() const { return lex_error_start(detail_); }
    text::Position end() const { return lex_error_end(detail_); }

    template <typename T>
    bool is() const { return std::holds_alternative<T>(detail_); }

private:
    LexErrorDetail detail_;
    std::shared_ptr<const text::FileInfo> file_;
};

}  // namespace lexer
}  // namespace voxlasm

#endif // VOXLASM_LEXER_LEX_ERROR_HPP
