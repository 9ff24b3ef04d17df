#ifndef VOXLASM_LEXER_TOKEN_HPP
#define VOXLASM_LEXER_TOKEN_HPP

#include <isa/instruction_set.hpp>
#include <text/position.hpp>
#include <cstdint>
#include <optional>
#include <string_view>

namespace voxlasm {
namespace lexer {

enum class TokenType {
    // Punctuation
    Comma, Colon,

    // Operands
    Register, Opcode, Identifier,
    UnsignedIntegerLiteral, SignedIntegerLiteral,

    // Directives
    Repeat, EndRepeat, If, Else, Endif, Import, Constant
};

struct Token {
    TokenType type;
    text::TextRange range;
    std::optional<isa::Register> reg;            // For Register tokens
    std::optional<isa::Opcode> opcode;           // For Opcode tokens
    std::optional<uint64_t> unsigned_value;      // For UnsignedIntegerLiteral tokens
    std::optional<int64_t> signed_value;         // For SignedIntegerLiteral tokens

    bool operator==(const Token&) const = default;
};

std::string_view token_type_name(TokenType type);
std::optional<TokenType> token_type_from_name(std::string_view name);

bool is_directive(TokenType type);

// Directive keyword spelling without the leading '%'
std::optional<TokenType> directive_from_keyword(std::u32string_view keyword);
std::optional<std::string_view> directive_keyword(TokenType type);

}  // namespace lexer
}  // namespace voxlasm

#endif // VOXLASM_LEXER_TOKEN_HPP
