#include "token.hpp"
#include <algorithm>
#include <array>

namespace voxlasm {
namespace lexer {

namespace {

struct TokenTypeName {
    TokenType type;
    std::string_view name;
};

constexpr std::array<TokenTypeName, 14> TOKEN_TYPE_NAMES = {{
    {TokenType::Comma, "Comma"},
    {TokenType::Colon, "Colon"},
    {TokenType::Register, "Register"},
    {TokenType::Opcode, "Opcode"},
    {TokenType::Identifier, "Identifier"},
    {TokenType::UnsignedIntegerLiteral, "UnsignedIntegerLiteral"},
    {TokenType::SignedIntegerLiteral, "SignedIntegerLiteral"},
    {TokenType::Repeat, "Repeat"},
    {TokenType::EndRepeat, "EndRepeat"},
    {TokenType::If, "If"},
    {TokenType::Else, "Else"},
    {TokenType::Endif, "Endif"},
    {TokenType::Import, "Import"},
    {TokenType::Constant, "Constant"},
}};

struct DirectiveKeyword {
    std::u32string_view keyword;
    TokenType type;
};

constexpr std::array<DirectiveKeyword, 7> DIRECTIVES = {{
    {U"repeat", TokenType::Repeat},
    {U"end_repeat", TokenType::EndRepeat},
    {U"if", TokenType::If},
    {U"else", TokenType::Else},
    {U"endif", TokenType::Endif},
    {U"import", TokenType::Import},
    {U"const", TokenType::Constant},
}};

constexpr std::array<std::string_view, 7> DIRECTIVE_SPELLINGS = {
    "repeat", "end_repeat", "if", "else", "endif", "import", "const"
};

}  // namespace

std::string_view token_type_name(TokenType type) {
    for (const auto& entry : TOKEN_TYPE_NAMES) {
        if (entry.type == type) return entry.name;
    }
    return "Unknown";
}

std::optional<TokenType> token_type_from_name(std::string_view name) {
    for (const auto& entry : TOKEN_TYPE_NAMES) {
        if (entry.name == name) return entry.type;
    }
    return std::nullopt;
}

bool is_directive(TokenType type) {
    return directive_keyword(type).has_value();
}

std::optional<TokenType> directive_from_keyword(std::u32string_view keyword) {
    auto it = std::find_if(DIRECTIVES.begin(), DIRECTIVES.end(),
        [&](const DirectiveKeyword& d) { return d.keyword == keyword; });
    if (it == DIRECTIVES.end()) return std::nullopt;
    return it->type;
}

std::optional<std::string_view> directive_keyword(TokenType type) {
    for (size_t i = 0; i < DIRECTIVES.size(); ++i) {
        if (DIRECTIVES[i].type == type) return DIRECTIVE_SPELLINGS[i];
    }
    return std::nullopt;
}

}  // namespace lexer
}  // namespace voxlasm
