#include "tokenizer.hpp"
#include <common/logging.hpp>
#include <text/file_registry.hpp>
#include <text/utf8.hpp>
#include <unicode/uchar.h>
#include <limits>
#include <stdexcept>
#include <utility>

namespace voxlasm {
namespace lexer {

namespace {

// Unicode Alphabetic property
bool is_alpha(char32_t c) {
    return u_isUAlphabetic(static_cast<UChar32>(c));
}

// ASCII only; non-ASCII numerals never start a literal
bool is_digit(char32_t c) {
    return c >= U'0' && c <= U'9';
}

// Alphabetic or any Unicode number (Nd, Nl, No)
bool is_alphanumeric(char32_t c) {
    return is_alpha(c) || (U_GET_GC_MASK(static_cast<UChar32>(c)) & U_GC_N_MASK) != 0;
}

bool is_word_char(char32_t c) {
    return c == U'_' || is_alpha(c);
}

std::optional<uint8_t> hex_digit_value(char32_t c) {
    if (c >= U'0' && c <= U'9') return static_cast<uint8_t>(c - U'0');
    if (c >= U'a' && c <= U'f') return static_cast<uint8_t>(c - U'a' + 10);
    if (c >= U'A' && c <= U'F') return static_cast<uint8_t>(c - U'A' + 10);
    return std::nullopt;
}

// Unicode White_Space property
bool is_whitespace(char32_t c) {
    switch (c) {
        case U' ': case U'\t': case U'\n': case U'\v': case U'\f': case U'\r':
        case 0x85: case 0xA0: case 0x1680:
        case 0x2028: case 0x2029: case 0x202F: case 0x205F: case 0x3000:
            return true;
        default:
            return c >= 0x2000 && c <= 0x200A;
    }
}

}  // namespace

std::string_view numeric_mode_name(NumericMode mode) {
    switch (mode) {
        case NumericMode::Signed: return "signed";
        case NumericMode::Unsigned: return "unsigned";
        case NumericMode::Float: return "float";
    }
    return "unsigned";
}

std::optional<NumericMode> numeric_mode_from_name(std::string_view name) {
    if (name == "signed") return NumericMode::Signed;
    if (name == "unsigned") return NumericMode::Unsigned;
    if (name == "float") return NumericMode::Float;
    return std::nullopt;
}

Tokenizer::Tokenizer(std::u32string chars,
                     std::shared_ptr<const text::FileInfo> file,
                     NumericMode default_numeric)
    : cursor_(std::move(chars), std::move(file)), default_numeric_(default_numeric) {}

Tokenizer::Tokenizer(std::shared_ptr<const text::FileInfo> file, NumericMode default_numeric)
    : Tokenizer(file ? file->chars : std::u32string(), file, default_numeric) {
    if (!cursor_.file()) {
        throw std::invalid_argument("Tokenizer requires a registered file");
    }
}

std::vector<Token> Tokenizer::tokenize(std::shared_ptr<const text::FileInfo> file,
                                       NumericMode default_numeric) {
    Tokenizer tokenizer(std::move(file), default_numeric);
    tokenizer.process();
    return tokenizer.take_tokens();
}

void Tokenizer::process() {
    auto log = voxlasm::logging::get_logger();
    const auto& file = cursor_.file();
    log->debug("Tokenizer: lexing {} ({} mode)",
               file ? file->name : std::string("<anonymous>"), numeric_mode_name(default_numeric_));

    while (step()) {}

    log->debug("Tokenizer: finished with {} tokens over {} lines",
               tokens_.size(), cursor_.position().row + 1);
}

bool Tokenizer::step() {
    std::optional<char32_t> c = cursor_.current();
    if (!c) {
        return false;
    }

    switch (*c) {
        case U'\n':
            cursor_.advance_line();
            break;
        case U'%':
            process_directive();
            break;
        case U'#':
            skip_comment();
            break;
        case U',':
            cursor_.advance();
            emit(make_token(TokenType::Comma, cursor_.range_back(1)));
            break;
        case U':':
            cursor_.advance();
            emit(make_token(TokenType::Colon, cursor_.range_back(1)));
            break;
        case U'$':
            process_register();
            break;
        case U'0':
            process_zero();
            break;
        default:
            if (is_whitespace(*c)) {
                cursor_.advance();
            } else if (is_word_char(*c)) {
                process_identifier();
            } else if (is_digit(*c) || *c == U'-') {
                process_default_numeric(cursor_.position());
            } else {
                fail(error::UnexpectedCharacter{*c, cursor_.position()});
            }
            break;
    }

    return !cursor_.at_end();
}

void Tokenizer::process_directive() {
    text::Position start = cursor_.position();
    cursor_.advance();  // '%'

    text::Position keyword_start = cursor_.position();
    size_t len = 0;
    while (auto c = cursor_.current()) {
        if (!is_word_char(*c)) break;
        cursor_.advance();
        ++len;
    }

    if (len == 0) {
        fail(error::EmptyIdentifier{cursor_.position()});
    }

    auto type = directive_from_keyword(cursor_.view(keyword_start.offset, len));
    if (!type) {
        fail(error::UnknownDirective{cursor_.range_from(start)});
    }

    emit(make_token(*type, cursor_.range_from(start)));
}

void Tokenizer::skip_comment() {
    cursor_.advance();  // '#'

    // The newline is left for the driver so row bookkeeping stays in one place
    while (auto c = cursor_.current()) {
        if (*c == U'\n') break;
        cursor_.advance();
    }
}

text::TextRange Tokenizer::consume_identifier_tail(const text::Position& start) {
    while (auto c = cursor_.current()) {
        if (!is_alphanumeric(*c)) break;
        cursor_.advance();
    }
    return cursor_.range_from(start);
}

void Tokenizer::process_register() {
    text::Position start = cursor_.position();
    cursor_.advance();  // '$'

    // Every end-of-input failure points just past the sigil
    const text::Position after_sigil = cursor_.position();

    std::optional<char32_t> c = cursor_.current();
    if (!c) {
        fail(error::ExpectedRegisterFoundEOF{after_sigil});
    }
    if (*c != U'r') {
        fail(error::InvalidRegister{consume_identifier_tail(start)});
    }
    cursor_.advance();

    c = cursor_.current();
    if (!c) {
        fail(error::ExpectedRegisterFoundEOF{after_sigil});
    }

    // Positional register: exactly one digit, then a word boundary
    if (is_digit(*c)) {
        cursor_.advance();
        auto next = cursor_.current();
        if (next && is_alphanumeric(*next)) {
            fail(error::InvalidRegister{consume_identifier_tail(start)});
        }
        Token token = make_token(TokenType::Register, cursor_.range_from(start));
        token.reg = isa::positional_register(static_cast<uint8_t>(*c - U'0'));
        emit(std::move(token));
        return;
    }

    // Named register: two-letter suffix from the static table
    const auto& suffixes = isa::named_register_suffixes();
    char32_t first = *c;
    bool known_first = false;
    for (const auto& suffix : suffixes) {
        if (static_cast<char32_t>(suffix.first) == first) {
            known_first = true;
            break;
        }
    }
    if (!known_first) {
        fail(error::InvalidRegister{consume_identifier_tail(start)});
    }
    cursor_.advance();

    c = cursor_.current();
    if (!c) {
        fail(error::ExpectedRegisterFoundEOF{after_sigil});
    }

    for (const auto& suffix : suffixes) {
        if (static_cast<char32_t>(suffix.first) == first &&
            static_cast<char32_t>(suffix.second) == *c) {
            cursor_.advance();
            Token token = make_token(TokenType::Register, cursor_.range_from(start));
            token.reg = suffix.reg;
            emit(std::move(token));
            return;
        }
    }

    fail(error::InvalidRegister{consume_identifier_tail(start)});
}

void Tokenizer::process_zero() {
    text::Position start = cursor_.position();

    auto prefix = cursor_.peek();
    if (prefix) {
        switch (*prefix) {
            case U'x':
                cursor_.advance();
                cursor_.advance();
                process_hex(start);
                return;
            case U'b':
                cursor_.advance();
                cursor_.advance();
                process_binary(start);
                return;
            case U'i':
                cursor_.advance();
                cursor_.advance();
                process_signed(start);
                return;
            case U'u':
                cursor_.advance();
                cursor_.advance();
                process_unsigned(start);
                return;
            case U'f':
                cursor_.advance();
                cursor_.advance();
                process_float(start);
                return;
            default:
                break;
        }
    }

    process_default_numeric(start);
}

void Tokenizer::process_default_numeric(const text::Position& start) {
    switch (default_numeric_) {
        case NumericMode::Signed:
            process_signed(start);
            return;
        case NumericMode::Unsigned:
            if (cursor_.current() == U'-') {
                fail(error::UnexpectedCharacter{U'-', cursor_.position()});
            }
            process_unsigned(start);
            return;
        case NumericMode::Float:
            process_float(start);
    }
}

void Tokenizer::process_hex(const text::Position& start) {
    text::Position digits_start = cursor_.position();
    uint64_t value = 0;
    size_t len = 0;
    bool overflow = false;

    while (auto c = cursor_.current()) {
        auto digit = hex_digit_value(*c);
        if (!digit) break;

        if (value > (std::numeric_limits<uint64_t>::max() >> 4)) {
            overflow = true;
        } else {
            value = (value << 4) | *digit;
        }
        cursor_.advance();
        ++len;
    }

    if (len == 0 || overflow) {
        fail(error::InvalidHexLiteral{cursor_.range_from(digits_start)});
    }

    Token token = make_token(TokenType::UnsignedIntegerLiteral, cursor_.range_from(start));
    token.unsigned_value = value;
    emit(std::move(token));
}

void Tokenizer::process_binary(const text::Position& start) {
    constexpr size_t MAX_BINARY_DIGITS = 64;

    text::Position digits_start = cursor_.position();
    uint64_t value = 0;
    size_t len = 0;

    while (auto c = cursor_.current()) {
        if (*c != U'0' && *c != U'1') break;

        cursor_.advance();
        if (len == MAX_BINARY_DIGITS) {
            fail(error::InvalidBinaryLiteral{cursor_.range_from(digits_start)});
        }

        value = (value << 1) | static_cast<uint64_t>(*c - U'0');
        ++len;
    }

    if (len == 0) {
        fail(error::InvalidBinaryLiteral{cursor_.empty_range()});
    }

    Token token = make_token(TokenType::UnsignedIntegerLiteral, cursor_.range_from(start));
    token.unsigned_value = value;
    emit(std::move(token));
}

void Tokenizer::process_signed(const text::Position& start) {
    constexpr int64_t MIN = std::numeric_limits<int64_t>::min();
    constexpr int64_t MAX = std::numeric_limits<int64_t>::max();

    text::Position literal_start = cursor_.position();
    bool negative = cursor_.current() == U'-';
    if (negative) {
        cursor_.advance();
    }

    // Negative literals accumulate downwards so INT64_MIN is reachable
    int64_t value = 0;
    size_t digits = 0;
    while (auto c = cursor_.current()) {
        if (!is_digit(*c)) break;

        int64_t d = static_cast<int64_t>(*c - U'0');
        cursor_.advance();

        bool overflow = negative ? value < (MIN + d) / 10 : value > (MAX - d) / 10;
        if (overflow) {
            fail(error::InvalidSignedIntegerLiteral{cursor_.range_from(literal_start)});
        }
        value = negative ? value * 10 - d : value * 10 + d;
        ++digits;
    }

    if (digits == 0) {
        fail(error::InvalidSignedIntegerLiteral{cursor_.empty_range()});
    }

    Token token = make_token(TokenType::SignedIntegerLiteral, cursor_.range_from(start));
    token.signed_value = value;
    emit(std::move(token));
}

void Tokenizer::process_unsigned(const text::Position& start) {
    constexpr uint64_t MAX = std::numeric_limits<uint64_t>::max();

    text::Position digits_start = cursor_.position();
    uint64_t value = 0;
    size_t digits = 0;

    while (auto c = cursor_.current()) {
        if (!is_digit(*c)) break;

        uint64_t d = static_cast<uint64_t>(*c - U'0');
        cursor_.advance();

        if (value > (MAX - d) / 10) {
            fail(error::InvalidUnsignedIntegerLiteral{cursor_.range_from(digits_start)});
        }
        value = value * 10 + d;
        ++digits;
    }

    if (digits == 0) {
        fail(error::InvalidUnsignedIntegerLiteral{cursor_.empty_range()});
    }

    Token token = make_token(TokenType::UnsignedIntegerLiteral, cursor_.range_from(start));
    token.unsigned_value = value;
    emit(std::move(token));
}

void Tokenizer::process_float(const text::Position& start) {
    // TODO: decode fractional literals into a FloatLiteral token once the
    // instruction set defines a floating-point immediate encoding.
    throw NotImplementedError("floating-point literals are not implemented (row " +
                              std::to_string(start.row + 1) + ", column " +
                              std::to_string(start.column + 1) + ")");
}

void Tokenizer::process_identifier() {
    text::Position start = cursor_.position();
    size_t len = 0;
    bool possible_opcode = true;

    while (auto c = cursor_.current()) {
        if (!is_word_char(*c)) break;
        if (*c == U'_') {
            possible_opcode = false;
        }
        cursor_.advance();
        ++len;
    }

    if (len == 0) {
        fail(error::EmptyIdentifier{cursor_.position()});
    }

    text::TextRange range = cursor_.range_from(start);

    // Mnemonics never contain '_', so only plain words are looked up
    if (possible_opcode) {
        std::string word = text::encode_utf8(cursor_.view(start.offset, len));
        if (auto code = isa::instruction_from_string(word)) {
            Token token = make_token(TokenType::Opcode, std::move(range));
            token.opcode = *code;
            emit(std::move(token));
            return;
        }
    }

    emit(make_token(TokenType::Identifier, std::move(range)));
}

Token Tokenizer::make_token(TokenType type, text::TextRange range) const {
    return Token{type, std::move(range), std::nullopt, std::nullopt, std::nullopt, std::nullopt};
}

void Tokenizer::emit(Token token) {
    auto log = voxlasm::logging::get_logger();
    log->trace("Tokenizer: {} at {}:{} (length {})",
               token_type_name(token.type), token.range.start.row + 1,
               token.range.start.column + 1, token.range.length());

    tokens_.push_back(std::move(token));
}

void Tokenizer::fail(LexErrorDetail detail) const {
    throw LexError(std::move(detail), cursor_.file());
}

}  // namespace lexer
}  // namespace voxlasm
