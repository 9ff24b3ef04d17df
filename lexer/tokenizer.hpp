#ifndef VOXLASM_LEXER_TOKENIZER_HPP
#define VOXLASM_LEXER_TOKENIZER_HPP

#include "cursor.hpp"
#include "lex_error.hpp"
#include "token.hpp"
#include <memory>
#include <optional>
#include <string>
#include <string_view>
#include <vector>

namespace voxlasm {
namespace lexer {

// How an unprefixed numeric literal is read
enum class NumericMode {
    Signed,
    Unsigned,
    Float
};

std::string_view numeric_mode_name(NumericMode mode);
std::optional<NumericMode> numeric_mode_from_name(std::string_view name);

// Per-run settings, loadable from the "tokenizer" section of a config file
struct TokenizerConfig {
    NumericMode default_numeric = NumericMode::Unsigned;
};

// Single-pass, fail-fast tokenizer for one source unit.
//
// Construct once per file and drive with process() (or step() for callers
// that want to stop early). The first problem in the source throws a
// LexError and leaves the tokens emitted so far, and the cursor, available
// for inspection. Float literals throw NotImplementedError.
class Tokenizer {
public:
    Tokenizer(std::u32string chars,
              std::shared_ptr<const text::FileInfo> file,
              NumericMode default_numeric = NumericMode::Unsigned);

    // Tokenize the decoded contents of a registered file
    explicit Tokenizer(std::shared_ptr<const text::FileInfo> file,
                       NumericMode default_numeric = NumericMode::Unsigned);

    // Convenience entry point: all tokens of `file`, or throws LexError
    static std::vector<Token> tokenize(std::shared_ptr<const text::FileInfo> file,
                                       NumericMode default_numeric = NumericMode::Unsigned);

    // Consume exactly one lexeme (or skipped character run).
    // Returns false once the input is exhausted.
    bool step();

    // Run step() until the input is exhausted
    void process();

    bool at_end() const { return cursor_.at_end(); }
    text::Position position() const { return cursor_.position(); }
    NumericMode default_numeric() const { return default_numeric_; }

    const std::vector<Token>& tokens() const { return tokens_; }
    std::vector<Token> take_tokens() { return std::move(tokens_); }

private:
    Cursor cursor_;
    std::vector<Token> tokens_;
    NumericMode default_numeric_;

    void process_directive();
    void skip_comment();
    void process_register();
    void process_zero();
    void process_default_numeric(const text::Position& start);
    void process_hex(const text::Position& start);
    void process_binary(const text::Position& start);
    void process_signed(const text::Position& start);
    void process_unsigned(const text::Position& start);
    [[noreturn]] void process_float(const text::Position& start);
    void process_identifier();

    // Consume the rest of an alphanumeric run and return the range from `start`
    text::TextRange consume_identifier_tail(const text::Position& start);

    Token make_token(TokenType type, text::TextRange range) const;
    void emit(Token token);
    [[noreturn]] void fail(LexErrorDetail detail) const;
};

}  // namespace lexer
}  // namespace voxlasm

#endif // VOXLASM_LEXER_TOKENIZER_HPP
