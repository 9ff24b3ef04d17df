#include "test_helpers.hpp"
#include <diagnostics/diagnostics.hpp>
#include <gtest/gtest.h>

using namespace voxlasm;
using voxlasm::test::lex_error;

TEST(Diagnostics, RangeErrorUnderlinesWholeRange) {
    auto err = lex_error("ldi 5, $rzz");
    ASSERT_TRUE(err.has_value());

    EXPECT_EQ(diagnostics::headline(*err), "test.vasm:1:8: error: invalid register '$rzz'");
    EXPECT_EQ(diagnostics::source_excerpt(*err),
              " ldi 5, $rzz\n"
              "        ^~~~\n");
}

TEST(Diagnostics, PositionErrorGetsSingleCaret) {
    auto err = lex_error("ldi @");
    ASSERT_TRUE(err.has_value());

    EXPECT_EQ(diagnostics::render(*err),
              "test.vasm:1:5: error: unexpected character '@'\n"
              " ldi @\n"
              "     ^\n");
}

TEST(Diagnostics, EmptyRangeGetsSingleCaret) {
    auto err = lex_error("nop\nldi 0x, $r0");
    ASSERT_TRUE(err.has_value());

    EXPECT_EQ(diagnostics::render(*err),
              "test.vasm:2:7: error: expected hexadecimal digits after '0x'\n"
              " ldi 0x, $r0\n"
              "       ^\n");
}

TEST(Diagnostics, TabsAreKeptInMarker) {
    auto err = lex_error("\tpush %bogus");
    ASSERT_TRUE(err.has_value());

    EXPECT_EQ(diagnostics::source_excerpt(*err),
              " \tpush %bogus\n"
              " \t     ^~~~~~\n");
}

TEST(Diagnostics, RegisterEndOfFileCaretFollowsSigil) {
    auto err = lex_error("mov $r");
    ASSERT_TRUE(err.has_value());

    EXPECT_EQ(diagnostics::render(*err),
              "test.vasm:1:6: error: expected a register name, found end of file\n"
              " mov $r\n"
              "      ^\n");
}

TEST(Diagnostics, NonPrintableCharacterIsNamedByCodePoint) {
    auto err = lex_error("ret\x01");
    ASSERT_TRUE(err.has_value());
    EXPECT_EQ(std::string(err->what()), "unexpected character U+0001");
}

TEST(Diagnostics, OverflowMessagesQuoteTheDigits) {
    auto err = lex_error("0x10000000000000000");
    ASSERT_TRUE(err.has_value());
    EXPECT_EQ(std::string(err->what()),
              "hexadecimal literal '10000000000000000' does not fit in 64 bits");

    err = lex_error("0i-9223372036854775809");
    ASSERT_TRUE(err.has_value());
    EXPECT_EQ(std::string(err->what()),
              "signed literal '-9223372036854775809' does not fit in 64 bits");
}

TEST(Diagnostics, ReservedFloatVariantsHaveMessages) {
    auto file = test::make_file("1.2.3");
    text::TextRange range(test::col(0), test::col(5), file);

    lexer::LexErrorDetail second_point = lexer::error::UnexpectedSecondDecimalPoint{test::col(3)};
    EXPECT_EQ(lexer::lex_error_name(second_point), "UnexpectedSecondDecimalPoint");
    EXPECT_EQ(lexer::lex_error_message(second_point), "unexpected second decimal point");
    EXPECT_EQ(lexer::lex_error_start(second_point), lexer::lex_error_end(second_point));

    lexer::LexErrorDetail bad_float = lexer::error::InvalidFloatLiteral{range};
    EXPECT_EQ(lexer::lex_error_message(bad_float), "invalid floating-point literal '1.2.3'");
    EXPECT_EQ(lexer::lex_error_end(bad_float), test::col(5));

    lexer::LexError error(bad_float, file);
    EXPECT_EQ(diagnostics::source_excerpt(error), " 1.2.3\n ^~~~~\n");
}

TEST(Diagnostics, MissingFileRendersHeadlineOnly) {
    lexer::LexError error(lexer::error::EmptyIdentifier{test::col(1)}, nullptr);
    EXPECT_EQ(diagnostics::render(error), "<input>:1:2: error: expected an identifier\n");
}
