#include "test_helpers.hpp"
#include <lexer/cursor.hpp>
#include <gtest/gtest.h>

using namespace voxlasm;
using namespace voxlasm::lexer;

TEST(Cursor, StartsAtOrigin) {
    Cursor cursor(U"ab", nullptr);

    EXPECT_EQ(cursor.position(), (text::Position{0, 0, 0}));
    EXPECT_EQ(cursor.current(), U'a');
    EXPECT_EQ(cursor.peek(), U'b');
    EXPECT_FALSE(cursor.peek(2).has_value());
}

TEST(Cursor, EmptyBuffer) {
    Cursor cursor(U"", nullptr);

    EXPECT_TRUE(cursor.at_end());
    EXPECT_FALSE(cursor.current().has_value());
    EXPECT_FALSE(cursor.peek().has_value());
    EXPECT_TRUE(cursor.empty_range().empty());
}

TEST(Cursor, AdvanceMovesColumn) {
    Cursor cursor(U"xyz", nullptr);
    cursor.advance();
    cursor.advance();

    EXPECT_EQ(cursor.position(), (text::Position{2, 0, 2}));
    EXPECT_EQ(cursor.current(), U'z');
    cursor.advance();
    EXPECT_TRUE(cursor.at_end());
}

TEST(Cursor, AdvanceLineResetsColumn) {
    Cursor cursor(U"ab\ncd", nullptr);
    cursor.advance();
    cursor.advance();
    cursor.advance_line();

    EXPECT_EQ(cursor.position(), (text::Position{3, 1, 0}));
    EXPECT_EQ(cursor.current(), U'c');
}

TEST(Cursor, RangesStayOnCurrentLine) {
    auto file = test::make_file("x\nabcd");
    Cursor cursor(file->chars, file);
    cursor.advance();
    cursor.advance_line();

    text::Position start = cursor.position();
    cursor.advance();
    cursor.advance();
    cursor.advance();

    auto back = cursor.range_back(2);
    EXPECT_EQ(back.start, (text::Position{3, 1, 1}));
    EXPECT_EQ(back.end, (text::Position{5, 1, 3}));
    EXPECT_EQ(back.text(), "bc");

    auto from = cursor.range_from(start);
    EXPECT_EQ(from.length(), 3u);
    EXPECT_EQ(from.text(), "abc");
    EXPECT_EQ(from.file, file);

    auto empty = cursor.empty_range();
    EXPECT_EQ(empty.start, cursor.position());
    EXPECT_TRUE(empty.empty());
}

TEST(Cursor, ViewIntoBuffer) {
    Cursor cursor(U"%repeat", nullptr);
    EXPECT_EQ(cursor.view(1, 6), U"repeat");
    EXPECT_EQ(cursor.view(5, 10), U"at");
}
