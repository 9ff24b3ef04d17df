#include <text/file_registry.hpp>
#include <text/position.hpp>
#include <text/utf8.hpp>
#include <gtest/gtest.h>
#include <stdexcept>

using namespace voxlasm::text;

// ============== UTF-8 ==============

TEST(Utf8, DecodesAllSequenceLengths) {
    // $, é, €, 𝄞
    auto chars = decode_utf8("$\xC3\xA9\xE2\x82\xAC\xF0\x9D\x84\x9E");
    ASSERT_EQ(chars.size(), 4u);
    EXPECT_EQ(chars[0], U'$');
    EXPECT_EQ(chars[1], char32_t(0xE9));
    EXPECT_EQ(chars[2], char32_t(0x20AC));
    EXPECT_EQ(chars[3], char32_t(0x1D11E));
}

TEST(Utf8, EncodeInvertsDecode) {
    std::string source = "ldi 0x1F # caf\xC3\xA9 \xE2\x82\xAC\n";
    EXPECT_EQ(encode_utf8(decode_utf8(source)), source);
}

TEST(Utf8, RejectsMalformedInput) {
    EXPECT_THROW(decode_utf8("\x80"), std::runtime_error);          // Stray continuation
    EXPECT_THROW(decode_utf8("\xC3"), std::runtime_error);          // Truncated
    EXPECT_THROW(decode_utf8("\xE2\x82"), std::runtime_error);      // Truncated
    EXPECT_THROW(decode_utf8("\xC0\xAF"), std::runtime_error);      // Overlong
    EXPECT_THROW(decode_utf8("\xED\xA0\x80"), std::runtime_error);  // Surrogate
    EXPECT_THROW(decode_utf8("\xF4\x90\x80\x80"), std::runtime_error);  // Above U+10FFFF
    EXPECT_THROW(decode_utf8("ok\xC3("), std::runtime_error);       // Bad continuation
}

TEST(Utf8, ErrorNamesByteOffset) {
    try {
        decode_utf8("abc\xFF");
        FAIL() << "expected runtime_error";
    } catch (const std::runtime_error& e) {
        EXPECT_NE(std::string(e.what()).find("byte 3"), std::string::npos) << e.what();
    }
}

// ============== File registry ==============

TEST(FileRegistry, AssignsSequentialIds) {
    FileRegistry registry;
    auto a = registry.add("a.vasm", "ret\n");
    auto b = registry.add("b.vasm", "nop\n");

    EXPECT_EQ(a->id, 0u);
    EXPECT_EQ(b->id, 1u);
    EXPECT_EQ(registry.size(), 2u);
    EXPECT_EQ(registry.get(1), b);
    EXPECT_EQ(registry.files().front(), a);
}

TEST(FileRegistry, UnknownIdThrows) {
    FileRegistry registry;
    EXPECT_THROW(registry.get(0), std::out_of_range);
}

TEST(FileRegistry, HandlesOutliveRegistry) {
    std::shared_ptr<const FileInfo> file;
    {
        FileRegistry registry;
        file = registry.add("scoped.vasm", "halt");
    }
    EXPECT_EQ(file->name, "scoped.vasm");
    EXPECT_EQ(file->chars, U"halt");
}

TEST(FileRegistry, InvalidUtf8NamesTheFile) {
    FileRegistry registry;
    try {
        registry.add("broken.vasm", "ldi \xFF");
        FAIL() << "expected runtime_error";
    } catch (const std::runtime_error& e) {
        EXPECT_EQ(std::string(e.what()).rfind("broken.vasm: ", 0), 0u) << e.what();
    }
    EXPECT_EQ(registry.size(), 0u);
}

TEST(FileRegistry, LoadMissingFile) {
    FileRegistry registry;
    EXPECT_THROW(registry.load("/nonexistent/path/prog.vasm"), std::runtime_error);
}

TEST(FileInfo, Lines) {
    FileRegistry registry;
    auto file = registry.add("lines.vasm", "ldi 1, $r0\r\n\tcall f\xC3\xA9\nret\n");

    EXPECT_EQ(file->line_count(), 3u);
    EXPECT_EQ(file->line(0), "ldi 1, $r0");
    EXPECT_EQ(file->line(1), "\tcall f\xC3\xA9");
    EXPECT_EQ(file->line(2), "ret");
    EXPECT_EQ(file->line(7), "");
}

TEST(FileInfo, LineCountWithoutTrailingNewline) {
    FileRegistry registry;
    EXPECT_EQ(registry.add("a", "")->line_count(), 1u);
    EXPECT_EQ(registry.add("b", "nop")->line_count(), 1u);
    EXPECT_EQ(registry.add("c", "nop\nret")->line_count(), 2u);
    EXPECT_EQ(registry.add("d", "\n\n")->line_count(), 2u);
}

TEST(FileInfo, SliceClampsToContents) {
    FileRegistry registry;
    auto file = registry.add("s", "abc");

    EXPECT_EQ(file->slice(1, 3), U"bc");
    EXPECT_EQ(file->slice(2, 99), U"c");
    EXPECT_TRUE(file->slice(5, 9).empty());
}

TEST(TextRange, TextAndEquality) {
    FileRegistry registry;
    auto file = registry.add("r.vasm", "mov $r\xC3\xA9");
    auto other = registry.add("r.vasm", "mov $r\xC3\xA9");

    TextRange range(Position{4, 0, 4}, Position{7, 0, 7}, file);
    EXPECT_EQ(range.text(), "$r\xC3\xA9");
    EXPECT_EQ(range.length(), 3u);
    EXPECT_FALSE(range.empty());

    EXPECT_EQ(range, TextRange(Position{4, 0, 4}, Position{7, 0, 7}, file));
    EXPECT_FALSE(range == TextRange(Position{4, 0, 4}, Position{7, 0, 7}, other));
    EXPECT_EQ(TextRange().text(), "");
}
