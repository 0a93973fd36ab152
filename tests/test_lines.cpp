#include "toon_lines.hpp"
#include "toon_errors.hpp"
#include <gtest/gtest.h>
#include <cstdio>
#include <filesystem>
#include <fstream>
#include <stdexcept>
#include <string>
#include <vector>

using namespace toonpp;

namespace {

std::vector<Line> read_all(std::string_view text, bool allow_comments = true, bool strict = true) {
    StringReader reader(text);
    LineSource src(reader, allow_comments, strict);
    std::vector<Line> lines;
    Line line;
    while (src.next(line)) {
        lines.push_back(line);
    }
    return lines;
}

} // namespace

// ============================================================================
// Readers
// ============================================================================

TEST(StringReaderTest, SplitsLinesAndStripsCarriageReturns) {
    StringReader reader("a: 1\r\nb: 2\r\nc: 3");
    std::string_view line;
    size_t line_no = 0;

    ASSERT_TRUE(reader.next_line(line, line_no));
    EXPECT_EQ(line, "a: 1");
    EXPECT_EQ(line_no, 1u);
    ASSERT_TRUE(reader.next_line(line, line_no));
    EXPECT_EQ(line, "b: 2");
    ASSERT_TRUE(reader.next_line(line, line_no));
    EXPECT_EQ(line, "c: 3");
    EXPECT_EQ(line_no, 3u);
    EXPECT_FALSE(reader.next_line(line, line_no));
}

TEST(StringReaderTest, EmptyText) {
    StringReader reader("");
    std::string_view line;
    size_t line_no = 0;
    EXPECT_FALSE(reader.next_line(line, line_no));
}

TEST(FileReaderTest, LinesSpanningChunks) {
    auto path = (std::filesystem::temp_directory_path() / "toonpp_file_reader_test.toon").string();
    {
        std::ofstream out(path, std::ios::binary);
        out << "first line\r\nsecond\n\nlast line without newline";
    }

    // Chunks far smaller than a line
    FileReader reader(path, 3);
    ASSERT_FALSE(reader.has_error());

    std::vector<std::string> lines;
    std::string_view line;
    size_t line_no = 0;
    while (reader.next_line(line, line_no)) {
        lines.emplace_back(line);
    }
    std::remove(path.c_str());

    ASSERT_EQ(lines.size(), 4u);
    EXPECT_EQ(lines[0], "first line");
    EXPECT_EQ(lines[1], "second");
    EXPECT_EQ(lines[2], "");
    EXPECT_EQ(lines[3], "last line without newline");
    EXPECT_EQ(line_no, 4u);
}

TEST(FileReaderTest, MissingFileReportsError) {
    FileReader reader("/nonexistent/dir/input.toon");
    EXPECT_TRUE(reader.has_error());
    EXPECT_FALSE(reader.error_message().empty());
    EXPECT_EQ(reader.filepath(), "/nonexistent/dir/input.toon");

    std::string_view line;
    size_t line_no = 0;
    EXPECT_FALSE(reader.next_line(line, line_no));
}

// ============================================================================
// Line source
// ============================================================================

TEST(LineSourceTest, SkipsBlankAndCommentLines) {
    auto lines = read_all("# header\na: 1\n\n   \n// note\nb: 2  # trailing\n");
    ASSERT_EQ(lines.size(), 2u);
    EXPECT_EQ(lines[0].content, "a: 1");
    EXPECT_EQ(lines[0].line_no, 2u);
    EXPECT_EQ(lines[1].content, "b: 2");
    EXPECT_EQ(lines[1].line_no, 6u);
}

TEST(LineSourceTest, TrailingSlashCommentStripped) {
    auto lines = read_all("a: 1 // note\n");
    ASSERT_EQ(lines.size(), 1u);
    EXPECT_EQ(lines[0].content, "a: 1");
}

TEST(LineSourceTest, HashInsideQuotesKept) {
    auto lines = read_all("a: \"x # y\"\n");
    ASSERT_EQ(lines.size(), 1u);
    EXPECT_EQ(lines[0].content, "a: \"x # y\"");
}

TEST(LineSourceTest, CommentsDisabled) {
    auto lines = read_all("# not a comment\n", false);
    ASSERT_EQ(lines.size(), 1u);
    EXPECT_EQ(lines[0].content, "# not a comment");
}

TEST(LineSourceTest, DetectsIndentationUnit) {
    StringReader reader("a:\n    b:\n        c: 1\n    d: 2\n");
    LineSource src(reader);
    Line line;

    ASSERT_TRUE(src.next(line));
    EXPECT_EQ(line.depth, 0u);
    EXPECT_EQ(src.indent_unit(), 0u);

    ASSERT_TRUE(src.next(line));
    EXPECT_EQ(line.depth, 1u);
    EXPECT_EQ(line.indent, 4u);
    EXPECT_EQ(src.indent_unit(), 4u);

    ASSERT_TRUE(src.next(line));
    EXPECT_EQ(line.depth, 2u);

    ASSERT_TRUE(src.next(line));
    EXPECT_EQ(line.depth, 1u);
    EXPECT_EQ(line.content, "d: 2");
}

TEST(LineSourceTest, InconsistentIndentation) {
    EXPECT_THROW(read_all("a:\n  b:\n   c: 1\n"), SyntaxError);
}

TEST(LineSourceTest, TabIndentationStrict) {
    try {
        read_all("a:\n\tb: 1\n");
        FAIL() << "Expected SyntaxError";
    } catch (const SyntaxError& e) {
        EXPECT_EQ(e.line(), 2u);
    }
}

TEST(LineSourceTest, TabIndentationLenient) {
    auto lines = read_all("a:\n\tb: 1\n", true, false);
    ASSERT_EQ(lines.size(), 2u);
    EXPECT_EQ(lines[1].depth, 1u);
    EXPECT_EQ(lines[1].content, "b: 1");
}

TEST(LineSourceTest, PushbackAndPeek) {
    StringReader reader("a: 1\nb: 2\n");
    LineSource src(reader);
    Line line;

    ASSERT_TRUE(src.peek(line));
    EXPECT_EQ(line.content, "a: 1");
    ASSERT_TRUE(src.next(line));
    EXPECT_EQ(line.content, "a: 1");

    ASSERT_TRUE(src.next(line));
    EXPECT_EQ(line.content, "b: 2");
    src.pushback(line);
    ASSERT_TRUE(src.next(line));
    EXPECT_EQ(line.content, "b: 2");
    EXPECT_FALSE(src.next(line));

    EXPECT_EQ(src.max_buffered(), 1u);
    EXPECT_EQ(src.lines_read(), 2u);
}

TEST(LineSourceTest, SecondPushbackRejected) {
    StringReader reader("a: 1\nb: 2\n");
    LineSource src(reader);
    Line first;
    Line second;
    ASSERT_TRUE(src.next(first));
    ASSERT_TRUE(src.next(second));

    src.pushback(second);
    EXPECT_THROW(src.pushback(first), std::logic_error);
}
