#include <gtest/gtest.h>
#include "supervisor/line_splitter.hpp"

#include <cstring>

static std::vector<std::string> feed(LineSplitter& s, const char* text) {
    return s.feed(text, std::strlen(text));
}

TEST(LineSplitterTest, SplitsCompleteLines) {
    LineSplitter s;
    auto lines = feed(s, "one\ntwo\nthree\n");
    ASSERT_EQ(lines.size(), 3u);
    EXPECT_EQ(lines[0], "one");
    EXPECT_EQ(lines[1], "two");
    EXPECT_EQ(lines[2], "three");
    EXPECT_FALSE(s.has_pending());
}

TEST(LineSplitterTest, JoinsLinesAcrossChunks) {
    LineSplitter s;
    EXPECT_TRUE(feed(s, "Uvicorn run").empty());
    EXPECT_TRUE(s.has_pending());
    auto lines = feed(s, "ning on 8234\nnext");
    ASSERT_EQ(lines.size(), 1u);
    EXPECT_EQ(lines[0], "Uvicorn running on 8234");

    lines = feed(s, "\n");
    ASSERT_EQ(lines.size(), 1u);
    EXPECT_EQ(lines[0], "next");
}

TEST(LineSplitterTest, StripsCarriageReturn) {
    LineSplitter s;
    auto lines = feed(s, "windows\r\nline\r\n");
    ASSERT_EQ(lines.size(), 2u);
    EXPECT_EQ(lines[0], "windows");
    EXPECT_EQ(lines[1], "line");
}

TEST(LineSplitterTest, KeepsEmptyLines) {
    LineSplitter s;
    auto lines = feed(s, "a\n\nb\n");
    ASSERT_EQ(lines.size(), 3u);
    EXPECT_EQ(lines[1], "");
}

TEST(LineSplitterTest, FinishFlushesRemainder) {
    LineSplitter s;
    feed(s, "done\npartial");
    auto rest = s.finish();
    ASSERT_EQ(rest.size(), 1u);
    EXPECT_EQ(rest[0], "partial");
    EXPECT_TRUE(s.finish().empty());
}

TEST(LineSplitterTest, FinishWithNothingPending) {
    LineSplitter s;
    feed(s, "complete\n");
    EXPECT_TRUE(s.finish().empty());
}

TEST(LineSplitterTest, CapsOverlongLines) {
    LineSplitter s(4);
    auto lines = feed(s, "abcdefghij\n");
    ASSERT_EQ(lines.size(), 3u);
    EXPECT_EQ(lines[0], "abcd");
    EXPECT_EQ(lines[1], "efgh");
    EXPECT_EQ(lines[2], "ij");
}
