#include <gtest/gtest.h>
#include "core/CommentExtractor.hpp"

using namespace hframe;

TEST(CommentExtractorTest, NoComment) {
    auto result = CommentExtractor::extract("file.txt");
    EXPECT_EQ(result.name, "file.txt");
    EXPECT_FALSE(result.comment.has_value());
}

TEST(CommentExtractorTest, DoubleSlashComment) {
    auto result = CommentExtractor::extract("file.cpp // Entry point");
    EXPECT_EQ(result.name, "file.cpp");
    ASSERT_TRUE(result.comment.has_value());
    EXPECT_EQ(*result.comment, "Entry point");
}

TEST(CommentExtractorTest, HashComment) {
    auto result = CommentExtractor::extract("script.py  # Main script");
    EXPECT_EQ(result.name, "script.py");
    EXPECT_EQ(result.comment.value_or(""), "Main script");
}

TEST(CommentExtractorTest, HtmlCommentKeepsCloser) {
    auto result = CommentExtractor::extract("index.html <!-- Homepage -->");
    EXPECT_EQ(result.name, "index.html");
    EXPECT_EQ(result.comment.value_or(""), "Homepage -->");
}

TEST(CommentExtractorTest, ArrowComment) {
    auto result = CommentExtractor::extract("app.js <-- bootstraps the UI");
    EXPECT_EQ(result.name, "app.js");
    EXPECT_EQ(result.comment.value_or(""), "bootstraps the UI");
}

TEST(CommentExtractorTest, BlockCommentKeepsCloser) {
    auto result = CommentExtractor::extract("styles.css /* Main styles */");
    EXPECT_EQ(result.name, "styles.css");
    EXPECT_EQ(result.comment.value_or(""), "Main styles */");
}

TEST(CommentExtractorTest, EarliestMarkerWins) {
    auto result = CommentExtractor::extract("a.txt # one // two");
    EXPECT_EQ(result.name, "a.txt");
    EXPECT_EQ(result.comment.value_or(""), "one // two");

    auto reversed = CommentExtractor::extract("b.txt // one # two");
    EXPECT_EQ(reversed.name, "b.txt");
    EXPECT_EQ(reversed.comment.value_or(""), "one # two");
}

TEST(CommentExtractorTest, WhitespaceAroundComment) {
    auto result = CommentExtractor::extract("file.txt   #   Comment   ");
    EXPECT_EQ(result.name, "file.txt");
    EXPECT_EQ(result.comment.value_or(""), "Comment");
}

TEST(CommentExtractorTest, EmptyCommentIsNone) {
    auto result = CommentExtractor::extract("file.txt #   ");
    EXPECT_EQ(result.name, "file.txt");
    EXPECT_FALSE(result.comment.has_value());
}

TEST(CommentExtractorTest, CommentOnlyLine) {
    auto result = CommentExtractor::extract("# just a note");
    EXPECT_TRUE(result.name.empty());
    EXPECT_EQ(result.comment.value_or(""), "just a note");
}

TEST(CommentExtractorTest, FindMarker) {
    auto marker = CommentExtractor::find_marker("x <!-- y");
    ASSERT_TRUE(marker.has_value());
    EXPECT_EQ(marker->first, 2u);
    EXPECT_EQ(marker->second, 4u);

    EXPECT_FALSE(CommentExtractor::find_marker("plain").has_value());
}
