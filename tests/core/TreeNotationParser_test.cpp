#include <gtest/gtest.h>
#include "core/TreeNotationParser.hpp"

using namespace hframe;

namespace {

const Node& child(const Node& node, std::size_t index) {
    return *node.children().at(index);
}

} // namespace

TEST(TreeNotationParserTest, IndentedTree) {
    Forest forest = TreeNotationParser::parse("project\n  src\n    main.py\n  tests\n    test.py");

    ASSERT_EQ(forest.size(), 1u);
    const Node& project = *forest[0];
    EXPECT_EQ(project.name(), "project");
    EXPECT_FALSE(project.is_leaf());
    ASSERT_EQ(project.children().size(), 2u);

    const Node& src = child(project, 0);
    const Node& tests = child(project, 1);
    EXPECT_EQ(src.name(), "src");
    EXPECT_EQ(tests.name(), "tests");

    ASSERT_EQ(src.children().size(), 1u);
    EXPECT_EQ(child(src, 0).name(), "main.py");
    EXPECT_TRUE(child(src, 0).is_leaf());

    ASSERT_EQ(tests.children().size(), 1u);
    EXPECT_EQ(child(tests, 0).name(), "test.py");
    EXPECT_TRUE(child(tests, 0).is_leaf());
}

TEST(TreeNotationParserTest, ShorthandSharesAncestors) {
    Forest forest = TreeNotationParser::parse("project/src/main.py\nproject/src/utils.py");

    ASSERT_EQ(forest.size(), 1u);
    const Node& project = *forest[0];
    ASSERT_EQ(project.children().size(), 1u);

    const Node& src = child(project, 0);
    EXPECT_EQ(src.name(), "src");
    EXPECT_FALSE(src.is_leaf());
    ASSERT_EQ(src.children().size(), 2u);
    EXPECT_EQ(child(src, 0).name(), "main.py");
    EXPECT_EQ(child(src, 1).name(), "utils.py");
    EXPECT_TRUE(child(src, 0).is_leaf());
    EXPECT_TRUE(child(src, 1).is_leaf());
}

TEST(TreeNotationParserTest, BoxDrawingTree) {
    const char* text =
        "project/\n"
        "├── src/\n"
        "│   └── main.py  # Entry point\n"
        "└── README.md\n";

    Forest forest = TreeNotationParser::parse(text);

    ASSERT_EQ(forest.size(), 1u);
    const Node& project = *forest[0];
    ASSERT_EQ(project.children().size(), 2u);
    EXPECT_EQ(child(project, 0).name(), "src");
    EXPECT_EQ(child(project, 1).name(), "README.md");

    const Node& main = child(child(project, 0), 0);
    EXPECT_EQ(main.name(), "main.py");
    EXPECT_EQ(main.comment().value_or(""), "Entry point");
    EXPECT_EQ(main.path(), "project/src/main.py");
}

TEST(TreeNotationParserTest, TrailingSeparatorMarksDirectory) {
    Forest forest = TreeNotationParser::parse("app\n  assets/\n  notes");

    ASSERT_EQ(forest.size(), 1u);
    const Node& app = *forest[0];
    ASSERT_EQ(app.children().size(), 2u);
    EXPECT_FALSE(child(app, 0).is_leaf());
    EXPECT_TRUE(child(app, 0).children().empty());
    EXPECT_TRUE(child(app, 1).is_leaf());
}

TEST(TreeNotationParserTest, RepeatedDirectoryMergesChildren) {
    Forest forest = TreeNotationParser::parse(
        "project\n"
        "  src\n"
        "    a.py\n"
        "  src # sources\n"
        "    b.py\n");

    ASSERT_EQ(forest.size(), 1u);
    const Node& project = *forest[0];
    ASSERT_EQ(project.children().size(), 1u);
    const Node& src = child(project, 0);
    EXPECT_EQ(src.comment().value_or(""), "sources");
    ASSERT_EQ(src.children().size(), 2u);
    EXPECT_EQ(child(src, 0).name(), "a.py");
    EXPECT_EQ(child(src, 1).name(), "b.py");
}

TEST(TreeNotationParserTest, RepeatedRootIsReused) {
    Forest forest = TreeNotationParser::parse("app\napp\n");

    ASSERT_EQ(forest.size(), 1u);
    EXPECT_EQ(forest[0]->name(), "app");
    EXPECT_TRUE(forest[0]->is_leaf());
}

TEST(TreeNotationParserTest, RepeatedNameWithSeparatorBecomesDirectory) {
    Forest forest = TreeNotationParser::parse("app\n  lib\n  lib/\n");

    ASSERT_EQ(forest.size(), 1u);
    ASSERT_EQ(forest[0]->children().size(), 1u);
    EXPECT_FALSE(child(*forest[0], 0).is_leaf());
}

TEST(TreeNotationParserTest, DecorationsAreSanitized) {
    Forest forest = TreeNotationParser::parse("📁 src/\n  📄 main.py ✨");

    ASSERT_EQ(forest.size(), 1u);
    EXPECT_EQ(forest[0]->name(), "src");
    ASSERT_EQ(forest[0]->children().size(), 1u);
    EXPECT_EQ(child(*forest[0], 0).name(), "main.py");
}

TEST(TreeNotationParserTest, SiblingsAtRootLevel) {
    Forest forest = TreeNotationParser::parse("a.txt\nb.txt\n");

    ASSERT_EQ(forest.size(), 2u);
    EXPECT_EQ(forest[0]->name(), "a.txt");
    EXPECT_EQ(forest[1]->name(), "b.txt");
}

TEST(TreeNotationParserTest, ShorthandUnderIndentedParent) {
    Forest forest = TreeNotationParser::parse("project\n  src/main.py\n  src/util.py");

    ASSERT_EQ(forest.size(), 1u);
    const Node& project = *forest[0];
    ASSERT_EQ(project.children().size(), 1u);
    EXPECT_EQ(child(project, 0).children().size(), 2u);
}

TEST(TreeNotationParserTest, IndentedLineAttachesToShorthandTop) {
    Forest forest = TreeNotationParser::parse("a/b/c.txt\n  d.txt");

    ASSERT_EQ(forest.size(), 1u);
    const Node& a = *forest[0];
    ASSERT_EQ(a.children().size(), 2u);
    EXPECT_EQ(child(a, 0).name(), "b");
    EXPECT_EQ(child(a, 1).name(), "d.txt");
}

TEST(TreeNotationParserTest, ShorthandCommentBackfill) {
    Forest forest = TreeNotationParser::parse(
        "p/x.py\n"
        "p/x.py # later\n"
        "p/x.py # again\n");

    ASSERT_EQ(forest.size(), 1u);
    Node* x = forest[0]->find_child("x.py");
    ASSERT_NE(x, nullptr);
    EXPECT_EQ(x->comment().value_or(""), "later");
    EXPECT_EQ(forest[0]->children().size(), 1u);
}

TEST(TreeNotationParserTest, SkipsUnusableLines) {
    Forest forest = TreeNotationParser::parse("app\n  # just a note\n  /\n  🚀\n  main.py");

    ASSERT_EQ(forest.size(), 1u);
    ASSERT_EQ(forest[0]->children().size(), 1u);
    EXPECT_EQ(child(*forest[0], 0).name(), "main.py");
}

TEST(TreeNotationParserTest, SkipsFenceDelimiters) {
    Forest forest = TreeNotationParser::parse("```\nproject\n  main.py\n```\n");

    ASSERT_EQ(forest.size(), 1u);
    EXPECT_EQ(forest[0]->name(), "project");
    EXPECT_EQ(forest[0]->children().size(), 1u);
}

TEST(TreeNotationParserTest, HonoursLineRange) {
    Forest forest = TreeNotationParser::parse("intro text\napp\n  main.py\nafter.txt", 1, 3);

    ASSERT_EQ(forest.size(), 1u);
    EXPECT_EQ(forest[0]->name(), "app");
    EXPECT_EQ(forest[0]->children().size(), 1u);
}

TEST(TreeNotationParserTest, WindowsLineEndings) {
    Forest forest = TreeNotationParser::parse("app\r\n  main.py\r\n");

    ASSERT_EQ(forest.size(), 1u);
    ASSERT_EQ(forest[0]->children().size(), 1u);
    EXPECT_EQ(child(*forest[0], 0).name(), "main.py");
}

TEST(TreeNotationParserTest, EmptyInput) {
    EXPECT_TRUE(TreeNotationParser::parse("").empty());
    EXPECT_TRUE(TreeNotationParser::parse("\n  \n").empty());
}

TEST(TreeNotationParserTest, SplitPrefixCountsCodePoints) {
    LinePrefix prefix = TreeNotationParser::split_prefix("│   └── main.py");
    EXPECT_EQ(prefix.indent, 8u);
    EXPECT_EQ(prefix.content, "main.py");

    LinePrefix nbsp = TreeNotationParser::split_prefix("\xC2\xA0\xC2\xA0x");
    EXPECT_EQ(nbsp.indent, 2u);
    EXPECT_EQ(nbsp.content, "x");
}

TEST(TreeNotationParserTest, Classify) {
    EXPECT_EQ(TreeNotationParser::classify("main.py"), LineNotation::INDENTED);
    EXPECT_EQ(TreeNotationParser::classify("src/"), LineNotation::INDENTED);
    EXPECT_EQ(TreeNotationParser::classify("/"), LineNotation::INDENTED);
    EXPECT_EQ(TreeNotationParser::classify("src/main.py"), LineNotation::SHORTHAND);
    EXPECT_EQ(TreeNotationParser::classify("src\\main.py"), LineNotation::SHORTHAND);
}
