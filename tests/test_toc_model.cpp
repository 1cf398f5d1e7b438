#include <gtest/gtest.h>
#include "toc.hpp"

using namespace tocsplit;

namespace {

TocNode node(const std::string& title, const int page, std::vector<TocNode> children = {}) {
    TocNode n;
    n.title = title;
    n.start_page = page;
    n.children = std::move(children);
    return n;
}

TocTree sample_tree() {
    TocTree tree;
    tree.chapters.push_back(node("Intro", 1));
    tree.chapters.push_back(node("Body", 5, {node("Part A", 5, {node("Detail", 6)}), node("Part B", 9)}));
    tree.chapters.push_back(node("Appendix", 20));
    return tree;
}

} // namespace

TEST(TocModelTest, DottedNumberingFollowsIndexPath) {
    TocTree tree = sample_tree();
    renumber(tree, NumberingStyle::Dotted);

    EXPECT_EQ(tree.chapters[0].number, "1");
    EXPECT_EQ(tree.chapters[1].number, "2");
    EXPECT_EQ(tree.chapters[1].children[0].number, "2.1");
    EXPECT_EQ(tree.chapters[1].children[0].children[0].number, "2.1.1");
    EXPECT_EQ(tree.chapters[1].children[1].number, "2.2");
    EXPECT_EQ(tree.chapters[2].number, "3");
}

TEST(TocModelTest, SiblingNumberingRestartsPerLevel) {
    TocTree tree = sample_tree();
    renumber(tree, NumberingStyle::SiblingOnly);

    EXPECT_EQ(tree.chapters[1].number, "2");
    EXPECT_EQ(tree.chapters[1].children[0].number, "1");
    EXPECT_EQ(tree.chapters[1].children[0].children[0].number, "1");
    EXPECT_EQ(tree.chapters[1].children[1].number, "2");
}

TEST(TocModelTest, Counts) {
    const TocTree tree = sample_tree();
    EXPECT_EQ(count_nodes(tree), 6u);
    EXPECT_EQ(count_leaves(tree), 4u);
    EXPECT_EQ(max_depth(tree), 3u);

    EXPECT_EQ(count_nodes(TocTree{}), 0u);
    EXPECT_EQ(max_depth(TocTree{}), 0u);
    EXPECT_TRUE(TocTree{}.empty());
}

TEST(TocModelTest, EqualityComparesWholeTree) {
    TocTree a = sample_tree();
    TocTree b = sample_tree();
    EXPECT_EQ(a, b);

    b.chapters[1].children[0].children[0].end_page = 7;
    EXPECT_NE(a, b);
}

TEST(TocModelTest, FillMissingNumbersKeepsExistingOnes) {
    TocTree tree = sample_tree();
    tree.chapters[1].number = "II";
    fill_missing_numbers(tree);

    EXPECT_EQ(tree.chapters[0].number, "1");
    EXPECT_EQ(tree.chapters[1].number, "II");
    EXPECT_EQ(tree.chapters[1].children[0].number, "II.1");
    EXPECT_EQ(tree.chapters[1].children[0].children[0].number, "II.1.1");
    EXPECT_EQ(tree.chapters[2].number, "3");
}
