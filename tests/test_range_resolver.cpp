#include <gtest/gtest.h>
#include "errors.hpp"
#include "range_resolver.hpp"
#include "toc_extractor.hpp"

#include <functional>

using namespace tocsplit;

namespace {

TocNode node(const std::string& title, const int page, std::optional<int> end = std::nullopt,
             std::vector<TocNode> children = {}) {
    TocNode n;
    n.title = title;
    n.number = title;
    n.start_page = page;
    n.end_page = end;
    n.children = std::move(children);
    return n;
}

TocTree scenario_b() {
    return TocExtractor::build_tree({{"Ch1", 0, 1}, {"1.1", 1, 3}, {"Ch2", 0, 10}});
}

// every node within the document, children within their parent,
// siblings in order without overlap
void expect_well_formed(const TocTree& tree, const int total) {
    std::function<void(const std::vector<TocNode>&, const TocNode*)> check =
        [&](const std::vector<TocNode>& nodes, const TocNode* parent) {
            for (std::size_t i = 0; i < nodes.size(); ++i) {
                const TocNode& n = nodes[i];
                ASSERT_TRUE(n.end_page.has_value()) << n.title;
                EXPECT_LE(1, n.start_page) << n.title;
                EXPECT_LE(n.start_page, *n.end_page) << n.title;
                EXPECT_LE(*n.end_page, total) << n.title;
                if (parent) {
                    EXPECT_GE(n.start_page, parent->start_page) << n.title;
                    EXPECT_LE(*n.end_page, *parent->end_page) << n.title;
                }
                if (i + 1 < nodes.size()) {
                    EXPECT_LE(n.start_page, nodes[i + 1].start_page) << n.title;
                    EXPECT_LT(*n.end_page, nodes[i + 1].start_page) << n.title;
                }
                check(n.children, &n);
            }
        };
    check(tree.chapters, nullptr);
}

} // namespace

TEST(RangeResolverTest, ResolvesOutlineTree) {
    const TocTree resolved = RangeResolver::resolve(scenario_b(), 20);

    ASSERT_EQ(resolved.chapters.size(), 2u);
    EXPECT_EQ(resolved.chapters[0].start_page, 1);
    EXPECT_EQ(resolved.chapters[0].end_page, 9);
    ASSERT_EQ(resolved.chapters[0].children.size(), 1u);
    EXPECT_EQ(resolved.chapters[0].children[0].start_page, 3);
    EXPECT_EQ(resolved.chapters[0].children[0].end_page, 9);
    EXPECT_EQ(resolved.chapters[1].start_page, 10);
    EXPECT_EQ(resolved.chapters[1].end_page, 20);
    expect_well_formed(resolved, 20);
}

TEST(RangeResolverTest, ResolvingTwiceChangesNothing) {
    const TocTree once = RangeResolver::resolve(scenario_b(), 20);
    const TocTree twice = RangeResolver::resolve(once, 20);
    EXPECT_EQ(once, twice);
}

TEST(RangeResolverTest, InputTreeIsNotModified) {
    const TocTree tree = scenario_b();
    const TocTree copy = tree;
    static_cast<void>(RangeResolver::resolve(tree, 20));
    EXPECT_EQ(tree, copy);
}

TEST(RangeResolverTest, ExplicitEndIsTrimmedToNextSibling) {
    TocTree tree;
    tree.chapters = {node("A", 1, 12), node("B", 8, 15), node("C", 16)};

    const TocTree resolved = RangeResolver::resolve(tree, 30);
    EXPECT_EQ(resolved.chapters[0].end_page, 7);
    EXPECT_EQ(resolved.chapters[1].end_page, 15);
    EXPECT_EQ(resolved.chapters[2].end_page, 30);
    expect_well_formed(resolved, 30);
}

TEST(RangeResolverTest, EndsAreCappedAtDocumentAndParent) {
    TocTree tree;
    tree.chapters = {node("A", 1, 50, {node("A.1", 2, 40)})};

    const TocTree resolved = RangeResolver::resolve(tree, 10);
    EXPECT_EQ(resolved.chapters[0].end_page, 10);
    EXPECT_EQ(resolved.chapters[0].children[0].end_page, 10);
    expect_well_formed(resolved, 10);
}

TEST(RangeResolverTest, EndBeforeStartCollapsesToStart) {
    TocTree tree;
    tree.chapters = {node("A", 1), node("B", 5, 3), node("C", 5)};

    const TocTree resolved = RangeResolver::resolve(tree, 9);
    EXPECT_EQ(resolved.chapters[0].end_page, 4);
    EXPECT_EQ(resolved.chapters[1].start_page, 5);
    EXPECT_EQ(resolved.chapters[1].end_page, 5);
    EXPECT_EQ(resolved.chapters[2].end_page, 9);
}

TEST(RangeResolverTest, ChildrenAreClippedIntoParent) {
    TocTree tree;
    tree.chapters = {
        node("A", 5, std::nullopt, {node("early", 2), node("late", 30)}),
        node("B", 10),
    };

    const TocTree resolved = RangeResolver::resolve(tree, 20);
    const TocNode& a = resolved.chapters[0];
    EXPECT_EQ(a.end_page, 9);
    EXPECT_EQ(a.children[0].start_page, 5);
    EXPECT_EQ(a.children[0].end_page, 8);
    EXPECT_EQ(a.children[1].start_page, 9);
    EXPECT_EQ(a.children[1].end_page, 9);
    expect_well_formed(resolved, 20);
}

TEST(RangeResolverTest, LastChildInheritsParentEnd) {
    TocTree tree;
    tree.chapters = {node("A", 1, 6, {node("A.1", 2), node("A.2", 4)}), node("B", 12)};

    const TocTree resolved = RangeResolver::resolve(tree, 15);
    EXPECT_EQ(resolved.chapters[0].end_page, 6);
    EXPECT_EQ(resolved.chapters[0].children[0].end_page, 3);
    EXPECT_EQ(resolved.chapters[0].children[1].end_page, 6);
}

TEST(RangeResolverTest, ChapterPastLastPageKeepsDegenerateRange) {
    TocTree tree;
    tree.chapters = {node("A", 1), node("Stale", 30)};

    const TocTree resolved = RangeResolver::resolve(tree, 20);
    EXPECT_EQ(resolved.chapters[0].end_page, 20);
    EXPECT_EQ(resolved.chapters[1].start_page, 30);
    EXPECT_EQ(resolved.chapters[1].end_page, 30);
}

TEST(RangeResolverTest, EmptyTreeIsRejected) {
    EXPECT_THROW(static_cast<void>(RangeResolver::resolve(TocTree{}, 10)), EmptyTree);
}

TEST(RangeResolverTest, DocumentWithoutPagesIsRejected) {
    EXPECT_THROW(static_cast<void>(RangeResolver::resolve(scenario_b(), 0)), InvalidRange);
}

TEST(RangeResolverTest, DeepTreeIsWellFormed) {
    const TocTree tree = TocExtractor::build_tree({
        {"1", 0, 1}, {"1.1", 1, 2}, {"1.1.1", 2, 2}, {"1.1.2", 2, 5}, {"1.2", 1, 9},
        {"2", 0, 15}, {"2.1", 1, 15}, {"3", 0, 40}, {"3.1", 1, 41}, {"3.1.1", 2, 45},
    });
    const TocTree resolved = RangeResolver::resolve(tree, 50);
    expect_well_formed(resolved, 50);
    EXPECT_EQ(resolved.chapters[0].children[0].end_page, 8);
    EXPECT_EQ(resolved.chapters[0].children[0].children[1].end_page, 8);
    EXPECT_EQ(resolved.chapters[2].children[0].children[0].end_page, 50);
}
