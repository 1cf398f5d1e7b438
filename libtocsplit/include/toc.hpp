/**
 * @file toc.hpp
 * @brief Table of contents model shared by extraction, resolution and splitting.
 */

#ifndef TOCSPLIT_TOC_HPP
#define TOCSPLIT_TOC_HPP

#include <cstddef>
#include <optional>
#include <string>
#include <vector>

namespace tocsplit {

/**
 * @brief One section of a table of contents.
 *
 * Pages are 1-based and inclusive. An unset end_page means the boundary
 * still has to be inferred by RangeResolver. Children are owned by value
 * and their order is the reading and splitting order.
 */
struct TocNode {
    std::string title;
    std::string number;
    int start_page = 1;
    std::optional<int> end_page;
    std::vector<TocNode> children;

    [[nodiscard]] bool is_leaf() const noexcept { return children.empty(); }

    bool operator==(const TocNode&) const = default;
};

/**
 * @brief Root list of chapters plus the content page offset.
 *
 * content_start_page maps "content page N" to absolute PDF page
 * `content_start_page + N - 1`. It is 1 for trees that already use
 * absolute pages, which is the only form the resolver and splitter accept.
 */
struct TocTree {
    std::vector<TocNode> chapters;
    int content_start_page = 1;

    [[nodiscard]] bool empty() const noexcept { return chapters.empty(); }

    bool operator==(const TocTree&) const = default;
};

/**
 * @brief A single embedded bookmark, flattened in document order.
 */
struct OutlineEntry {
    std::string title;
    int level = 0;       ///< 0 for top-level bookmarks
    int target_page = 1; ///< 1-based page the bookmark points at

    bool operator==(const OutlineEntry&) const = default;
};

/**
 * @brief How section numbers are generated by renumber().
 */
enum class NumberingStyle {
    Dotted,     ///< full index path: "1", "1.1", "1.2", "2"
    SiblingOnly ///< position among siblings only: "1", "1", "2", "2"
};

/**
 * @brief Rewrites every node's number according to style.
 */
void renumber(TocTree& tree, NumberingStyle style = NumberingStyle::Dotted);

/**
 * @brief Gives every node without a number its dotted index path, keeping
 * the numbers already present.
 */
void fill_missing_numbers(TocTree& tree);

/**
 * @brief Number of nodes in the tree, at every depth.
 */
[[nodiscard]] std::size_t count_nodes(const TocTree& tree);

/**
 * @brief Number of nodes without children.
 */
[[nodiscard]] std::size_t count_leaves(const TocTree& tree);

/**
 * @brief Depth of the deepest node (1 for a flat list, 0 for an empty tree).
 */
[[nodiscard]] std::size_t max_depth(const TocTree& tree);

} // namespace tocsplit

#endif // TOCSPLIT_TOC_HPP
