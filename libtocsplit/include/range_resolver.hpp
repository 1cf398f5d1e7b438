/**
 * @file range_resolver.hpp
 * @brief Turns a TOC with partial page boundaries into concrete page ranges.
 */

#ifndef TOCSPLIT_RANGE_RESOLVER_HPP
#define TOCSPLIT_RANGE_RESOLVER_HPP

#include "toc.hpp"
#include <optional>
#include <vector>

namespace tocsplit {

/**
 * @brief Computes a concrete [start_page, end_page] for every node.
 *
 * @details Applied to each sibling list in order:
 * - a node's end is bounded by the page before its next sibling starts;
 *   an unset end takes that bound, an explicit end is trimmed to it;
 * - the last sibling's unset end inherits the parent's end, or
 *   total_pages at the top level;
 * - ends never exceed the parent's end (or total_pages at the top);
 * - a range ending before it starts collapses to its start page;
 * - children are clipped into their parent's range. Gaps between a
 *   parent's start and its first child are kept.
 *
 * Top-level nodes starting past total_pages are left as the single page
 * range [start, start] so that splitting them fails visibly.
 *
 * The resolver is a pure function: the input is not modified and equal
 * inputs give equal outputs. Resolving an already resolved tree returns
 * it unchanged.
 */
class RangeResolver {
public:
    /**
     * @brief Resolves every node of tree against a document of total_pages pages.
     * @throws EmptyTree if tree has no chapters.
     * @throws InvalidRange if total_pages < 1.
     */
    [[nodiscard]] static TocTree resolve(const TocTree& tree, int total_pages);

private:
    static void resolve_siblings(std::vector<TocNode>& nodes,
                                 std::optional<int> parent_start,
                                 int upper_bound,
                                 int total_pages);
};

} // namespace tocsplit

#endif // TOCSPLIT_RANGE_RESOLVER_HPP
