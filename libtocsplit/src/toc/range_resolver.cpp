#include "range_resolver.hpp"
#include "errors.hpp"
#include "logger.hpp"
#include <algorithm>
#include <string>

namespace tocsplit {

TocTree RangeResolver::resolve(const TocTree& tree, const int total_pages) {
    if (tree.chapters.empty()) {
        throw EmptyTree();
    }
    if (total_pages < 1) {
        throw InvalidRange("document must have at least one page, got " + std::to_string(total_pages));
    }

    TocTree resolved = tree;
    resolve_siblings(resolved.chapters, std::nullopt, total_pages, total_pages);
    return resolved;
}

void RangeResolver::resolve_siblings(std::vector<TocNode>& nodes,
                                     const std::optional<int> parent_start,
                                     const int upper_bound,
                                     const int total_pages) {
    // children are first pulled inside their parent so that sibling bounds
    // below are computed from the clipped starts
    if (parent_start) {
        for (auto& node : nodes) {
            node.start_page = std::clamp(node.start_page, *parent_start, upper_bound);
        }
    } else {
        for (auto& node : nodes) {
            node.start_page = std::max(1, node.start_page);
        }
    }

    for (std::size_t i = 0; i < nodes.size(); ++i) {
        TocNode& node = nodes[i];
        const bool is_last = i + 1 == nodes.size();

        int bound = upper_bound;
        if (!is_last) {
            bound = std::min(bound, nodes[i + 1].start_page - 1);
        }

        int end = node.end_page.value_or(bound);
        end = std::min(end, bound);

        if (end < node.start_page) {
            if (node.start_page > total_pages) {
                Logger::log(LogLevel::Warning, "Section " + node.number + " '" + node.title + "' starts at page " +
                            std::to_string(node.start_page) + ", past the last page " + std::to_string(total_pages),
                            "RangeResolver");
            }
            end = node.start_page;
        }
        node.end_page = end;

        if (!node.children.empty()) {
            resolve_siblings(node.children, node.start_page, end, total_pages);
        }
    }
}

} // namespace tocsplit
