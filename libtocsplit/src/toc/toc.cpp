#include "toc.hpp"
#include <algorithm>

namespace tocsplit {

namespace {

void renumber_nodes(std::vector<TocNode>& nodes, const std::string& prefix, const NumberingStyle style) {
    for (std::size_t i = 0; i < nodes.size(); ++i) {
        const std::string index = std::to_string(i + 1);
        auto& node = nodes[i];
        if (style == NumberingStyle::Dotted && !prefix.empty()) {
            node.number = prefix + "." + index;
        } else {
            node.number = index;
        }
        renumber_nodes(node.children, style == NumberingStyle::Dotted ? node.number : index, style);
    }
}

void fill_nodes(std::vector<TocNode>& nodes, const std::string& prefix) {
    for (std::size_t i = 0; i < nodes.size(); ++i) {
        auto& node = nodes[i];
        if (node.number.empty()) {
            const std::string index = std::to_string(i + 1);
            node.number = prefix.empty() ? index : prefix + "." + index;
        }
        fill_nodes(node.children, node.number);
    }
}

std::size_t count_in(const std::vector<TocNode>& nodes, const bool leaves_only) {
    std::size_t n = 0;
    for (const auto& node : nodes) {
        if (!leaves_only || node.is_leaf()) ++n;
        n += count_in(node.children, leaves_only);
    }
    return n;
}

std::size_t depth_of(const std::vector<TocNode>& nodes) {
    std::size_t deepest = 0;
    for (const auto& node : nodes) {
        deepest = std::max(deepest, depth_of(node.children));
    }
    return nodes.empty() ? 0 : deepest + 1;
}

} // namespace

void renumber(TocTree& tree, const NumberingStyle style) {
    renumber_nodes(tree.chapters, "", style);
}

void fill_missing_numbers(TocTree& tree) {
    fill_nodes(tree.chapters, "");
}

std::size_t count_nodes(const TocTree& tree) {
    return count_in(tree.chapters, false);
}

std::size_t count_leaves(const TocTree& tree) {
    return count_in(tree.chapters, true);
}

std::size_t max_depth(const TocTree& tree) {
    return depth_of(tree.chapters);
}

} // namespace tocsplit
