#include "toc_extractor.hpp"
#include "errors.hpp"
#include "logger.hpp"
#include <algorithm>
#include <cctype>
#include <filesystem>
#include <utility>

namespace tocsplit {

namespace {

constexpr const char* kTag = "TocExtractor";

std::string trim(const std::string& s) {
    auto not_space = [](const unsigned char c) { return !std::isspace(c); };
    const auto begin = std::find_if(s.begin(), s.end(), not_space);
    const auto end = std::find_if(s.rbegin(), s.rend(), not_space).base();
    return begin < end ? std::string(begin, end) : std::string();
}

} // namespace

TocExtractor::TocExtractor(ExtractorOptions options) : options_(std::move(options)) {}

TocTree TocExtractor::build_tree(const std::vector<OutlineEntry>& entries) {
    TocTree tree;

    // chain[i] is the child list the entry at chain depth i was appended to;
    // levels[i] is that entry's outline level
    std::vector<std::vector<TocNode>*> chain;
    std::vector<int> levels;

    for (const auto& entry : entries) {
        while (!levels.empty() && levels.back() >= entry.level) {
            levels.pop_back();
            chain.pop_back();
        }

        std::vector<TocNode>& siblings = chain.empty() ? tree.chapters : chain.back()->back().children;

        TocNode node;
        node.title = trim(entry.title);
        if (node.title.empty()) node.title = "Untitled";
        node.start_page = std::max(1, entry.target_page);
        siblings.push_back(std::move(node));

        chain.push_back(&siblings);
        levels.push_back(entry.level);
    }

    renumber(tree, NumberingStyle::Dotted);
    return tree;
}

TocTree TocExtractor::fallback_tree(const DocumentHandle& handle) const {
    std::string title = options_.fallback_title;
    if (title.empty()) {
        title = std::filesystem::path(handle.source_name()).stem().string();
    }
    if (title.empty()) {
        title = "Document";
    }

    TocNode chapter;
    chapter.title = std::move(title);
    chapter.number = "1";
    chapter.start_page = 1;
    chapter.end_page = handle.page_count();

    TocTree tree;
    tree.chapters.push_back(std::move(chapter));
    return tree;
}

TocTree TocExtractor::extract(const DocumentHandle& handle) const {
    std::vector<OutlineEntry> entries;
    try {
        entries = handle.read_outline();
    } catch (const CorruptDocument& e) {
        Logger::log(LogLevel::Warning, "Ignoring unreadable outline of " + handle.source_name() + ": " + e.what() +
                    "; using single-chapter fallback", kTag);
        return fallback_tree(handle);
    }
    const auto top_level = static_cast<std::size_t>(
        std::count_if(entries.begin(), entries.end(), [](const OutlineEntry& e) { return e.level == 0; }));

    if (entries.empty() || top_level < options_.min_top_level_entries) {
        Logger::log(LogLevel::Info, "No usable outline in " + handle.source_name() +
                    " (" + std::to_string(top_level) + " top-level bookmarks); using single-chapter fallback", kTag);
        return fallback_tree(handle);
    }

    Logger::log(LogLevel::Info, "Using built-in outline of " + handle.source_name() +
                " (" + std::to_string(entries.size()) + " bookmarks)", kTag);
    return build_tree(entries);
}

} // namespace tocsplit
