/**
 * @file hierarchical_splitter.hpp
 * @brief Writes one PDF per TOC node into a directory tree mirroring the TOC.
 */

#ifndef TOCSPLIT_HIERARCHICAL_SPLITTER_HPP
#define TOCSPLIT_HIERARCHICAL_SPLITTER_HPP

#include "document_handle.hpp"
#include "toc.hpp"
#include <cstddef>
#include <filesystem>
#include <functional>
#include <string>
#include <vector>

namespace tocsplit {

/**
 * @brief One file produced by a split.
 */
struct SplitOutput {
    std::filesystem::path relative_path; ///< Relative to the split's output root
    std::string number;
    std::string title;
    int start_page = 0;
    int end_page = 0;
    bool whole_chapter = false;          ///< True for the full-range file of a node with children
    std::size_t depth = 0;               ///< 0 for top-level chapters

    [[nodiscard]] int page_span() const noexcept { return end_page - start_page + 1; }

    bool operator==(const SplitOutput&) const = default;
};

/**
 * @brief Splits a document along a resolved TOC.
 *
 * @details For the n-th node of a sibling list whose index path is P
 * ("1", "1.2", ...), the name stem is "P_<sanitized title>":
 * - a node without children becomes the file "<stem>.pdf";
 * - a node with children becomes the directory "<stem>/" holding its
 *   own full-range "<stem>.pdf" plus one entry per child, recursively.
 *
 * The index path prefix keeps sibling names unique even when titles
 * collide. Output is never rolled back: a failure leaves the files
 * already written in place.
 */
class HierarchicalSplitter {
public:
    ///< Receives floor(100 * files_written / total_files) after each file.
    using ProgressCallback = std::function<void(int percent)>;
    ///< Receives every written file and its absolute path.
    using SectionCallback = std::function<void(const SplitOutput& output, const std::filesystem::path& path)>;

    /**
     * @brief Writes every node of resolved_tree below output_root.
     *
     * @param handle Open source document.
     * @param resolved_tree Tree whose nodes all have an end_page (see RangeResolver).
     * @param output_root Directory to write into; created if missing.
     * @param progress Optional progress callback.
     * @param on_section Optional per-file callback.
     * @return One entry per written file, in writing order.
     * @throws SplitFailure naming the node whose extraction or write failed.
     */
    std::vector<SplitOutput> split(const DocumentHandle& handle,
                                   const TocTree& resolved_tree,
                                   const std::filesystem::path& output_root,
                                   const ProgressCallback& progress = {},
                                   const SectionCallback& on_section = {}) const;

    /**
     * @brief Name stem of a node: index path, '_', sanitized title.
     */
    [[nodiscard]] static std::string entry_stem(const std::string& index_path, const std::string& title);

private:
    struct Run;

    void split_nodes(Run& run,
                     const std::vector<TocNode>& nodes,
                     const std::filesystem::path& dir,
                     const std::string& parent_index,
                     std::size_t depth) const;

    void write_node(Run& run,
                    const TocNode& node,
                    const std::filesystem::path& file,
                    bool whole_chapter,
                    std::size_t depth) const;
};

} // namespace tocsplit

#endif // TOCSPLIT_HIERARCHICAL_SPLITTER_HPP
