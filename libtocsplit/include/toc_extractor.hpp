/**
 * @file toc_extractor.hpp
 * @brief Builds a TocTree from a document's embedded bookmarks.
 */

#ifndef TOCSPLIT_TOC_EXTRACTOR_HPP
#define TOCSPLIT_TOC_EXTRACTOR_HPP

#include "document_handle.hpp"
#include "toc.hpp"
#include <cstddef>
#include <string>
#include <vector>

namespace tocsplit {

struct ExtractorOptions {
    /**
     * @brief An outline with fewer level-0 bookmarks than this is treated as
     * too sparse and replaced by the single-chapter fallback.
     */
    std::size_t min_top_level_entries = 1;

    /**
     * @brief Title of the fallback chapter. When empty the document's file
     * stem is used, or "Document" if that is empty too.
     */
    std::string fallback_title;
};

/**
 * @brief Reads the outline of a document and shapes it into a TOC.
 *
 * @details Bookmarks are nested by level: an entry becomes a child of the
 * closest preceding entry with a smaller level. Numbers are dotted
 * sibling-index paths. Outline entries only carry a start page, so every
 * end_page is left unset for RangeResolver.
 *
 * extract() never fails on a readable document: without a usable outline,
 * or with one qpdf cannot walk, it returns one chapter spanning the whole
 * document.
 */
class TocExtractor {
public:
    explicit TocExtractor(ExtractorOptions options = {});

    /**
     * @brief Extracts the TOC of an opened document.
     * @throws DocumentClosed if handle has been closed.
     */
    [[nodiscard]] TocTree extract(const DocumentHandle& handle) const;

    /**
     * @brief Nests a flat bookmark list into chapters. Returns an empty tree
     * for an empty list.
     */
    [[nodiscard]] static TocTree build_tree(const std::vector<OutlineEntry>& entries);

    /**
     * @brief The single-chapter TOC used when the outline is unusable.
     */
    [[nodiscard]] TocTree fallback_tree(const DocumentHandle& handle) const;

private:
    ExtractorOptions options_;
};

} // namespace tocsplit

#endif // TOCSPLIT_TOC_EXTRACTOR_HPP
