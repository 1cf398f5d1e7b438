/**
 * @file toc_json.hpp
 * @brief JSON wire shape of a TocTree, shared by extraction results and
 * caller-edited TOCs.
 *
 * @code{.json}
 * { "chapters": [
 *     { "title": "Intro", "number": "1", "page": 1, "end_page": 9,
 *       "subtopics": [ ... same shape ... ] } ],
 *   "content_start_page": 1 }
 * @endcode
 *
 * "end_page" is omitted (or null) for unresolved nodes, "number" and
 * "subtopics" are optional on input, and "content_start_page" is only
 * written when it differs from 1.
 */

#ifndef TOCSPLIT_TOC_JSON_HPP
#define TOCSPLIT_TOC_JSON_HPP

#include "toc.hpp"
#include <filesystem>
#include <nlohmann/json.hpp>

namespace tocsplit {

[[nodiscard]] nlohmann::json toc_to_json(const TocTree& tree);

/**
 * @brief Decodes the wire shape. Missing numbers are filled with dotted
 * sibling-index paths.
 * @throws TocFormatError if the document does not have the expected shape,
 * a page is not a positive integer, or end_page < page.
 */
[[nodiscard]] TocTree toc_from_json(const nlohmann::json& json);

/**
 * @brief Parses and decodes a JSON file.
 * @throws TocFormatError on unreadable files, invalid JSON or a bad shape.
 */
[[nodiscard]] TocTree load_toc_file(const std::filesystem::path& path);

/**
 * @brief Writes tree as pretty-printed JSON.
 * @throws std::runtime_error if the file cannot be written.
 */
void save_toc_file(const TocTree& tree, const std::filesystem::path& path);

/**
 * @brief Converts content-relative pages to absolute PDF pages.
 *
 * Applies `absolute = content_start_page + relative - 1` to every start
 * and end page and resets content_start_page to 1. A tree that already
 * uses absolute pages is returned unchanged.
 */
[[nodiscard]] TocTree to_absolute_pages(const TocTree& tree);

} // namespace tocsplit

#endif // TOCSPLIT_TOC_JSON_HPP
