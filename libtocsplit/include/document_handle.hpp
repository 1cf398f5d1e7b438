/**
 * @file document_handle.hpp
 * @brief Owns one opened PDF document and exposes page-range extraction.
 */

#ifndef TOCSPLIT_DOCUMENT_HANDLE_HPP
#define TOCSPLIT_DOCUMENT_HANDLE_HPP

#include "toc.hpp"
#include <cstdint>
#include <filesystem>
#include <memory>
#include <string>
#include <vector>

namespace tocsplit {

/**
 * @brief What the document's security handler lets a user-password reader do.
 *
 * Unencrypted documents allow everything.
 */
struct DocumentPermissions {
    bool print = true;    ///< High resolution printing
    bool copy = true;     ///< Text and image extraction
    bool modify = true;   ///< Every kind of modification
    bool annotate = true; ///< Comments and form fields

    bool operator==(const DocumentPermissions&) const = default;
};

/**
 * @brief Descriptive metadata read from the document's /Info dictionary.
 *
 * Keys that are absent from the document are left empty.
 */
struct DocumentInfo {
    std::string source_name;       ///< File name (or caller supplied name for in-memory documents)
    std::string title;
    std::string author;
    std::string subject;
    std::string keywords;
    std::string creator;
    std::string producer;
    std::string creation_date;     ///< Raw PDF date string, e.g. "D:20240101120000Z"
    std::string modification_date;
    std::string pdf_version;
    int page_count = 0;
    std::uintmax_t file_size = 0;
    bool encrypted = false;
    DocumentPermissions permissions;
};

/**
 * @brief Wraps exactly one opened PDF document, parsed with qpdf.
 *
 * @details The handle is move-only and closes itself on destruction, so
 * a scope that acquires one releases it on every exit path. All
 * operations are serialized internally: concurrent read-only calls on the
 * same handle are safe, although each split job opens its own handle.
 * Every operation except close(), is_open() and source_name() throws
 * DocumentClosed once the handle has been closed.
 */
class DocumentHandle {
public:
    /**
     * @brief Opens a PDF file.
     * @throws DocumentNotFound if path is not an existing regular file.
     * @throws CorruptDocument if the file is not a parseable PDF or has no pages.
     */
    static DocumentHandle open(const std::filesystem::path& path);

    /**
     * @brief Opens a PDF held in memory. The handle keeps its own copy of the bytes.
     * @param bytes Complete PDF byte stream.
     * @param name Name used in log messages and as the document's source name.
     * @throws CorruptDocument if the bytes are not a parseable PDF or have no pages.
     */
    static DocumentHandle open(std::vector<unsigned char> bytes, std::string name = "memory.pdf");

    DocumentHandle(DocumentHandle&&) noexcept;
    DocumentHandle& operator=(DocumentHandle&&) noexcept;
    DocumentHandle(const DocumentHandle&) = delete;
    DocumentHandle& operator=(const DocumentHandle&) = delete;
    ~DocumentHandle();

    [[nodiscard]] int page_count() const;

    /**
     * @brief Builds a standalone PDF holding pages [start, end].
     *
     * The page objects are copied together with every resource they
     * reference (fonts, images, forms), so the result renders on its own.
     * Bookmarks are not carried over.
     *
     * @param start First page, 1-based, inclusive.
     * @param end Last page, 1-based, inclusive.
     * @return The serialized PDF.
     * @throws InvalidRange unless 1 <= start <= end <= page_count().
     */
    [[nodiscard]] std::vector<unsigned char> extract_pages(int start, int end) const;

    /**
     * @brief Same document as extract_pages(), written straight to out_path.
     */
    void write_pages(int start, int end, const std::filesystem::path& out_path) const;

    /**
     * @brief Returns the embedded bookmarks in document order.
     *
     * A depth-first walk of the outline tree; level 0 is the top. A
     * bookmark whose destination does not resolve to a page of this
     * document takes the page of the preceding bookmark (page 1 for the
     * first one). Empty if the document has no outline.
     *
     * @throws CorruptDocument if qpdf gives up on a damaged outline tree.
     */
    [[nodiscard]] std::vector<OutlineEntry> read_outline() const;

    [[nodiscard]] DocumentInfo info() const;

    [[nodiscard]] const std::string& source_name() const noexcept { return source_name_; }

    [[nodiscard]] bool is_open() const noexcept;

    /**
     * @brief Releases the parsed document. Safe to call more than once.
     */
    void close() noexcept;

private:
    struct Impl;

    DocumentHandle(std::unique_ptr<Impl> impl, std::string source_name);

    Impl& checked_impl() const;

    std::unique_ptr<Impl> impl_;
    std::string source_name_;
};

} // namespace tocsplit

#endif // TOCSPLIT_DOCUMENT_HANDLE_HPP
