/**
 * @file tocsplit.hpp
 * @brief Public API for the tocsplit library.
 */

#ifndef TOCSPLIT_HPP
#define TOCSPLIT_HPP

#include "archiver.hpp"
#include "document_handle.hpp"
#include "split_job.hpp"
#include "toc.hpp"

#include <cstddef>
#include <filesystem>
#include <memory>
#include <optional>
#include <string>
#include <vector>

namespace tocsplit {

/**
 * @brief Interface for receiving job and log events.
 *
 * Job callbacks run on engine worker threads.
 */
struct TocsplitObserver {
    virtual ~TocsplitObserver() = default;

    virtual void onJobQueued(const std::string& job_id, const std::string& document_name) {}

    virtual void onJobProgress(const std::string& job_id, int progress) {}

    virtual void onSectionWritten(const std::string& job_id,
                                  const std::filesystem::path& path,
                                  int start_page,
                                  int end_page) {}

    virtual void onJobCompleted(const std::string& job_id, const std::filesystem::path& output_path) {}

    virtual void onJobFailed(const std::string& job_id, const std::string& error) {}

    virtual void onLog(int level, const std::string& msg, const std::string& tag) {}
};

/**
 * @brief Main interface for the tocsplit library.
 *
 * @details Extracts tables of contents, keeps caller-edited TOCs and
 * splits documents through a background job engine. The engine is
 * created on the first submission; engine settings changed afterwards
 * are ignored with a warning. Uses PIMPL idiom to hide internal
 * dependencies.
 */
class Tocsplit {
public:
    Tocsplit();
    ~Tocsplit();

    Tocsplit(const Tocsplit&) = delete;
    Tocsplit& operator=(const Tocsplit&) = delete;
    Tocsplit(Tocsplit&&) noexcept;
    Tocsplit& operator=(Tocsplit&&) noexcept;

    // --- Configuration ---

    /**
     * @brief Directory receiving one sub-directory per job.
     * Default: <system temp>/tocsplit.
     */
    Tocsplit& workDirectory(const std::filesystem::path& dir);

    /**
     * @brief Number of jobs that may run at the same time.
     * Default: hardware concurrency.
     */
    Tocsplit& threads(unsigned val);

    /**
     * @brief Enable or disable packing each job's output into an archive.
     * Default: true.
     */
    Tocsplit& archive(bool val);

    /**
     * @brief Archive container for job output.
     * Default: ArchiveFormat::Zip.
     */
    Tocsplit& archiveFormat(ArchiveFormat format);

    /**
     * @brief Title of the single chapter used for documents without bookmarks.
     * Default: the document's file stem.
     */
    Tocsplit& fallbackTitle(const std::string& title);

    /**
     * @brief Minimum number of top-level bookmarks for an outline to be used.
     * Default: 1.
     */
    Tocsplit& minTopLevelEntries(std::size_t val);

    /**
     * @brief Numbering applied to extracted TOCs.
     * Default: NumberingStyle::Dotted.
     */
    Tocsplit& numbering(NumberingStyle style);

    // --- Observability ---

    /**
     * @brief Sets the observer for job and log events.
     * The caller retains ownership of the observer; pass nullptr to detach.
     */
    void setObserver(TocsplitObserver* observer);

    // --- TOC ---

    /**
     * @brief Extracts the TOC of a document, falling back to a single chapter.
     * @throws DocumentNotFound, CorruptDocument
     */
    [[nodiscard]] TocTree extract_toc(const std::filesystem::path& document) const;

    /**
     * @brief Extracts the TOC of an in-memory document.
     * @throws CorruptDocument
     */
    [[nodiscard]] TocTree extract_toc(std::vector<unsigned char> bytes, const std::string& name) const;

    /**
     * @brief Stores an edited TOC for a document; later submissions use it
     * when no explicit TOC is passed.
     */
    void save_toc(const std::filesystem::path& document, TocTree tree);

    [[nodiscard]] std::optional<TocTree> saved_toc(const std::filesystem::path& document) const;

    /// @return true if a saved TOC was removed.
    bool discard_saved_toc(const std::filesystem::path& document);

    [[nodiscard]] DocumentInfo document_info(const std::filesystem::path& document) const;

    // --- Jobs ---

    /**
     * @brief Opens the document and queues a split job.
     *
     * @details The TOC used is, in order: toc, the saved edited TOC,
     * a freshly extracted one. Content-relative pages are translated to
     * absolute pages before the job sees the tree.
     *
     * @return Job id.
     * @throws DocumentNotFound, CorruptDocument before any job exists.
     * @throws EmptyTree if the chosen TOC has no chapters.
     */
    std::string submit_split(const std::filesystem::path& document,
                             const std::optional<TocTree>& toc = std::nullopt);

    /**
     * @brief Queues a split job for an in-memory document.
     */
    std::string submit_split(std::vector<unsigned char> bytes,
                             const std::string& name,
                             const std::optional<TocTree>& toc = std::nullopt);

    /**
     * @brief Snapshot of a job.
     * @throws JobNotFound
     */
    [[nodiscard]] SplitJob poll_job(const std::string& job_id) const;

    /**
     * @brief Output of a completed job.
     * @throws JobNotFound, JobNotReady
     */
    [[nodiscard]] std::filesystem::path fetch_output(const std::string& job_id) const;

    /**
     * @brief Ids of every job submitted through this instance, oldest first.
     */
    [[nodiscard]] std::vector<std::string> job_ids() const;

    /**
     * @brief Blocks until every submitted job is Completed or Failed.
     */
    void wait_idle();

private:
    struct Impl;
    std::unique_ptr<Impl> impl_;
};

} // namespace tocsplit

#endif // TOCSPLIT_HPP
