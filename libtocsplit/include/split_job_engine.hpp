/**
 * @file split_job_engine.hpp
 * @brief Runs resolve, split and archive as background jobs.
 */

#ifndef TOCSPLIT_SPLIT_JOB_ENGINE_HPP
#define TOCSPLIT_SPLIT_JOB_ENGINE_HPP

#include "archiver.hpp"
#include "document_handle.hpp"
#include "event_bus.hpp"
#include "job_store.hpp"
#include "thread_pool.hpp"
#include "toc.hpp"
#include <filesystem>
#include <string>

namespace tocsplit {

struct EngineOptions {
    std::filesystem::path work_dir = std::filesystem::temp_directory_path() / "tocsplit";
    unsigned max_concurrent_jobs = 0;  ///< 0 means hardware concurrency
    bool archive = true;               ///< false leaves the output as a plain directory tree
    ArchiveFormat archive_format = ArchiveFormat::Zip;
};

/**
 * @brief Asynchronous split pipeline over a JobStore.
 *
 * @details Every submitted job becomes one ThreadPool task owning its
 * DocumentHandle. The task is the only writer of its job's entry after
 * submit() returns; callers observe it by polling get_status(). Jobs
 * cannot be cancelled. Output of job <id> lands in
 * work_dir/<id>/<document name>/, archived as work_dir/<id>/<id>.zip.
 *
 * Lifecycle events are published on the EventBus from worker threads.
 */
class SplitJobEngine {
public:
    /**
     * @param store Job table, must outlive the engine.
     * @param bus Event bus, must outlive the engine.
     * @param options Output location, concurrency and packaging.
     */
    SplitJobEngine(JobStore& store, EventBus& bus, EngineOptions options = {});

    /// Waits for every submitted job to reach a terminal state.
    ~SplitJobEngine();

    SplitJobEngine(const SplitJobEngine&) = delete;
    SplitJobEngine& operator=(const SplitJobEngine&) = delete;

    /**
     * @brief Queues a split of handle along toc and returns at once.
     *
     * @param handle Open document; ownership moves to the job.
     * @param toc Tree with absolute page numbers, resolved or not.
     * @return Fresh UUID of the Queued job.
     * @throws DocumentClosed if handle is not open.
     */
    std::string submit(DocumentHandle handle, TocTree toc);

    /**
     * @brief Snapshot of a job.
     * @throws JobNotFound if the id is unknown.
     */
    [[nodiscard]] SplitJob get_status(const std::string& id) const;

    /**
     * @brief Output location of a Completed job.
     * @throws JobNotFound if the id is unknown.
     * @throws JobNotReady unless the job is Completed.
     */
    [[nodiscard]] std::filesystem::path get_output(const std::string& id) const;

    /// Blocks until no submitted job is Queued or InProgress.
    void wait_idle();

    [[nodiscard]] const EngineOptions& options() const noexcept { return options_; }

private:
    void run_job(const std::string& id, DocumentHandle& handle, const TocTree& toc);
    void fail_job(const std::string& id, const std::string& message);
    void report_progress(const std::string& id, int progress);

    JobStore& store_;
    EventBus& bus_;
    EngineOptions options_;
    ThreadPool pool_; ///< declared last so it is joined before the members above go away
};

} // namespace tocsplit

#endif // TOCSPLIT_SPLIT_JOB_ENGINE_HPP
