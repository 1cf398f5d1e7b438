/**
 * @file events.hpp
 * @brief Job lifecycle events published by SplitJobEngine.
 */

#ifndef TOCSPLIT_EVENTS_HPP
#define TOCSPLIT_EVENTS_HPP

#include <filesystem>
#include <string>

namespace tocsplit {

/**
 * @brief Plain data carriers used with EventBus.
 *
 * Every event names the job it belongs to. They are published from the
 * job's worker thread, except JobQueuedEvent which is published by
 * submit() on the caller's thread.
 */

/**
 * @brief Emitted when a job has been created and scheduled.
 */
struct JobQueuedEvent {
    std::string job_id;
    std::string document_name; ///< Source name of the document being split
};

/**
 * @brief Emitted when a worker picks the job up.
 */
struct JobStartedEvent {
    std::string job_id;
    std::size_t total_sections = 0; ///< Number of TOC nodes that will be written
};

/**
 * @brief Emitted whenever the job's progress value changes.
 */
struct JobProgressEvent {
    std::string job_id;
    int progress = 0; ///< 0..100, already scaled for the archiving headroom
};

/**
 * @brief Emitted after one section file has been written to disk.
 */
struct SectionWrittenEvent {
    std::string job_id;
    std::filesystem::path path; ///< Absolute path of the written PDF
    std::string number;
    std::string title;
    int start_page = 0;
    int end_page = 0;
};

/**
 * @brief Emitted when a job reaches Completed.
 */
struct JobCompletedEvent {
    std::string job_id;
    std::filesystem::path output_path; ///< Archive (or tree root if archiving is off)
    std::size_t files_written = 0;
};

/**
 * @brief Emitted when a job reaches Failed.
 */
struct JobFailedEvent {
    std::string job_id;
    std::string error_message;
};

} // namespace tocsplit

#endif // TOCSPLIT_EVENTS_HPP
