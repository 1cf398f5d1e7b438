/**
 * @file split_job.hpp
 * @brief Status record of one asynchronous split request.
 */

#ifndef TOCSPLIT_SPLIT_JOB_HPP
#define TOCSPLIT_SPLIT_JOB_HPP

#include "hierarchical_splitter.hpp"
#include <chrono>
#include <filesystem>
#include <optional>
#include <string>
#include <vector>

namespace tocsplit {

/**
 * @brief Job lifecycle: Queued -> InProgress -> {Completed | Failed}.
 */
enum class JobStatus {
    Queued,
    InProgress,
    Completed,
    Failed
};

[[nodiscard]] std::string job_status_to_string(JobStatus status);

/// Completed and Failed are final.
[[nodiscard]] constexpr bool is_terminal(const JobStatus status) noexcept {
    return status == JobStatus::Completed || status == JobStatus::Failed;
}

struct SplitJob {
    using Clock = std::chrono::system_clock;

    std::string id;
    JobStatus status = JobStatus::Queued;
    std::optional<int> progress;                      ///< 0..100, unset until the worker starts
    std::optional<std::filesystem::path> output_path; ///< archive, or the tree root when archiving is off
    std::optional<std::filesystem::path> output_root; ///< unarchived output tree
    std::optional<std::string> error;                 ///< set only when Failed
    std::string document_name;
    std::vector<SplitOutput> outputs;
    Clock::time_point created_at{};
    Clock::time_point updated_at{};

    bool operator==(const SplitJob&) const = default;
};

} // namespace tocsplit

#endif // TOCSPLIT_SPLIT_JOB_HPP
